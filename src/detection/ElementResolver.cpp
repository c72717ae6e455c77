#include "detection/ElementResolver.h"

#include <QRegularExpression>
#include <limits>

namespace Hawk {

namespace {

qint64 squaredDistance(const QPoint& a, const QPoint& b)
{
    const qint64 dx = a.x() - b.x();
    const qint64 dy = a.y() - b.y();
    return dx * dx + dy * dy;
}

} // namespace

QStringList ElementResolver::tokenize(const QString& target)
{
    static const QRegularExpression separators(QStringLiteral("[^a-z0-9]+"));
    const QStringList parts = target.toLower().split(separators, Qt::SkipEmptyParts);

    QStringList tokens;
    for (const QString& part : parts) {
        if (part == QLatin1String("elm")) {
            continue;
        }
        tokens.append(part == QLatin1String("btn") ? QStringLiteral("button") : part);
    }
    return tokens;
}

int ElementResolver::score(const Element& element, const QStringList& tokens)
{
    const QString text = element.text.toLower();
    const QString role = element.role.toLower();
    const QStringList idTokens = tokenize(element.id);

    int total = 0;
    for (const QString& token : tokens) {
        if (!text.isEmpty() && text.contains(token)) {
            total += 2;
        } else if (token == role) {
            total += 1;
        } else if (idTokens.contains(token)) {
            total += 1;
        }
    }
    return total;
}

std::optional<Element> ElementResolver::resolve(const ElementGraph& graph,
                                                const QString& target,
                                                const BoundingBox* hint)
{
    const QString trimmed = target.trimmed();
    if (trimmed.isEmpty() || graph.isEmpty()) {
        return std::nullopt;
    }

    if (const Element* exact = graph.findById(trimmed)) {
        return *exact;
    }

    const QStringList tokens = tokenize(trimmed);
    if (tokens.isEmpty()) {
        return std::nullopt;
    }

    int bestIndex = -1;
    int bestScore = 0;
    qint64 bestDistance = std::numeric_limits<qint64>::max();
    for (int i = 0; i < graph.elements.size(); ++i) {
        const Element& element = graph.elements.at(i);
        const int elementScore = score(element, tokens);
        if (elementScore <= 0) {
            continue;
        }

        const qint64 distance = hint
            ? squaredDistance(element.bbox.center(), hint->center())
            : 0;
        // Elements are in reading order, so the first of equals wins.
        if (elementScore > bestScore
            || (elementScore == bestScore && distance < bestDistance)) {
            bestIndex = i;
            bestScore = elementScore;
            bestDistance = distance;
        }
    }

    if (bestIndex < 0) {
        return std::nullopt;
    }
    return graph.elements.at(bestIndex);
}

} // namespace Hawk
