#include "detection/ElementTypes.h"

#include <QJsonArray>

namespace Hawk {

bool BoundingBox::contains(const BoundingBox& other) const
{
    return other.x1 >= x1 && other.y1 >= y1 && other.x2 <= x2 && other.y2 <= y2;
}

BoundingBox BoundingBox::fromRect(const QRect& rect)
{
    BoundingBox box;
    box.x1 = rect.x();
    box.y1 = rect.y();
    box.x2 = rect.x() + rect.width();
    box.y2 = rect.y() + rect.height();
    return box;
}

QStringList elementRoles()
{
    static const QStringList roles = {
        QStringLiteral("button"), QStringLiteral("input"), QStringLiteral("text"),
        QStringLiteral("link"), QStringLiteral("menu"), QStringLiteral("checkbox"),
        QStringLiteral("radio"), QStringLiteral("dropdown"), QStringLiteral("image"),
        QStringLiteral("container")
    };
    return roles;
}

bool isElementRole(const QString& role)
{
    return elementRoles().contains(role);
}

QJsonObject Element::toJson() const
{
    QJsonObject json;
    json["id"] = id;
    json["bbox"] = QJsonArray{bbox.x1, bbox.y1, bbox.x2, bbox.y2};
    json["text"] = text;
    json["role"] = role;
    return json;
}

const Element* ElementGraph::findById(const QString& id) const
{
    for (const Element& element : elements) {
        if (element.id == id) {
            return &element;
        }
    }
    return nullptr;
}

QVector<Element> ElementGraph::findByRole(const QString& role) const
{
    QVector<Element> matches;
    for (const Element& element : elements) {
        if (element.role.compare(role, Qt::CaseInsensitive) == 0) {
            matches.append(element);
        }
    }
    return matches;
}

QVector<Element> ElementGraph::findByText(const QString& text) const
{
    QVector<Element> matches;
    if (text.isEmpty()) {
        return matches;
    }
    for (const Element& element : elements) {
        if (element.text.contains(text, Qt::CaseInsensitive)) {
            matches.append(element);
        }
    }
    return matches;
}

QJsonObject ElementGraph::toJson() const
{
    QJsonArray elementArray;
    for (const Element& element : elements) {
        elementArray.append(element.toJson());
    }

    QJsonArray relationshipArray;
    for (const ElementRelationship& relationship : relationships) {
        relationshipArray.append(QJsonArray{relationship.sourceId, relationship.relation,
                                            relationship.targetId});
    }

    QJsonObject json;
    json["elements"] = elementArray;
    json["relationships"] = relationshipArray;
    return json;
}

} // namespace Hawk
