#include "utils/IdUtils.h"

#include <QRandomGenerator>
#include <QRegularExpression>

namespace Hawk {
namespace IdUtils {

QString randomHex(int length)
{
    QString hex;
    hex.reserve(length + 8);
    while (hex.size() < length) {
        hex += QStringLiteral("%1").arg(QRandomGenerator::global()->generate(), 8, 16, QLatin1Char('0'));
    }
    hex.truncate(length);
    return hex;
}

QString newSessionId(const QDate& date)
{
    return QStringLiteral("hawk-%1-%2").arg(date.toString(QStringLiteral("yyyyMMdd")), randomHex(6));
}

QString newPlanId()
{
    return QStringLiteral("tp_") + randomHex(8);
}

QString newTraceId()
{
    return QStringLiteral("trace_") + randomHex(32);
}

bool isSessionId(const QString& id)
{
    static const QRegularExpression pattern(QStringLiteral("^hawk-\\d{8}-[0-9a-f]{6}$"));
    return pattern.match(id).hasMatch();
}

} // namespace IdUtils
} // namespace Hawk
