#ifndef IDUTILS_H
#define IDUTILS_H

#include <QDate>
#include <QString>

namespace Hawk {
namespace IdUtils {

// Lower-case hex string of the requested length from the global generator.
QString randomHex(int length);

// hawk-YYYYMMDD-xxxxxx
QString newSessionId(const QDate& date = QDate::currentDate());

// tp_xxxxxxxx
QString newPlanId();

// trace_<32 hex>
QString newTraceId();

bool isSessionId(const QString& id);

} // namespace IdUtils
} // namespace Hawk

#endif // IDUTILS_H
