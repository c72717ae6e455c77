#ifndef SETTINGS_H
#define SETTINGS_H

#include <QByteArray>
#include <QSettings>
#include <QString>
#include "version.h"

namespace Hawk {

inline constexpr const char* kOrganizationName = "Hawk";
inline constexpr const char* kApplicationName = HAWK_APP_NAME;

inline QSettings getSettings()
{
    return QSettings(kOrganizationName, kApplicationName);
}

// Environment variables win over the stored value. Used for secrets and
// thresholds that deployments set outside the settings store.
inline QString environmentOverride(const char* variable, const QString& fallback)
{
    const QByteArray value = qgetenv(variable);
    if (value.isEmpty()) {
        return fallback;
    }
    return QString::fromLocal8Bit(value);
}

} // namespace Hawk

#endif // SETTINGS_H
