#include "settings/SessionSettingsManager.h"
#include "settings/Settings.h"

#include <QtGlobal>

SessionSettingsManager& SessionSettingsManager::instance()
{
    static SessionSettingsManager instance;
    return instance;
}

int SessionSettingsManager::maxRetries() const
{
    auto settings = Hawk::getSettings();
    const int retries = settings.value(kSettingsKeyMaxRetries, kDefaultMaxRetries).toInt();
    return retries > 0 ? retries : kDefaultMaxRetries;
}

void SessionSettingsManager::setMaxRetries(int retries)
{
    auto settings = Hawk::getSettings();
    settings.setValue(kSettingsKeyMaxRetries, qMax(1, retries));
}

int SessionSettingsManager::retryBackoffMs() const
{
    auto settings = Hawk::getSettings();
    return qMax(0, settings.value(kSettingsKeyRetryBackoffMs, kDefaultRetryBackoffMs).toInt());
}

void SessionSettingsManager::setRetryBackoffMs(int backoffMs)
{
    auto settings = Hawk::getSettings();
    settings.setValue(kSettingsKeyRetryBackoffMs, qMax(0, backoffMs));
}

int SessionSettingsManager::fpsTarget() const
{
    auto settings = Hawk::getSettings();
    const int fps = settings.value(kSettingsKeyFpsTarget, kDefaultFpsTarget).toInt();
    return fps > 0 ? fps : kDefaultFpsTarget;
}

void SessionSettingsManager::setFpsTarget(int fps)
{
    auto settings = Hawk::getSettings();
    settings.setValue(kSettingsKeyFpsTarget, qBound(1, fps, 240));
}

int SessionSettingsManager::execTimeoutMs() const
{
    auto settings = Hawk::getSettings();
    const int timeoutMs = settings.value(kSettingsKeyExecTimeoutMs, kDefaultExecTimeoutMs).toInt();
    return timeoutMs > 0 ? timeoutMs : kDefaultExecTimeoutMs;
}

void SessionSettingsManager::setExecTimeoutMs(int timeoutMs)
{
    auto settings = Hawk::getSettings();
    settings.setValue(kSettingsKeyExecTimeoutMs, qMax(1, timeoutMs));
}

QString SessionSettingsManager::platform() const
{
    auto settings = Hawk::getSettings();
    return settings.value(kSettingsKeyPlatform, QString::fromLatin1(kDefaultPlatform)).toString();
}

void SessionSettingsManager::setPlatform(const QString& platform)
{
    auto settings = Hawk::getSettings();
    settings.setValue(kSettingsKeyPlatform, platform.trimmed().toLower());
}

QString SessionSettingsManager::detector() const
{
    auto settings = Hawk::getSettings();
    const QString name = settings.value(kSettingsKeyDetector).toString().trimmed().toLower();
    if (name == QLatin1String("layout") || name == QLatin1String("contour")) {
        return name;
    }
    return QString::fromLatin1(kDefaultDetector);
}

void SessionSettingsManager::setDetector(const QString& detector)
{
    auto settings = Hawk::getSettings();
    settings.setValue(kSettingsKeyDetector, detector.trimmed().toLower());
}
