#include "settings/SandboxSettingsManager.h"
#include "settings/Settings.h"

#include <QtGlobal>

SandboxSettingsManager& SandboxSettingsManager::instance()
{
    static SandboxSettingsManager instance;
    return instance;
}

bool SandboxSettingsManager::isSandboxEnabled() const
{
    auto settings = Hawk::getSettings();
    return settings.value(kSettingsKeySandboxEnabled, kDefaultSandboxEnabled).toBool();
}

void SandboxSettingsManager::setSandboxEnabled(bool enabled)
{
    auto settings = Hawk::getSettings();
    settings.setValue(kSettingsKeySandboxEnabled, enabled);
}

bool SandboxSettingsManager::preferRemoteVm() const
{
    auto settings = Hawk::getSettings();
    return settings.value(kSettingsKeyPreferRemoteVm, kDefaultPreferRemoteVm).toBool();
}

void SandboxSettingsManager::setPreferRemoteVm(bool prefer)
{
    auto settings = Hawk::getSettings();
    settings.setValue(kSettingsKeyPreferRemoteVm, prefer);
}

bool SandboxSettingsManager::allowUnsandboxedFallback() const
{
    auto settings = Hawk::getSettings();
    return settings.value(kSettingsKeyAllowUnsandboxed, kDefaultAllowUnsandboxedFallback).toBool();
}

void SandboxSettingsManager::setAllowUnsandboxedFallback(bool allow)
{
    auto settings = Hawk::getSettings();
    settings.setValue(kSettingsKeyAllowUnsandboxed, allow);
}

QString SandboxSettingsManager::remoteVmEndpoint() const
{
    auto settings = Hawk::getSettings();
    return settings.value(kSettingsKeyRemoteVmEndpoint,
                          QString::fromLatin1(kDefaultRemoteVmEndpoint)).toString();
}

void SandboxSettingsManager::setRemoteVmEndpoint(const QString& endpoint)
{
    auto settings = Hawk::getSettings();
    settings.setValue(kSettingsKeyRemoteVmEndpoint, endpoint.trimmed());
}

QString SandboxSettingsManager::remoteVmApiKey() const
{
    auto settings = Hawk::getSettings();
    return Hawk::environmentOverride("E2B_API_KEY",
                                     settings.value(kSettingsKeyRemoteVmApiKey).toString());
}

void SandboxSettingsManager::setRemoteVmApiKey(const QString& apiKey)
{
    auto settings = Hawk::getSettings();
    settings.setValue(kSettingsKeyRemoteVmApiKey, apiKey.trimmed());
}

int SandboxSettingsManager::idleTimeoutSeconds() const
{
    auto settings = Hawk::getSettings();
    const QString stored = settings.value(kSettingsKeyIdleTimeoutSeconds,
                                          kDefaultIdleTimeoutSeconds).toString();
    bool ok = false;
    const int seconds = Hawk::environmentOverride("E2B_IDLE_TIMEOUT_SECONDS", stored).toInt(&ok);
    return (ok && seconds > 0) ? seconds : kDefaultIdleTimeoutSeconds;
}

void SandboxSettingsManager::setIdleTimeoutSeconds(int seconds)
{
    auto settings = Hawk::getSettings();
    settings.setValue(kSettingsKeyIdleTimeoutSeconds, qMax(1, seconds));
}

int SandboxSettingsManager::reaperIntervalSeconds() const
{
    auto settings = Hawk::getSettings();
    const int seconds = settings.value(kSettingsKeyReaperIntervalSeconds,
                                       kDefaultReaperIntervalSeconds).toInt();
    return seconds > 0 ? seconds : kDefaultReaperIntervalSeconds;
}

void SandboxSettingsManager::setReaperIntervalSeconds(int seconds)
{
    auto settings = Hawk::getSettings();
    settings.setValue(kSettingsKeyReaperIntervalSeconds, qMax(1, seconds));
}

double SandboxSettingsManager::costLimit() const
{
    auto settings = Hawk::getSettings();
    const QString stored = settings.value(kSettingsKeyCostLimit, kDefaultCostLimit).toString();
    bool ok = false;
    const double limit = Hawk::environmentOverride("E2B_COST_LIMIT", stored).toDouble(&ok);
    return (ok && limit >= 0.0) ? limit : kDefaultCostLimit;
}

void SandboxSettingsManager::setCostLimit(double limit)
{
    auto settings = Hawk::getSettings();
    settings.setValue(kSettingsKeyCostLimit, qMax(0.0, limit));
}

bool SandboxSettingsManager::gpuRequested() const
{
    auto settings = Hawk::getSettings();
    return settings.value(kSettingsKeyGpuRequested, false).toBool();
}

void SandboxSettingsManager::setGpuRequested(bool requested)
{
    auto settings = Hawk::getSettings();
    settings.setValue(kSettingsKeyGpuRequested, requested);
}

bool SandboxSettingsManager::gpuBetaEnabled() const
{
    if (!qgetenv("E2B_GPU_BETA_ENABLED").isEmpty()) {
        return true;
    }
    auto settings = Hawk::getSettings();
    return settings.value(kSettingsKeyGpuBetaEnabled, false).toBool();
}

void SandboxSettingsManager::setGpuBetaEnabled(bool enabled)
{
    auto settings = Hawk::getSettings();
    settings.setValue(kSettingsKeyGpuBetaEnabled, enabled);
}

double SandboxSettingsManager::vmTtlHours() const
{
    auto settings = Hawk::getSettings();
    const double hours = settings.value(kSettingsKeyVmTtlHours, kDefaultVmTtlHours).toDouble();
    if (hours <= 0.0) {
        return kDefaultVmTtlHours;
    }
    return qMin(hours, kMaxVmTtlHours);
}

void SandboxSettingsManager::setVmTtlHours(double hours)
{
    auto settings = Hawk::getSettings();
    settings.setValue(kSettingsKeyVmTtlHours, hours);
}

QString SandboxSettingsManager::imageDigest() const
{
    auto settings = Hawk::getSettings();
    return settings.value(kSettingsKeyImageDigest).toString();
}

void SandboxSettingsManager::setImageDigest(const QString& digest)
{
    auto settings = Hawk::getSettings();
    settings.setValue(kSettingsKeyImageDigest, digest.trimmed());
}

QByteArray SandboxSettingsManager::imageDigestVariable(const QString& image)
{
    QString suffix = image.trimmed().toUpper();
    suffix.replace(QLatin1Char('-'), QLatin1Char('_'));
    return QByteArrayLiteral("E2B_IMAGE_SHA256_") + suffix.toLatin1();
}

QString SandboxSettingsManager::expectedImageDigest(const QString& image) const
{
    auto settings = Hawk::getSettings();
    settings.beginGroup(kSettingsGroupExpectedDigests);
    const QString stored = settings.value(image).toString();
    settings.endGroup();
    return Hawk::environmentOverride(imageDigestVariable(image).constData(), stored).trimmed();
}

void SandboxSettingsManager::setExpectedImageDigest(const QString& image, const QString& digest)
{
    auto settings = Hawk::getSettings();
    settings.beginGroup(kSettingsGroupExpectedDigests);
    settings.setValue(image, digest.trimmed());
    settings.endGroup();
}
