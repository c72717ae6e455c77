#include "settings/PlannerSettingsManager.h"
#include "settings/Settings.h"

PlannerSettingsManager& PlannerSettingsManager::instance()
{
    static PlannerSettingsManager instance;
    return instance;
}

QString PlannerSettingsManager::endpoint() const
{
    auto settings = Hawk::getSettings();
    return settings.value(kSettingsKeyEndpoint, QString::fromLatin1(kDefaultEndpoint)).toString();
}

void PlannerSettingsManager::setEndpoint(const QString& endpoint)
{
    auto settings = Hawk::getSettings();
    settings.setValue(kSettingsKeyEndpoint, endpoint.trimmed());
}

QString PlannerSettingsManager::apiKey() const
{
    auto settings = Hawk::getSettings();
    return Hawk::environmentOverride(kApiKeyEnvironmentVariable,
                                     settings.value(kSettingsKeyApiKey).toString());
}

void PlannerSettingsManager::setApiKey(const QString& apiKey)
{
    auto settings = Hawk::getSettings();
    settings.setValue(kSettingsKeyApiKey, apiKey.trimmed());
}

QString PlannerSettingsManager::model() const
{
    auto settings = Hawk::getSettings();
    return settings.value(kSettingsKeyModel, QString::fromLatin1(kDefaultModel)).toString();
}

void PlannerSettingsManager::setModel(const QString& model)
{
    auto settings = Hawk::getSettings();
    settings.setValue(kSettingsKeyModel, model.trimmed());
}

int PlannerSettingsManager::timeoutMs() const
{
    auto settings = Hawk::getSettings();
    const int timeoutMs = settings.value(kSettingsKeyTimeoutMs, kDefaultTimeoutMs).toInt();
    return timeoutMs > 0 ? timeoutMs : kDefaultTimeoutMs;
}

void PlannerSettingsManager::setTimeoutMs(int timeoutMs)
{
    auto settings = Hawk::getSettings();
    settings.setValue(kSettingsKeyTimeoutMs, timeoutMs);
}

QString PlannerSettingsManager::templatesPath() const
{
    auto settings = Hawk::getSettings();
    return settings.value(kSettingsKeyTemplatesPath).toString();
}

void PlannerSettingsManager::setTemplatesPath(const QString& path)
{
    auto settings = Hawk::getSettings();
    settings.setValue(kSettingsKeyTemplatesPath, path);
}
