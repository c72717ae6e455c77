#include "settings/TraceSettingsManager.h"
#include "settings/Settings.h"

#include <QDir>

TraceSettingsManager& TraceSettingsManager::instance()
{
    static TraceSettingsManager instance;
    return instance;
}

QString TraceSettingsManager::defaultLogDirectory()
{
    return QDir::homePath() + QStringLiteral("/.hawk/logs");
}

QString TraceSettingsManager::logDirectory() const
{
    auto settings = Hawk::getSettings();
    const QString stored = settings.value(kSettingsKeyLogDirectory).toString();
    return stored.isEmpty() ? defaultLogDirectory() : stored;
}

void TraceSettingsManager::setLogDirectory(const QString& path)
{
    auto settings = Hawk::getSettings();
    if (path.trimmed().isEmpty()) {
        settings.remove(kSettingsKeyLogDirectory);
        return;
    }
    settings.setValue(kSettingsKeyLogDirectory, QDir::cleanPath(path.trimmed()));
}

bool TraceSettingsManager::saveScreenshots() const
{
    auto settings = Hawk::getSettings();
    return settings.value(kSettingsKeySaveScreenshots, kDefaultSaveScreenshots).toBool();
}

void TraceSettingsManager::setSaveScreenshots(bool enabled)
{
    auto settings = Hawk::getSettings();
    settings.setValue(kSettingsKeySaveScreenshots, enabled);
}
