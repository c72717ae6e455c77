#ifndef TRACESETTINGSMANAGER_H
#define TRACESETTINGSMANAGER_H

#include <QString>

class TraceSettingsManager
{
public:
    static TraceSettingsManager& instance();

    // Falls back to ~/.hawk/logs when nothing is stored.
    QString logDirectory() const;
    void setLogDirectory(const QString& path);

    bool saveScreenshots() const;
    void setSaveScreenshots(bool enabled);

    static QString defaultLogDirectory();
    static constexpr bool kDefaultSaveScreenshots = false;

private:
    TraceSettingsManager() = default;
    ~TraceSettingsManager() = default;
    TraceSettingsManager(const TraceSettingsManager&) = delete;
    TraceSettingsManager& operator=(const TraceSettingsManager&) = delete;

    static constexpr const char* kSettingsKeyLogDirectory = "trace/logDirectory";
    static constexpr const char* kSettingsKeySaveScreenshots = "trace/saveScreenshots";
};

#endif // TRACESETTINGSMANAGER_H
