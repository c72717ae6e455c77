#ifndef SESSIONSETTINGSMANAGER_H
#define SESSIONSETTINGSMANAGER_H

#include <QString>

class SessionSettingsManager
{
public:
    static SessionSettingsManager& instance();

    int maxRetries() const;
    void setMaxRetries(int retries);

    int retryBackoffMs() const;
    void setRetryBackoffMs(int backoffMs);

    int fpsTarget() const;
    void setFpsTarget(int fps);

    int execTimeoutMs() const;
    void setExecTimeoutMs(int timeoutMs);

    QString platform() const;
    void setPlatform(const QString& platform);

    // "contour" (OpenCV) or "layout"
    QString detector() const;
    void setDetector(const QString& detector);

    static constexpr int kDefaultMaxRetries = 3;
    static constexpr int kDefaultRetryBackoffMs = 1000;
    static constexpr int kDefaultFpsTarget = 30;
    static constexpr int kDefaultExecTimeoutMs = 30000;
    static constexpr const char* kDefaultPlatform = "linux";
    static constexpr const char* kDefaultDetector = "contour";

private:
    SessionSettingsManager() = default;
    ~SessionSettingsManager() = default;
    SessionSettingsManager(const SessionSettingsManager&) = delete;
    SessionSettingsManager& operator=(const SessionSettingsManager&) = delete;

    static constexpr const char* kSettingsKeyMaxRetries = "session/maxRetries";
    static constexpr const char* kSettingsKeyRetryBackoffMs = "session/retryBackoffMs";
    static constexpr const char* kSettingsKeyFpsTarget = "session/fpsTarget";
    static constexpr const char* kSettingsKeyExecTimeoutMs = "session/execTimeoutMs";
    static constexpr const char* kSettingsKeyPlatform = "session/platform";
    static constexpr const char* kSettingsKeyDetector = "session/detector";
};

#endif // SESSIONSETTINGSMANAGER_H
