#ifndef PLANNERSETTINGSMANAGER_H
#define PLANNERSETTINGSMANAGER_H

#include <QString>

class PlannerSettingsManager
{
public:
    static PlannerSettingsManager& instance();

    QString endpoint() const;
    void setEndpoint(const QString& endpoint);

    // OPENAI_API_KEY takes precedence over the stored key.
    QString apiKey() const;
    void setApiKey(const QString& apiKey);

    QString model() const;
    void setModel(const QString& model);

    int timeoutMs() const;
    void setTimeoutMs(int timeoutMs);

    QString templatesPath() const;
    void setTemplatesPath(const QString& path);

    static constexpr const char* kDefaultEndpoint = "https://api.openai.com/v1/chat/completions";
    static constexpr const char* kDefaultModel = "gpt-4o";
    static constexpr int kDefaultTimeoutMs = 30000;
    static constexpr const char* kApiKeyEnvironmentVariable = "OPENAI_API_KEY";

private:
    PlannerSettingsManager() = default;
    ~PlannerSettingsManager() = default;
    PlannerSettingsManager(const PlannerSettingsManager&) = delete;
    PlannerSettingsManager& operator=(const PlannerSettingsManager&) = delete;

    static constexpr const char* kSettingsKeyEndpoint = "planner/endpoint";
    static constexpr const char* kSettingsKeyApiKey = "planner/apiKey";
    static constexpr const char* kSettingsKeyModel = "planner/model";
    static constexpr const char* kSettingsKeyTimeoutMs = "planner/timeoutMs";
    static constexpr const char* kSettingsKeyTemplatesPath = "planner/templatesPath";
};

#endif // PLANNERSETTINGSMANAGER_H
