#ifndef REMOTEPLANNINGBACKEND_H
#define REMOTEPLANNINGBACKEND_H

#include "planner/IPlanningBackend.h"

#include <QByteArray>
#include <QString>

namespace Hawk {

/**
 * @brief Planning backend speaking the OpenAI-compatible chat completions API.
 */
class RemotePlanningBackend : public IPlanningBackend
{
public:
    struct Config {
        QString endpoint;
        QString apiKey;
        QString model;
        double temperature = 0.3;
        int maxTokens = 2000;
    };

    explicit RemotePlanningBackend(const Config& config);

    // Reads endpoint, model and key from PlannerSettingsManager.
    static Config configFromSettings();

    QString name() const override;
    bool isConfigured() const override;
    bool requestPlan(const QString& systemInstruction,
                     const QString& goal,
                     int timeoutMs,
                     TaskPlan* plan,
                     QString* errorMessage) override;

    const Config& config() const { return m_config; }

    static QByteArray buildRequestBody(const Config& config,
                                       const QString& systemInstruction,
                                       const QString& goal);

    // Extracts choices[0].message.content and parses it as a TaskPlan.
    static bool parseCompletionResponse(const QByteArray& data,
                                        TaskPlan* plan,
                                        QString* errorMessage);

    // Drops a surrounding ```json fence if the model added one.
    static QString stripCodeFence(const QString& content);

private:
    Config m_config;
};

} // namespace Hawk

#endif // REMOTEPLANNINGBACKEND_H
