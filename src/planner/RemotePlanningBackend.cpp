#include "planner/RemotePlanningBackend.h"

#include "settings/PlannerSettingsManager.h"
#include "utils/HttpUtils.h"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QUrl>

namespace Hawk {

namespace {

void setError(QString* errorMessage, const QString& message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
}

} // namespace

RemotePlanningBackend::RemotePlanningBackend(const Config& config)
    : m_config(config)
{
}

RemotePlanningBackend::Config RemotePlanningBackend::configFromSettings()
{
    const auto& settings = PlannerSettingsManager::instance();
    Config config;
    config.endpoint = settings.endpoint();
    config.apiKey = settings.apiKey();
    config.model = settings.model();
    return config;
}

QString RemotePlanningBackend::name() const
{
    return QStringLiteral("openai:%1").arg(m_config.model);
}

bool RemotePlanningBackend::isConfigured() const
{
    return !m_config.apiKey.isEmpty() && QUrl(m_config.endpoint).isValid()
        && !m_config.endpoint.isEmpty();
}

bool RemotePlanningBackend::requestPlan(const QString& systemInstruction,
                                        const QString& goal,
                                        int timeoutMs,
                                        TaskPlan* plan,
                                        QString* errorMessage)
{
    if (!isConfigured()) {
        setError(errorMessage, QStringLiteral("Planning backend is not configured"));
        return false;
    }

    const QNetworkRequest request =
        HttpUtils::jsonRequest(QUrl(m_config.endpoint), m_config.apiKey);
    const HttpUtils::HttpResponse response = HttpUtils::sendBlocking(
        request, QByteArrayLiteral("POST"), buildRequestBody(m_config, systemInstruction, goal),
        timeoutMs);

    if (response.timedOut) {
        setError(errorMessage, QStringLiteral("Planning request timed out after %1 ms").arg(timeoutMs));
        return false;
    }
    if (!response.isSuccess()) {
        setError(errorMessage, response.failureMessage());
        return false;
    }

    return parseCompletionResponse(response.body, plan, errorMessage);
}

QByteArray RemotePlanningBackend::buildRequestBody(const Config& config,
                                                   const QString& systemInstruction,
                                                   const QString& goal)
{
    QJsonObject systemMessage;
    systemMessage["role"] = QStringLiteral("system");
    systemMessage["content"] = systemInstruction;

    QJsonObject userMessage;
    userMessage["role"] = QStringLiteral("user");
    userMessage["content"] = QStringLiteral("Create a task plan for: %1").arg(goal);

    QJsonObject body;
    body["model"] = config.model;
    body["messages"] = QJsonArray{systemMessage, userMessage};
    body["temperature"] = config.temperature;
    body["max_tokens"] = config.maxTokens;
    return QJsonDocument(body).toJson(QJsonDocument::Compact);
}

bool RemotePlanningBackend::parseCompletionResponse(const QByteArray& data,
                                                    TaskPlan* plan,
                                                    QString* errorMessage)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        setError(errorMessage, QStringLiteral("Invalid completion response"));
        return false;
    }

    const QJsonArray choices = doc.object().value("choices").toArray();
    if (choices.isEmpty()) {
        setError(errorMessage, QStringLiteral("Completion response has no choices"));
        return false;
    }

    const QString content = choices.first().toObject()
                                .value("message").toObject()
                                .value("content").toString();
    if (content.trimmed().isEmpty()) {
        setError(errorMessage, QStringLiteral("Completion response has no content"));
        return false;
    }

    const QJsonDocument planDoc =
        QJsonDocument::fromJson(stripCodeFence(content).toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !planDoc.isObject()) {
        setError(errorMessage, QStringLiteral("Model output is not a JSON object: %1")
                                   .arg(parseError.errorString()));
        return false;
    }

    TaskPlan parsed;
    if (!TaskPlan::fromJson(planDoc.object(), &parsed, errorMessage)) {
        return false;
    }
    if (parsed.isEmpty()) {
        setError(errorMessage, QStringLiteral("Model returned a plan without steps"));
        return false;
    }

    if (plan) {
        *plan = parsed;
    }
    return true;
}

QString RemotePlanningBackend::stripCodeFence(const QString& content)
{
    QString trimmed = content.trimmed();
    if (!trimmed.startsWith(QLatin1String("```"))) {
        return trimmed;
    }

    const int firstNewline = trimmed.indexOf(QLatin1Char('\n'));
    if (firstNewline < 0) {
        return QString();
    }
    trimmed = trimmed.mid(firstNewline + 1);
    if (trimmed.endsWith(QLatin1String("```"))) {
        trimmed.chop(3);
    }
    return trimmed.trimmed();
}

} // namespace Hawk
