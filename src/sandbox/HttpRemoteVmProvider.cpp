#include "sandbox/HttpRemoteVmProvider.h"

#include "settings/SandboxSettingsManager.h"
#include "utils/HttpUtils.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QUrlQuery>

namespace Hawk {

namespace {

// Extra time on top of the command timeout for the HTTP round trip.
constexpr int kExecTransportSlackMs = 10000;

void setError(QString* errorMessage, const QString& message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
}

QByteArray toJson(const QJsonObject& object)
{
    return QJsonDocument(object).toJson(QJsonDocument::Compact);
}

} // namespace

HttpRemoteVmProvider::HttpRemoteVmProvider(const Config& config)
    : m_config(config)
{
    while (m_config.baseUrl.endsWith(QLatin1Char('/'))) {
        m_config.baseUrl.chop(1);
    }
}

HttpRemoteVmProvider::Config HttpRemoteVmProvider::configFromSettings()
{
    const auto& settings = SandboxSettingsManager::instance();
    Config config;
    config.baseUrl = settings.remoteVmEndpoint();
    config.apiKey = settings.remoteVmApiKey();
    return config;
}

bool HttpRemoteVmProvider::isConfigured() const
{
    return !m_config.apiKey.isEmpty() && QUrl(m_config.baseUrl).isValid()
        && !m_config.baseUrl.isEmpty();
}

QUrl HttpRemoteVmProvider::endpoint(const QString& path) const
{
    return QUrl(m_config.baseUrl + path);
}

bool HttpRemoteVmProvider::parseSpawnResponse(const QByteArray& data, QString* vmId, QString* errorMessage)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        setError(errorMessage, QStringLiteral("Invalid spawn response"));
        return false;
    }

    const QJsonObject obj = doc.object();
    QString id = obj.value("sandbox_id").toString().trimmed();
    if (id.isEmpty()) {
        id = obj.value("id").toString().trimmed();
    }
    if (id.isEmpty()) {
        setError(errorMessage, QStringLiteral("Spawn response has no sandbox id"));
        return false;
    }
    if (vmId) {
        *vmId = id;
    }
    return true;
}

ExecResult HttpRemoteVmProvider::parseExecResponse(const QByteArray& data)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return ExecResult::failure(QStringLiteral("Invalid exec response"));
    }

    const QJsonObject obj = doc.object();
    ExecResult result;
    result.stdOut = obj.value("stdout").toString();
    result.stdErr = obj.value("stderr").toString();
    result.exitCode = obj.value("exit_code").toInt(-1);
    result.timedOut = obj.value("timed_out").toBool(false);
    return result;
}

bool HttpRemoteVmProvider::spawn(const RemoteVmSpec& spec, QString* vmId, QString* errorMessage)
{
    if (!isConfigured()) {
        setError(errorMessage, QStringLiteral("Remote VM provider is not configured"));
        return false;
    }

    QJsonObject body;
    body["image"] = spec.image;
    body["ttl_hours"] = spec.ttlHours;
    body["gpu"] = spec.gpu;
    body["metadata"] = spec.metadata;

    const HttpUtils::HttpResponse response = HttpUtils::sendBlocking(
        HttpUtils::jsonRequest(endpoint(QStringLiteral("/sandboxes")), m_config.apiKey),
        QByteArrayLiteral("POST"), toJson(body), spec.spawnTimeoutMs);
    if (!response.isSuccess()) {
        setError(errorMessage, response.failureMessage());
        return false;
    }
    return parseSpawnResponse(response.body, vmId, errorMessage);
}

ExecResult HttpRemoteVmProvider::exec(const QString& vmId, const QString& command, int timeoutMs)
{
    QElapsedTimer timer;
    timer.start();

    QJsonObject body;
    body["command"] = command;
    body["timeout_ms"] = timeoutMs;

    const HttpUtils::HttpResponse response = HttpUtils::sendBlocking(
        HttpUtils::jsonRequest(endpoint(QStringLiteral("/sandboxes/%1/exec").arg(vmId)), m_config.apiKey),
        QByteArrayLiteral("POST"), toJson(body), timeoutMs + kExecTransportSlackMs);

    ExecResult result;
    if (response.timedOut) {
        result.timedOut = true;
        result.stdErr = QStringLiteral("Remote exec timed out");
    } else if (!response.isSuccess()) {
        result = ExecResult::failure(response.failureMessage());
    } else {
        result = parseExecResponse(response.body);
    }
    result.durationMs = timer.elapsed();
    return result;
}

bool HttpRemoteVmProvider::upload(const QString& vmId, const QString& remotePath,
                                  const QByteArray& content, QString* errorMessage)
{
    QJsonObject body;
    body["path"] = remotePath;
    body["content_b64"] = QString::fromLatin1(content.toBase64());

    const HttpUtils::HttpResponse response = HttpUtils::sendBlocking(
        HttpUtils::jsonRequest(endpoint(QStringLiteral("/sandboxes/%1/files").arg(vmId)), m_config.apiKey),
        QByteArrayLiteral("PUT"), toJson(body), m_config.requestTimeoutMs);
    if (!response.isSuccess()) {
        setError(errorMessage, response.failureMessage());
        return false;
    }
    return true;
}

bool HttpRemoteVmProvider::download(const QString& vmId, const QString& remotePath,
                                    QByteArray* content, QString* errorMessage)
{
    QUrl url = endpoint(QStringLiteral("/sandboxes/%1/files").arg(vmId));
    QUrlQuery query;
    query.addQueryItem(QStringLiteral("path"), remotePath);
    url.setQuery(query);

    const HttpUtils::HttpResponse response = HttpUtils::sendBlocking(
        HttpUtils::jsonRequest(url, m_config.apiKey), QByteArrayLiteral("GET"), QByteArray(),
        m_config.requestTimeoutMs);
    if (!response.isSuccess()) {
        setError(errorMessage, response.failureMessage());
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(response.body, &parseError);
    const QJsonValue encoded = doc.object().value("content_b64");
    if (parseError.error != QJsonParseError::NoError || !encoded.isString()) {
        setError(errorMessage, QStringLiteral("Invalid download response"));
        return false;
    }
    if (content) {
        *content = QByteArray::fromBase64(encoded.toString().toLatin1());
    }
    return true;
}

bool HttpRemoteVmProvider::kill(const QString& vmId, QString* errorMessage)
{
    const HttpUtils::HttpResponse response = HttpUtils::sendBlocking(
        HttpUtils::jsonRequest(endpoint(QStringLiteral("/sandboxes/%1").arg(vmId)), m_config.apiKey),
        QByteArrayLiteral("DELETE"), QByteArray(), m_config.requestTimeoutMs);
    if (!response.isSuccess() && response.statusCode != 404) {
        setError(errorMessage, response.failureMessage());
        return false;
    }
    return true;
}

bool HttpRemoteVmProvider::list(QJsonArray* vms, QString* errorMessage)
{
    const HttpUtils::HttpResponse response = HttpUtils::sendBlocking(
        HttpUtils::jsonRequest(endpoint(QStringLiteral("/sandboxes")), m_config.apiKey),
        QByteArrayLiteral("GET"), QByteArray(), m_config.requestTimeoutMs);
    if (!response.isSuccess()) {
        setError(errorMessage, response.failureMessage());
        return false;
    }

    return parseListResponse(response.body, vms, errorMessage);
}

bool HttpRemoteVmProvider::parseListResponse(const QByteArray& data, QJsonArray* vms, QString* errorMessage)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setError(errorMessage, QStringLiteral("Invalid list response"));
        return false;
    }
    if (!doc.isArray() && !doc.object().value("sandboxes").isArray()) {
        setError(errorMessage, QStringLiteral("List response has no sandboxes"));
        return false;
    }
    if (vms) {
        *vms = doc.isArray() ? doc.array() : doc.object().value("sandboxes").toArray();
    }
    return true;
}

} // namespace Hawk
