#ifndef HTTPREMOTEVMPROVIDER_H
#define HTTPREMOTEVMPROVIDER_H

#include "sandbox/IRemoteVmProvider.h"

#include <QUrl>

namespace Hawk {

/**
 * @brief REST client for the remote micro-VM service.
 *
 * Endpoints, relative to the configured base URL:
 *   POST   /sandboxes                 spawn
 *   POST   /sandboxes/{id}/exec       run a command
 *   PUT    /sandboxes/{id}/files      upload (base64 content)
 *   GET    /sandboxes/{id}/files      download (?path=)
 *   DELETE /sandboxes/{id}            kill
 *   GET    /sandboxes                 list
 */
class HttpRemoteVmProvider : public IRemoteVmProvider
{
public:
    struct Config {
        QString baseUrl;
        QString apiKey;
        int requestTimeoutMs = 60000;
    };

    explicit HttpRemoteVmProvider(const Config& config);

    static Config configFromSettings();

    bool isConfigured() const override;
    bool spawn(const RemoteVmSpec& spec, QString* vmId, QString* errorMessage) override;
    ExecResult exec(const QString& vmId, const QString& command, int timeoutMs) override;
    bool upload(const QString& vmId, const QString& remotePath,
                const QByteArray& content, QString* errorMessage) override;
    bool download(const QString& vmId, const QString& remotePath,
                  QByteArray* content, QString* errorMessage) override;
    bool kill(const QString& vmId, QString* errorMessage) override;
    bool list(QJsonArray* vms, QString* errorMessage) override;

    QUrl endpoint(const QString& path) const;

    static bool parseSpawnResponse(const QByteArray& data, QString* vmId, QString* errorMessage);
    static ExecResult parseExecResponse(const QByteArray& data);
    // Accepts a bare array or {"sandboxes": [...]}.
    static bool parseListResponse(const QByteArray& data, QJsonArray* vms, QString* errorMessage);

private:
    Config m_config;
};

} // namespace Hawk

#endif // HTTPREMOTEVMPROVIDER_H
