#ifndef IREMOTEVMPROVIDER_H
#define IREMOTEVMPROVIDER_H

#include "sandbox/SandboxTypes.h"

#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QString>

namespace Hawk {

struct RemoteVmSpec
{
    QString image;
    double ttlHours = 6.0;
    bool gpu = false;
    QJsonObject metadata;
    int spawnTimeoutMs = 60000;
};

/**
 * @brief Client for a remote micro-VM service.
 *
 * All calls block. Failures are reported through the return value and the
 * error out-parameter; exec reports them in the ExecResult.
 */
class IRemoteVmProvider
{
public:
    virtual ~IRemoteVmProvider() = default;

    virtual bool isConfigured() const = 0;

    virtual bool spawn(const RemoteVmSpec& spec, QString* vmId, QString* errorMessage) = 0;
    virtual ExecResult exec(const QString& vmId, const QString& command, int timeoutMs) = 0;
    virtual bool upload(const QString& vmId, const QString& remotePath,
                        const QByteArray& content, QString* errorMessage) = 0;
    virtual bool download(const QString& vmId, const QString& remotePath,
                          QByteArray* content, QString* errorMessage) = 0;
    virtual bool kill(const QString& vmId, QString* errorMessage) = 0;
    virtual bool list(QJsonArray* vms, QString* errorMessage) = 0;
};

} // namespace Hawk

#endif // IREMOTEVMPROVIDER_H
