#include "MockRemoteVmProvider.h"

#include <QJsonObject>

bool MockRemoteVmProvider::spawn(const Hawk::RemoteVmSpec& spec, QString* vmId, QString* errorMessage)
{
    m_lastSpec = spec;
    if (m_spawnFails) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Mock spawn failure");
        }
        return false;
    }
    *vmId = QStringLiteral("vm_%1").arg(++m_spawned);
    return true;
}

Hawk::ExecResult MockRemoteVmProvider::exec(const QString& /*vmId*/, const QString& command,
                                            int /*timeoutMs*/)
{
    m_commands.append(command);
    Hawk::ExecResult result;
    result.exitCode = m_execExitCode;
    return result;
}

bool MockRemoteVmProvider::upload(const QString& /*vmId*/, const QString& remotePath,
                                  const QByteArray& content, QString* /*errorMessage*/)
{
    m_files.insert(remotePath, content);
    return true;
}

bool MockRemoteVmProvider::download(const QString& /*vmId*/, const QString& remotePath,
                                    QByteArray* content, QString* errorMessage)
{
    if (!m_files.contains(remotePath)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("No such file: %1").arg(remotePath);
        }
        return false;
    }
    *content = m_files.value(remotePath);
    return true;
}

bool MockRemoteVmProvider::kill(const QString& vmId, QString* /*errorMessage*/)
{
    m_killed.append(vmId);
    return true;
}

bool MockRemoteVmProvider::list(QJsonArray* vms, QString* errorMessage)
{
    if (m_listFails) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Mock list failure");
        }
        return false;
    }
    *vms = m_listed;
    return true;
}
