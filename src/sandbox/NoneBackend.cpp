#include "sandbox/NoneBackend.h"

#include "utils/ProcessUtils.h"

#include <QDateTime>
#include <QDebug>

namespace Hawk {

bool NoneBackend::start(const SandboxOptions& options, QString* errorMessage)
{
    Q_UNUSED(errorMessage);
    m_backendId = QStringLiteral("none_%1").arg(QDateTime::currentMSecsSinceEpoch());
    m_display = QString::fromLocal8Bit(qgetenv("DISPLAY"));
    m_started = true;
    qWarning() << "NoneBackend: Running" << options.platform << "session without isolation";
    return true;
}

ExecResult NoneBackend::exec(const QString& command, int timeoutMs)
{
    if (!m_started) {
        return ExecResult::failure(QStringLiteral("Host backend is not started"));
    }
    return ProcessUtils::runShell(command, timeoutMs);
}

bool NoneBackend::upload(const QString& localPath, const QString& remotePath, QString* errorMessage)
{
    Q_UNUSED(localPath);
    Q_UNUSED(remotePath);
    if (errorMessage) {
        *errorMessage = QStringLiteral("File transfer is not supported without a sandbox");
    }
    return false;
}

bool NoneBackend::download(const QString& remotePath, const QString& localPath, QString* errorMessage)
{
    Q_UNUSED(remotePath);
    Q_UNUSED(localPath);
    if (errorMessage) {
        *errorMessage = QStringLiteral("File transfer is not supported without a sandbox");
    }
    return false;
}

void NoneBackend::stop()
{
    m_started = false;
}

} // namespace Hawk
