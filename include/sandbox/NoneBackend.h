#ifndef NONEBACKEND_H
#define NONEBACKEND_H

#include "sandbox/ISandboxBackend.h"

namespace Hawk {

/**
 * @brief Runs commands directly on the host, without isolation.
 */
class NoneBackend : public ISandboxBackend
{
public:
    NoneBackend() = default;

    SandboxBackendKind kind() const override { return SandboxBackendKind::None; }
    bool start(const SandboxOptions& options, QString* errorMessage) override;
    ExecResult exec(const QString& command, int timeoutMs) override;
    bool upload(const QString& localPath, const QString& remotePath, QString* errorMessage) override;
    bool download(const QString& remotePath, const QString& localPath, QString* errorMessage) override;
    void stop() override;
    QString backendId() const override { return m_backendId; }
    QString display() const override { return m_display; }

private:
    QString m_backendId;
    QString m_display;
    bool m_started = false;
};

} // namespace Hawk

#endif // NONEBACKEND_H
