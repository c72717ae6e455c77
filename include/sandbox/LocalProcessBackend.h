#ifndef LOCALPROCESSBACKEND_H
#define LOCALPROCESSBACKEND_H

#include "sandbox/ISandboxBackend.h"

#include <QTemporaryDir>
#include <memory>

namespace Hawk {

/**
 * @brief Linux sandbox built from a private Xvfb display and firejail.
 *
 * Commands run under firejail with a generated profile (private home in a
 * temporary jail directory, no network, no capabilities) and DISPLAY set
 * to a display in the 100..199 range.
 */
class LocalProcessBackend : public ISandboxBackend
{
public:
    static constexpr int kFirstDisplay = 100;
    static constexpr int kLastDisplay = 199;
    static constexpr const char* kScreenGeometry = "1920x1080x24";

    LocalProcessBackend();
    ~LocalProcessBackend() override;

    SandboxBackendKind kind() const override { return SandboxBackendKind::LocalProcess; }
    bool start(const SandboxOptions& options, QString* errorMessage) override;
    ExecResult exec(const QString& command, int timeoutMs) override;
    bool upload(const QString& localPath, const QString& remotePath, QString* errorMessage) override;
    bool download(const QString& remotePath, const QString& localPath, QString* errorMessage) override;
    void stop() override;
    QString backendId() const override { return m_backendId; }
    QString display() const override { return m_display; }

    QString jailPath() const;

    // First display number without an X lock file under lockDirectory, or -1.
    static int findFreeDisplay(const QString& lockDirectory = QStringLiteral("/tmp"));
    static QString profileContents(const QString& jailPath);

    // Maps a sandbox path to a host path inside the jail; empty when the
    // path escapes it.
    static QString resolveJailPath(const QString& jailRoot, const QString& sandboxPath);

private:
    bool startDisplay(int timeoutMs, QString* errorMessage);
    void stopDisplay();

    std::unique_ptr<QTemporaryDir> m_jail;
    QString m_profilePath;
    QString m_display;
    QString m_backendId;
    qint64 m_xvfbPid = 0;
};

} // namespace Hawk

#endif // LOCALPROCESSBACKEND_H
