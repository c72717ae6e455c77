#ifndef SANDBOXTYPES_H
#define SANDBOXTYPES_H

#include <QDateTime>
#include <QJsonObject>
#include <QMetaType>
#include <QString>

namespace Hawk {

enum class SandboxBackendKind {
    RemoteVm,
    LocalProcess,
    None
};

QString sandboxBackendName(SandboxBackendKind kind);
bool sandboxBackendFromName(const QString& name, SandboxBackendKind* kind);

/**
 * @brief Outcome of one command run through a sandbox or on the host.
 */
struct ExecResult
{
    QString stdOut;
    QString stdErr;
    int exitCode = -1;
    bool timedOut = false;
    qint64 durationMs = 0;

    bool succeeded() const { return !timedOut && exitCode == 0; }

    // Human readable reason for a failed run, empty on success.
    QString errorSummary() const;

    QJsonObject toJson() const;

    static ExecResult failure(const QString& message)
    {
        ExecResult result;
        result.stdErr = message;
        return result;
    }
};

struct SandboxOptions
{
    QString platform = QStringLiteral("linux");
    bool sandboxed = true;
    bool preferRemoteVm = true;
    bool allowUnsandboxedFallback = false;
    int startTimeoutMs = 60000;

    // Remote VM only.
    bool gpu = false;
    double vmTtlHours = 6.0;
    QString imageDigest;
};

struct SandboxInfo
{
    QString id;
    SandboxBackendKind backend = SandboxBackendKind::None;
    QString display;
    double runtimeSeconds = 0.0;
    double costEstimate = 0.0;
    QDateTime lastActivity;

    QJsonObject toJson() const;
};

} // namespace Hawk

Q_DECLARE_METATYPE(Hawk::ExecResult)

#endif // SANDBOXTYPES_H
