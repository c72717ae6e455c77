#include "sandbox/SandboxTypes.h"

namespace Hawk {

QString sandboxBackendName(SandboxBackendKind kind)
{
    switch (kind) {
    case SandboxBackendKind::RemoteVm:
        return QStringLiteral("remote_vm");
    case SandboxBackendKind::LocalProcess:
        return QStringLiteral("local_process");
    case SandboxBackendKind::None:
        return QStringLiteral("none");
    }
    return QStringLiteral("none");
}

bool sandboxBackendFromName(const QString& name, SandboxBackendKind* kind)
{
    const QString normalized = name.trimmed().toLower();
    SandboxBackendKind parsed;
    if (normalized == QLatin1String("remote_vm")) {
        parsed = SandboxBackendKind::RemoteVm;
    } else if (normalized == QLatin1String("local_process")) {
        parsed = SandboxBackendKind::LocalProcess;
    } else if (normalized == QLatin1String("none")) {
        parsed = SandboxBackendKind::None;
    } else {
        return false;
    }
    if (kind) {
        *kind = parsed;
    }
    return true;
}

QString ExecResult::errorSummary() const
{
    if (succeeded()) {
        return QString();
    }
    if (timedOut) {
        return QStringLiteral("Command timed out after %1 ms").arg(durationMs);
    }
    const QString detail = stdErr.trimmed();
    if (exitCode < 0) {
        return detail.isEmpty() ? QStringLiteral("Command could not be run") : detail;
    }
    if (detail.isEmpty()) {
        return QStringLiteral("Command exited with code %1").arg(exitCode);
    }
    return QStringLiteral("Command exited with code %1: %2").arg(exitCode).arg(detail);
}

QJsonObject ExecResult::toJson() const
{
    QJsonObject json;
    json["stdout"] = stdOut;
    json["stderr"] = stdErr;
    json["exit_code"] = exitCode;
    json["timed_out"] = timedOut;
    json["duration_ms"] = static_cast<double>(durationMs);
    return json;
}

QJsonObject SandboxInfo::toJson() const
{
    QJsonObject json;
    json["id"] = id;
    json["backend"] = sandboxBackendName(backend);
    json["display"] = display;
    json["runtime_seconds"] = runtimeSeconds;
    json["cost_estimate"] = costEstimate;
    json["last_activity"] = lastActivity.toString(Qt::ISODateWithMs);
    return json;
}

} // namespace Hawk
