#include "session/SessionTypes.h"

#include "settings/SandboxSettingsManager.h"
#include "settings/SessionSettingsManager.h"
#include "settings/TraceSettingsManager.h"

namespace Hawk {

QString sessionStateName(SessionState state)
{
    switch (state) {
    case SessionState::Created:
        return QStringLiteral("created");
    case SessionState::SandboxAcquiring:
        return QStringLiteral("sandbox_acquiring");
    case SessionState::Planning:
        return QStringLiteral("planning");
    case SessionState::Executing:
        return QStringLiteral("executing");
    case SessionState::Completing:
        return QStringLiteral("completing");
    case SessionState::Closed:
        return QStringLiteral("closed");
    case SessionState::Aborted:
        return QStringLiteral("aborted");
    }
    return QString();
}

bool isTerminalState(SessionState state)
{
    return state == SessionState::Closed || state == SessionState::Aborted;
}

QString stepErrorKindName(StepErrorKind kind)
{
    switch (kind) {
    case StepErrorKind::CaptureFailed:
        return QStringLiteral("capture_failed");
    case StepErrorKind::ElementNotFound:
        return QStringLiteral("element_not_found");
    case StepErrorKind::InputFailed:
        return QStringLiteral("input_failed");
    case StepErrorKind::ScreenshotFailed:
        return QStringLiteral("screenshot_failed");
    case StepErrorKind::Aborted:
        return QStringLiteral("aborted");
    }
    return QString();
}

SessionOptions SessionOptions::fromSettings()
{
    const auto& session = SessionSettingsManager::instance();
    const auto& sandbox = SandboxSettingsManager::instance();
    const auto& trace = TraceSettingsManager::instance();

    SessionOptions options;
    options.platform = session.platform();
    options.sandboxed = sandbox.isSandboxEnabled();
    options.preferRemoteVm = sandbox.preferRemoteVm();
    options.allowUnsandboxedFallback = sandbox.allowUnsandboxedFallback();
    options.gpu = sandbox.gpuRequested();
    options.vmTtlHours = sandbox.vmTtlHours();
    options.imageDigest = sandbox.imageDigest();
    options.maxRetries = session.maxRetries();
    options.retryBackoffMs = session.retryBackoffMs();
    options.fpsTarget = session.fpsTarget();
    options.execTimeoutMs = session.execTimeoutMs();
    options.detector = session.detector();
    options.logDirectory = trace.logDirectory();
    options.saveScreenshots = trace.saveScreenshots();
    return options;
}

SandboxOptions SessionOptions::sandboxOptions() const
{
    SandboxOptions options;
    options.platform = platform;
    options.sandboxed = sandboxed;
    options.preferRemoteVm = preferRemoteVm;
    options.allowUnsandboxedFallback = allowUnsandboxedFallback;
    options.gpu = gpu;
    options.vmTtlHours = vmTtlHours;
    options.imageDigest = imageDigest;
    return options;
}

} // namespace Hawk
