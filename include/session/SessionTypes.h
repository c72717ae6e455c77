#ifndef SESSIONTYPES_H
#define SESSIONTYPES_H

#include "detection/ElementTypes.h"
#include "sandbox/SandboxTypes.h"

#include <QMetaType>
#include <QString>
#include <optional>

namespace Hawk {

enum class SessionState {
    Created,
    SandboxAcquiring,
    Planning,
    Executing,
    Completing,
    Closed,
    Aborted
};

QString sessionStateName(SessionState state);
bool isTerminalState(SessionState state);

enum class StepErrorKind {
    CaptureFailed,
    ElementNotFound,
    InputFailed,
    ScreenshotFailed,
    Aborted
};

QString stepErrorKindName(StepErrorKind kind);

struct StepError
{
    StepErrorKind kind = StepErrorKind::InputFailed;
    QString message;
};

/**
 * @brief Outcome of one step attempt, or of a step after all its retries.
 */
struct StepResult
{
    std::optional<StepError> error;
    std::optional<BoundingBox> resolvedBox;   // set by click steps
    int attempts = 0;

    bool succeeded() const { return !error.has_value(); }

    static StepResult success() { return StepResult(); }
    static StepResult failure(StepErrorKind kind, const QString& message)
    {
        StepResult result;
        result.error = StepError{kind, message};
        return result;
    }
};

struct SessionOptions
{
    QString platform = QStringLiteral("linux");
    bool sandboxed = true;
    bool preferRemoteVm = true;
    bool allowUnsandboxedFallback = false;
    bool gpu = false;
    double vmTtlHours = 6.0;
    QString imageDigest;

    int maxRetries = 3;
    int retryBackoffMs = 1000;
    int fpsTarget = 30;
    int execTimeoutMs = 30000;
    QString detector = QStringLiteral("contour");

    QString logDirectory;             // empty: trace settings
    bool saveScreenshots = false;

    // Values from the session, sandbox and trace settings.
    static SessionOptions fromSettings();

    SandboxOptions sandboxOptions() const;
};

} // namespace Hawk

Q_DECLARE_METATYPE(Hawk::SessionState)

#endif // SESSIONTYPES_H
