#ifndef SESSIONCOMPONENTS_H
#define SESSIONCOMPONENTS_H

#include "capture/ScreenCapture.h"
#include "detection/IElementDetector.h"
#include "motor/MotorController.h"
#include "sandbox/CommandRunner.h"

#include <functional>
#include <memory>

namespace Hawk {

class SandboxHandle;
class SandboxManager;
struct SessionOptions;

/**
 * @brief Perception and actuation objects bound to one sandbox.
 *
 * runner, when set, is used by capture and motor and is destroyed after
 * them.
 */
struct SessionComponents
{
    std::unique_ptr<ICommandRunner> runner;
    std::unique_ptr<ScreenCapture> capture;
    std::unique_ptr<IElementDetector> detector;
    std::unique_ptr<MotorController> motor;

    bool isComplete() const { return capture && detector && motor; }
    void reset();
};

using SessionComponentFactory = std::function<SessionComponents(
    SandboxManager& manager, const SandboxHandle& handle, const SessionOptions& options)>;

/**
 * @brief Components for the acquired backend.
 *
 * Unsandboxed handles drive the host display with the Qt capture engine;
 * sandboxed handles go through the sandbox command contract on the
 * sandbox display.
 */
SessionComponents createDefaultSessionComponents(SandboxManager& manager,
                                                 const SandboxHandle& handle,
                                                 const SessionOptions& options);

/**
 * @brief Components driving whatever display runner targets.
 *
 * Local runners capture through Qt; the rest capture through the runner.
 * Every runner command is bounded by options.execTimeoutMs.
 */
SessionComponents createSessionComponents(std::unique_ptr<ICommandRunner> runner,
                                          const SessionOptions& options);

std::unique_ptr<IElementDetector> createElementDetector(const QString& name);

} // namespace Hawk

#endif // SESSIONCOMPONENTS_H
