#include "session/SessionComponents.h"

#include "capture/QtCaptureEngine.h"
#include "capture/SandboxCaptureEngine.h"
#include "detection/ContourElementDetector.h"
#include "detection/LayoutElementDetector.h"
#include "motor/InputDriverFactory.h"
#include "sandbox/SandboxHandle.h"
#include "sandbox/SandboxManager.h"
#include "session/SessionTypes.h"

#include <QDebug>

namespace Hawk {

void SessionComponents::reset()
{
    // Capture and motor hold raw pointers to the runner.
    motor.reset();
    capture.reset();
    detector.reset();
    runner.reset();
}

std::unique_ptr<IElementDetector> createElementDetector(const QString& name)
{
    if (name == QLatin1String("layout")) {
        return std::make_unique<LayoutElementDetector>();
    }
    return std::make_unique<ContourElementDetector>();
}

SessionComponents createSessionComponents(std::unique_ptr<ICommandRunner> runner,
                                          const SessionOptions& options)
{
    SessionComponents components;
    components.runner = std::move(runner);

    std::unique_ptr<ICaptureEngine> engine;
    if (components.runner->isLocal()) {
        engine = std::make_unique<QtCaptureEngine>();
    } else {
        engine = std::make_unique<SandboxCaptureEngine>(components.runner.get(), options.execTimeoutMs);
    }
    qDebug() << "SessionComponents: Using" << engine->engineName() << "capture, exec timeout"
             << options.execTimeoutMs << "ms";

    components.capture = std::make_unique<ScreenCapture>(std::move(engine), options.fpsTarget);
    components.detector = createElementDetector(options.detector);
    components.motor = std::make_unique<MotorController>(
        createPlatformInputDriver(components.runner.get(), options.execTimeoutMs), options.platform);
    return components;
}

SessionComponents createDefaultSessionComponents(SandboxManager& manager,
                                                 const SandboxHandle& handle,
                                                 const SessionOptions& options)
{
    qDebug() << "SessionComponents: Binding to" << sandboxBackendName(handle.backend()) << "sandbox";
    if (handle.backend() == SandboxBackendKind::None) {
        return createSessionComponents(std::make_unique<LocalCommandRunner>(), options);
    }
    return createSessionComponents(std::make_unique<SandboxCommandRunner>(manager, handle), options);
}

} // namespace Hawk
