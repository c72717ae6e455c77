#ifndef INPUTDRIVERFACTORY_H
#define INPUTDRIVERFACTORY_H

#include <memory>

namespace Hawk {

class ICommandRunner;
class IInputDriver;

/**
 * @brief Driver for the display a runner targets.
 *
 * Local runners on Windows get the SendInput driver; everything else goes
 * through xdotool via the runner, which must outlive the driver. timeoutMs
 * bounds each xdotool command; zero keeps the driver default.
 */
std::unique_ptr<IInputDriver> createPlatformInputDriver(ICommandRunner* runner, int timeoutMs = 0);

#ifdef _WIN32
std::unique_ptr<IInputDriver> createWin32InputDriver();
#endif

} // namespace Hawk

#endif // INPUTDRIVERFACTORY_H
