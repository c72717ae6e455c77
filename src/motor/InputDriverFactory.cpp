#include "motor/InputDriverFactory.h"

#include "motor/IInputDriver.h"
#include "motor/XdotoolInputDriver.h"
#include "sandbox/CommandRunner.h"

#include <QtGlobal>

namespace Hawk {

std::unique_ptr<IInputDriver> createPlatformInputDriver(ICommandRunner* runner, int timeoutMs)
{
#ifdef Q_OS_WIN
    if (!runner || runner->isLocal()) {
        return createWin32InputDriver();
    }
#endif
    return std::make_unique<XdotoolInputDriver>(
        runner, timeoutMs > 0 ? timeoutMs : XdotoolInputDriver::kDefaultTimeoutMs);
}

} // namespace Hawk
