#include "sandbox/CommandRunner.h"

#include "sandbox/SandboxManager.h"
#include "utils/ProcessUtils.h"

namespace Hawk {

LocalCommandRunner::LocalCommandRunner(const QString& display)
    : m_environment(QProcessEnvironment::systemEnvironment())
{
    if (!display.isEmpty()) {
        m_environment.insert(QStringLiteral("DISPLAY"), display);
    }
}

ExecResult LocalCommandRunner::run(const QStringList& command, int timeoutMs)
{
    if (command.isEmpty()) {
        return ExecResult::failure(QStringLiteral("Empty command"));
    }
    return ProcessUtils::run(command.first(), command.mid(1), timeoutMs, m_environment);
}

SandboxCommandRunner::SandboxCommandRunner(SandboxManager& manager, const SandboxHandle& handle)
    : m_manager(manager)
    , m_handle(handle)
{
}

ExecResult SandboxCommandRunner::run(const QStringList& command, int timeoutMs)
{
    if (command.isEmpty()) {
        return ExecResult::failure(QStringLiteral("Empty command"));
    }
    return m_manager.exec(m_handle, ProcessUtils::shellJoin(command), timeoutMs);
}

} // namespace Hawk
