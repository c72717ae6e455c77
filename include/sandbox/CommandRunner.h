#ifndef COMMANDRUNNER_H
#define COMMANDRUNNER_H

#include "sandbox/SandboxTypes.h"

#include <QProcessEnvironment>
#include <QString>
#include <QStringList>

namespace Hawk {

class SandboxHandle;
class SandboxManager;

/**
 * @brief Runs a program with arguments somewhere: on the host or in a sandbox.
 *
 * Input drivers and the sandbox capture engine build argument lists and
 * leave routing to the runner.
 */
class ICommandRunner
{
public:
    virtual ~ICommandRunner() = default;

    virtual ExecResult run(const QStringList& command, int timeoutMs) = 0;

    // True when commands run on this machine's display.
    virtual bool isLocal() const = 0;
};

/**
 * @brief Runs commands on the host, optionally against a specific X display.
 */
class LocalCommandRunner : public ICommandRunner
{
public:
    explicit LocalCommandRunner(const QString& display = QString());

    ExecResult run(const QStringList& command, int timeoutMs) override;
    bool isLocal() const override { return true; }

private:
    QProcessEnvironment m_environment;
};

/**
 * @brief Runs commands through SandboxManager::exec on a live handle.
 *
 * The handle must outlive the runner.
 */
class SandboxCommandRunner : public ICommandRunner
{
public:
    SandboxCommandRunner(SandboxManager& manager, const SandboxHandle& handle);

    ExecResult run(const QStringList& command, int timeoutMs) override;
    bool isLocal() const override { return false; }

private:
    SandboxManager& m_manager;
    const SandboxHandle& m_handle;
};

} // namespace Hawk

#endif // COMMANDRUNNER_H
