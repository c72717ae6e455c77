#ifndef SANDBOXESCOMMAND_H
#define SANDBOXESCOMMAND_H

#include "cli/CLICommand.h"

namespace Hawk {

class IRemoteVmProvider;

namespace CLI {

/**
 * @brief List or terminate the remote VMs running on the provider account
 *
 * VMs left behind by crashed runs keep billing until their TTL; this is
 * the way to find and stop them.
 */
class SandboxesCommand : public CLICommand
{
public:
    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;

    static CLIResult listRemoteVms(IRemoteVmProvider& provider, bool json);
    static CLIResult killRemoteVm(IRemoteVmProvider& provider, const QString& vmId);
};

} // namespace CLI
} // namespace Hawk

#endif // SANDBOXESCOMMAND_H
