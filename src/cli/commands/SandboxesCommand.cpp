#include "cli/commands/SandboxesCommand.h"

#include "sandbox/HttpRemoteVmProvider.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>

namespace Hawk {
namespace CLI {

QString SandboxesCommand::name() const { return "sandboxes"; }

QString SandboxesCommand::description() const { return "List or terminate remote VMs"; }

void SandboxesCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addOption({"kill", "Terminate the remote VM with this id", "vm_id"});
    parser.addOption({"json", "Print the list as JSON"});
}

CLIResult SandboxesCommand::execute(const QCommandLineParser& parser)
{
    HttpRemoteVmProvider provider(HttpRemoteVmProvider::configFromSettings());
    if (!provider.isConfigured()) {
        return CLIResult::error(CLIResult::Code::SandboxError,
                                "Remote VM provider is not configured (set E2B_API_KEY)");
    }

    if (parser.isSet("kill")) {
        return killRemoteVm(provider, parser.value("kill").trimmed());
    }
    return listRemoteVms(provider, parser.isSet("json"));
}

CLIResult SandboxesCommand::listRemoteVms(IRemoteVmProvider& provider, bool json)
{
    QJsonArray vms;
    QString errorMessage;
    if (!provider.list(&vms, &errorMessage)) {
        return CLIResult::error(CLIResult::Code::SandboxError,
                                QString("Failed to list remote VMs: %1").arg(errorMessage));
    }

    if (json) {
        return CLIResult::withData(QJsonDocument(vms).toJson(QJsonDocument::Indented));
    }
    if (vms.isEmpty()) {
        return CLIResult::success("No remote VMs running");
    }

    QString output;
    QTextStream out(&output);
    for (const QJsonValue& value : vms) {
        const QJsonObject vm = value.toObject();
        QString id = vm.value("sandbox_id").toString();
        if (id.isEmpty()) {
            id = vm.value("id").toString();
        }
        out << QString("%1  %2  started %3\n")
                   .arg(id)
                   .arg(vm.value("image").toString("-"))
                   .arg(vm.value("started_at").toString("-"));
    }
    return CLIResult::success(output);
}

CLIResult SandboxesCommand::killRemoteVm(IRemoteVmProvider& provider, const QString& vmId)
{
    if (vmId.isEmpty()) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, "--kill needs a VM id");
    }

    QString errorMessage;
    if (!provider.kill(vmId, &errorMessage)) {
        return CLIResult::error(CLIResult::Code::SandboxError,
                                QString("Failed to terminate %1: %2").arg(vmId, errorMessage));
    }
    return CLIResult::success(QString("Terminated %1").arg(vmId));
}

} // namespace CLI
} // namespace Hawk
