#include "cli/CLIHandler.h"

#include "cli/commands/ConfigCommand.h"
#include "cli/commands/PlanCommand.h"
#include "cli/commands/RunCommand.h"
#include "cli/commands/SandboxesCommand.h"
#include "cli/commands/TemplatesCommand.h"
#include "cli/commands/TraceCommand.h"
#include "cli/commands/TracesCommand.h"
#include "cli/commands/ValidateCommand.h"
#include "version.h"

#include <QCommandLineParser>
#include <QTextStream>

namespace Hawk {
namespace CLI {

CLIHandler::CLIHandler() { registerCommands(); }

CLIHandler::~CLIHandler() = default;

void CLIHandler::registerCommands()
{
    auto addCmd = [this](CLICommandPtr cmd) { m_commands[cmd->name()] = std::move(cmd); };

    addCmd(std::make_unique<RunCommand>());
    addCmd(std::make_unique<PlanCommand>());
    addCmd(std::make_unique<ValidateCommand>());
    addCmd(std::make_unique<TemplatesCommand>());
    addCmd(std::make_unique<TracesCommand>());
    addCmd(std::make_unique<TraceCommand>());
    addCmd(std::make_unique<SandboxesCommand>());
    addCmd(std::make_unique<ConfigCommand>());
}

bool CLIHandler::requiresDisplay(const QStringList& arguments) const
{
    if (arguments.size() < 2) {
        return false;
    }
    const CLICommand* command = findCommand(arguments.at(1));
    return command && command->requiresDisplay();
}

CLIResult CLIHandler::process(const QStringList& arguments)
{
    if (arguments.size() < 2) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, getHelpText());
    }

    const QString& cmdOrOption = arguments.at(1);

    // Handle global options
    if (cmdOrOption == "--help" || cmdOrOption == "-h") {
        return CLIResult::success(getHelpText());
    }
    if (cmdOrOption == "--version" || cmdOrOption == "-v") {
        return CLIResult::success(getVersionText());
    }

    CLICommand* command = findCommand(cmdOrOption);
    if (!command) {
        return CLIResult::error(
            CLIResult::Code::InvalidArguments,
            QString("Unknown command: %1\n\n%2").arg(cmdOrOption, getHelpText()));
    }

    QCommandLineParser parser;
    parser.setApplicationDescription(command->description());
    parser.addHelpOption();

    command->setupOptions(parser);

    // Remove command name, keep remaining arguments
    QStringList cmdArgs = arguments;
    cmdArgs.removeAt(1);

    if (!parser.parse(cmdArgs)) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, parser.errorText());
    }

    if (parser.isSet("help")) {
        return CLIResult::success(parser.helpText());
    }

    return command->execute(parser);
}

CLICommand* CLIHandler::findCommand(const QString& name) const
{
    auto it = m_commands.find(name.toLower());
    return it != m_commands.end() ? it->second.get() : nullptr;
}

QString CLIHandler::getHelpText() const
{
    QString help;
    QTextStream out(&help);

    out << "Hawk - Sandboxed UI Automation Engine\n\n";
    out << "Usage: hawk <command> [options]\n\n";
    out << "Commands:\n";

    QStringList names;
    for (const auto& [name, cmd] : m_commands) {
        names.append(name);
    }
    names.sort();

    for (const QString& name : names) {
        const auto& cmd = m_commands.at(name);
        out << QString("  %1  %2\n").arg(name, -10).arg(cmd->description());
    }

    out << "\nGlobal Options:\n";
    out << "  -h, --help     Display this help message\n";
    out << "  -v, --version  Display version information\n";
    out << "\nUse 'hawk <command> --help' for more information about a command.\n";

    return help;
}

QString CLIHandler::getVersionText() { return QString("Hawk version %1").arg(HAWK_VERSION); }

} // namespace CLI
} // namespace Hawk
