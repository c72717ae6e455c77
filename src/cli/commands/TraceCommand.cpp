#include "cli/commands/TraceCommand.h"

#include "cli/PlanFileHelper.h"
#include "monitoring/ActionLogger.h"

namespace Hawk {
namespace CLI {

QString TraceCommand::name() const { return "trace"; }

QString TraceCommand::description() const { return "Show one saved action trace"; }

void TraceCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addPositionalArgument("trace_id", "Trace to show");
    parser.addOption({"log-dir", "Trace directory", "dir"});
}

CLIResult TraceCommand::execute(const QCommandLineParser& parser)
{
    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, "Exactly one trace id is required");
    }

    const ActionLogger logger(parser.value("log-dir"));
    ActionTrace trace;
    QString error;
    if (!logger.loadTrace(args.first(), &trace, &error)) {
        return CLIResult::error(CLIResult::Code::FileError, error);
    }
    return CLIResult::withData(toJsonBytes(trace.toJson()));
}

} // namespace CLI
} // namespace Hawk
