#include "cli/commands/RunCommand.h"

#include "cli/PlanFileHelper.h"
#include "planner/TaskPlanner.h"
#include "sandbox/SandboxManager.h"
#include "session/Session.h"

#include <QJsonObject>
#include <QTextStream>

namespace Hawk {
namespace CLI {

QString RunCommand::name() const { return "run"; }

QString RunCommand::description() const { return "Plan a goal and execute it in a sandbox"; }

void RunCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addPositionalArgument("goal", "Natural language goal");
    parser.addOption({"platform", "Target platform (linux, macos, windows)", "name"});
    parser.addOption({"no-sandbox", "Drive the host display without isolation"});
    parser.addOption({"no-remote-vm", "Skip the remote VM backend"});
    parser.addOption({"allow-unsandboxed", "Fall back to the host when no sandbox starts"});
    parser.addOption({"gpu", "Request a GPU remote VM (needs E2B_GPU_BETA_ENABLED)"});
    parser.addOption({"image-digest", "Refuse remote VM images whose SHA-256 differs", "sha256"});
    parser.addOption({"plan", "Execute a TaskPlan JSON file instead of planning", "file"});
    parser.addOption({"replay", "Re-run the steps of a saved trace (requires --plan)", "trace_id"});
    parser.addOption({"log-dir", "Trace directory", "dir"});
    parser.addOption({"json", "Print the result as JSON"});
}

bool RunCommand::applyOptions(const QCommandLineParser& parser, SessionOptions* options,
                              QString* errorMessage)
{
    if (parser.isSet("platform")) {
        const QString platform = parser.value("platform").trimmed().toLower();
        if (platform != "linux" && platform != "macos" && platform != "windows") {
            if (errorMessage) {
                *errorMessage = QString("Invalid platform: %1 (expected linux, macos or windows)")
                                    .arg(parser.value("platform"));
            }
            return false;
        }
        options->platform = platform;
    }
    if (parser.isSet("no-sandbox")) {
        options->sandboxed = false;
    }
    if (parser.isSet("no-remote-vm")) {
        options->preferRemoteVm = false;
    }
    if (parser.isSet("allow-unsandboxed")) {
        options->allowUnsandboxedFallback = true;
    }
    if (parser.isSet("gpu")) {
        options->gpu = true;
    }
    if (parser.isSet("image-digest")) {
        options->imageDigest = parser.value("image-digest").trimmed();
    }
    if (parser.isSet("log-dir")) {
        options->logDirectory = parser.value("log-dir");
    }
    return true;
}

CLIResult RunCommand::execute(const QCommandLineParser& parser)
{
    const QString goal = parser.positionalArguments().join(' ').trimmed();
    const bool hasPlanFile = parser.isSet("plan");
    if (goal.isEmpty() && !hasPlanFile) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, "A goal or --plan is required");
    }
    if (parser.isSet("replay") && !hasPlanFile) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, "--replay requires --plan");
    }

    SessionOptions options = SessionOptions::fromSettings();
    QString optionError;
    if (!applyOptions(parser, &options, &optionError)) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, optionError);
    }

    TaskPlan plan;
    if (hasPlanFile) {
        CLIResult loaded = loadPlanFile(parser.value("plan"), &plan);
        if (!loaded.isSuccess()) {
            return loaded;
        }
        if (!goal.isEmpty()) {
            plan.goal = goal;
        }
    }

    SandboxManager sandboxManager;
    sandboxManager.startIdleReaper();

    Session session(sandboxManager, options);
    session.setPlanner(TaskPlanner::createFromSettings());

    if (!session.start()) {
        return CLIResult::error(CLIResult::Code::SandboxError, session.lastError());
    }

    bool ok = false;
    if (parser.isSet("replay")) {
        ok = session.replayPlan(parser.value("replay"), plan);
    } else if (hasPlanFile) {
        ok = session.run(plan);
    } else {
        ok = session.run(goal);
    }

    // Save the trace and release the sandbox before reporting.
    session.close();

    QJsonObject summary;
    summary["session_id"] = session.sessionId();
    summary["success"] = ok;
    summary["state"] = sessionStateName(session.state());
    summary["sandbox"] = sandboxBackendName(session.sandboxHandle().backend());
    summary["trace_id"] = session.trace().traceId();
    summary["trace_path"] = session.savedTracePath();
    summary["events"] = static_cast<int>(session.trace().events().size());
    if (!ok) {
        summary["error"] = session.lastError();
    }

    if (parser.isSet("json")) {
        CLIResult result = ok ? CLIResult::withData(toJsonBytes(summary))
                              : CLIResult::error(CLIResult::Code::ExecutionError, session.lastError());
        result.data = toJsonBytes(summary);
        return result;
    }

    QString output;
    QTextStream out(&output);
    out << "Session " << session.sessionId() << (ok ? " completed" : " failed") << "\n";
    out << "  sandbox: " << summary["sandbox"].toString() << "\n";
    out << "  trace:   " << session.trace().traceId() << "\n";
    if (!session.savedTracePath().isEmpty()) {
        out << "  saved:   " << session.savedTracePath() << "\n";
    }
    if (!ok) {
        out << "  error:   " << session.lastError() << "\n";
        return CLIResult::error(CLIResult::Code::ExecutionError, output);
    }
    return CLIResult::success(output);
}

} // namespace CLI
} // namespace Hawk
