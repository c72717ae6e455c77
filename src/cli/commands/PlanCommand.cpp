#include "cli/commands/PlanCommand.h"

#include "cli/PlanFileHelper.h"
#include "planner/TaskPlanner.h"

namespace Hawk {
namespace CLI {

QString PlanCommand::name() const { return "plan"; }

QString PlanCommand::description() const { return "Print the plan for a goal without executing it"; }

void PlanCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addPositionalArgument("goal", "Natural language goal");
    parser.addOption({{"o", "output"}, "Write the plan to a file", "file"});
    parser.addOption({"offline", "Use templates and rules only"});
}

CLIResult PlanCommand::execute(const QCommandLineParser& parser)
{
    const QString goal = parser.positionalArguments().join(' ').trimmed();
    if (goal.isEmpty()) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, "A goal is required");
    }

    std::unique_ptr<TaskPlanner> planner = TaskPlanner::createFromSettings();
    if (parser.isSet("offline")) {
        planner->setBackend(nullptr);
    }

    const TaskPlan plan = planner->plan(goal);
    QJsonObject json = plan.toJson();

    const QStringList errors = TaskPlanner::validatePlan(plan);
    if (!errors.isEmpty()) {
        return CLIResult::error(CLIResult::Code::ExecutionError,
                                QString("Planner produced an invalid plan:\n  %1")
                                    .arg(errors.join("\n  ")));
    }

    if (parser.isSet("output")) {
        return writeJsonFile(json, parser.value("output"));
    }
    return CLIResult::withData(toJsonBytes(json));
}

} // namespace CLI
} // namespace Hawk
