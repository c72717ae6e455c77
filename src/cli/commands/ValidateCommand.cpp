#include "cli/commands/ValidateCommand.h"

#include "cli/PlanFileHelper.h"
#include "planner/TaskPlanner.h"

namespace Hawk {
namespace CLI {

QString ValidateCommand::name() const { return "validate"; }

QString ValidateCommand::description() const { return "Validate a TaskPlan JSON file"; }

void ValidateCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addPositionalArgument("file", "TaskPlan JSON file");
}

CLIResult ValidateCommand::execute(const QCommandLineParser& parser)
{
    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, "Exactly one plan file is required");
    }

    TaskPlan plan;
    CLIResult loaded = loadPlanFile(args.first(), &plan);
    if (!loaded.isSuccess()) {
        return loaded;
    }

    const QStringList errors = TaskPlanner::validatePlan(plan);
    if (!errors.isEmpty()) {
        return CLIResult::error(CLIResult::Code::InvalidArguments,
                                QString("Plan %1 is invalid:\n  %2")
                                    .arg(plan.planId, errors.join("\n  ")));
    }
    return CLIResult::success(QString("Plan %1 is valid (%2 steps)")
                                  .arg(plan.planId)
                                  .arg(plan.steps.size()));
}

} // namespace CLI
} // namespace Hawk
