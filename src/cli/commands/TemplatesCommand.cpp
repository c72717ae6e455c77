#include "cli/commands/TemplatesCommand.h"

#include "planner/TaskPlanner.h"

#include <QTextStream>

namespace Hawk {
namespace CLI {

QString TemplatesCommand::name() const { return "templates"; }

QString TemplatesCommand::description() const { return "List plan templates"; }

void TemplatesCommand::setupOptions(QCommandLineParser& /*parser*/) {}

CLIResult TemplatesCommand::execute(const QCommandLineParser& /*parser*/)
{
    const std::unique_ptr<TaskPlanner> planner = TaskPlanner::createFromSettings();

    QString output;
    QTextStream out(&output);
    out << "Templates:\n";
    for (const PlanTemplate& planTemplate : planner->templates()) {
        out << QString("  %1  %2  (%3 steps)\n")
                   .arg(planTemplate.name, -18)
                   .arg(planTemplate.pattern)
                   .arg(planTemplate.steps.size());
    }
    return CLIResult::success(output);
}

} // namespace CLI
} // namespace Hawk
