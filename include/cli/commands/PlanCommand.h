#ifndef PLANCOMMAND_H
#define PLANCOMMAND_H

#include "cli/CLICommand.h"

namespace Hawk {
namespace CLI {

/**
 * @brief Print the plan for a goal without executing it
 */
class PlanCommand : public CLICommand
{
public:
    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;
};

} // namespace CLI
} // namespace Hawk

#endif // PLANCOMMAND_H
