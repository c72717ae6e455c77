#ifndef TRACESCOMMAND_H
#define TRACESCOMMAND_H

#include "cli/CLICommand.h"

namespace Hawk {
namespace CLI {

/**
 * @brief List saved action traces
 */
class TracesCommand : public CLICommand
{
public:
    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;
};

} // namespace CLI
} // namespace Hawk

#endif // TRACESCOMMAND_H
