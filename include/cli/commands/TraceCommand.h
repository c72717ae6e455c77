#ifndef TRACECOMMAND_H
#define TRACECOMMAND_H

#include "cli/CLICommand.h"

namespace Hawk {
namespace CLI {

/**
 * @brief Show one saved action trace
 */
class TraceCommand : public CLICommand
{
public:
    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;
};

} // namespace CLI
} // namespace Hawk

#endif // TRACECOMMAND_H
