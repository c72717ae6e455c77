#ifndef CONFIGCOMMAND_H
#define CONFIGCOMMAND_H

#include "cli/CLICommand.h"

namespace Hawk {
namespace CLI {

/**
 * @brief Get or set configuration
 */
class ConfigCommand : public CLICommand
{
public:
    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;
};

} // namespace CLI
} // namespace Hawk

#endif // CONFIGCOMMAND_H
