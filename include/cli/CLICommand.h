#ifndef CLICOMMAND_H
#define CLICOMMAND_H

#include "CLIResult.h"

#include <QCommandLineParser>
#include <QString>
#include <memory>

namespace Hawk {
namespace CLI {

/**
 * @brief Abstract base class for CLI commands
 */
class CLICommand
{
public:
    virtual ~CLICommand() = default;

    /**
     * @brief Command name (e.g., "run", "plan", "traces")
     */
    virtual QString name() const = 0;

    /**
     * @brief Command description for help text
     */
    virtual QString description() const = 0;

    /**
     * @brief Configure command options
     */
    virtual void setupOptions(QCommandLineParser& parser) = 0;

    /**
     * @brief Execute the command
     * @param parser Parsed command line
     * @return Execution result
     */
    virtual CLIResult execute(const QCommandLineParser& parser) = 0;

    /**
     * @brief Whether this command touches a display and needs QGuiApplication
     */
    virtual bool requiresDisplay() const { return false; }
};

using CLICommandPtr = std::unique_ptr<CLICommand>;

} // namespace CLI
} // namespace Hawk

#endif // CLICOMMAND_H
