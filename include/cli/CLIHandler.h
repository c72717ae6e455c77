#ifndef CLIHANDLER_H
#define CLIHANDLER_H

#include "CLICommand.h"
#include "CLIResult.h"

#include <QString>
#include <QStringList>
#include <map>
#include <memory>

namespace Hawk {
namespace CLI {

/**
 * @brief CLI handler for parsing and executing commands
 */
class CLIHandler
{
public:
    CLIHandler();
    ~CLIHandler();

    /**
     * @brief Parse and execute command line
     * @param arguments Command line arguments (including program name)
     * @return Execution result
     */
    CLIResult process(const QStringList& arguments);

    /**
     * @brief Whether the command named in arguments needs a display connection
     */
    bool requiresDisplay(const QStringList& arguments) const;

    /**
     * @brief Get main help text
     */
    QString getHelpText() const;

    /**
     * @brief Get version text
     */
    static QString getVersionText();

private:
    void registerCommands();
    CLICommand* findCommand(const QString& name) const;

    std::map<QString, CLICommandPtr> m_commands;
};

} // namespace CLI
} // namespace Hawk

#endif // CLIHANDLER_H
