#ifndef RUNCOMMAND_H
#define RUNCOMMAND_H

#include "cli/CLICommand.h"
#include "session/SessionTypes.h"

namespace Hawk {
namespace CLI {

/**
 * @brief Plan a goal and execute it in a sandbox
 */
class RunCommand : public CLICommand
{
public:
    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;
    bool requiresDisplay() const override { return true; }

    /**
     * @brief Overlay --platform and the sandbox switches onto options.
     * @return false with a message for an unknown platform
     */
    static bool applyOptions(const QCommandLineParser& parser, SessionOptions* options,
                             QString* errorMessage);
};

} // namespace CLI
} // namespace Hawk

#endif // RUNCOMMAND_H
