#ifndef TEMPLATESCOMMAND_H
#define TEMPLATESCOMMAND_H

#include "cli/CLICommand.h"

namespace Hawk {
namespace CLI {

/**
 * @brief List plan templates
 */
class TemplatesCommand : public CLICommand
{
public:
    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;
};

} // namespace CLI
} // namespace Hawk

#endif // TEMPLATESCOMMAND_H
