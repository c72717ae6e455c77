#include "cli/commands/ConfigCommand.h"

#include "settings/Settings.h"

#include <QSettings>
#include <QTextStream>

namespace Hawk {
namespace CLI {

namespace {

bool isSecretKey(const QString& key)
{
    return key.endsWith(QLatin1String("apiKey"), Qt::CaseInsensitive);
}

} // namespace

QString ConfigCommand::name() const { return "config"; }

QString ConfigCommand::description() const { return "Get or set configuration"; }

void ConfigCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addOption({"get", "Get setting value", "key"});
    parser.addOption({"set", "Set setting value (use with positional arg)", "key"});
    parser.addOption({"list", "List all settings"});
    parser.addOption({"reset", "Reset to default values"});
    parser.addPositionalArgument("value", "Value to set (when using --set)");
}

CLIResult ConfigCommand::execute(const QCommandLineParser& parser)
{
    QSettings settings = Hawk::getSettings();

    // --list: List all settings
    if (parser.isSet("list")) {
        QString output;
        QTextStream out(&output);
        out << "Current settings:\n";

        QStringList keys = settings.allKeys();
        keys.sort();
        for (const QString& key : keys) {
            const QString value = isSecretKey(key) ? QStringLiteral("********")
                                                   : settings.value(key).toString();
            out << QString("  %1 = %2\n").arg(key, value);
        }
        return CLIResult::success(output);
    }

    // --get: Get setting value
    if (parser.isSet("get")) {
        QString key = parser.value("get");
        if (!settings.contains(key)) {
            return CLIResult::error(
                CLIResult::Code::InvalidArguments, QString("Setting not found: %1").arg(key));
        }
        return CLIResult::success(settings.value(key).toString());
    }

    // --set: Set setting value
    if (parser.isSet("set")) {
        QString key = parser.value("set");
        QStringList positionalArgs = parser.positionalArguments();
        if (positionalArgs.isEmpty()) {
            return CLIResult::error(CLIResult::Code::InvalidArguments, "Value required for --set");
        }
        QString value = positionalArgs.first();
        settings.setValue(key, value);
        settings.sync();
        return CLIResult::success(QString("Set %1 = %2").arg(key, isSecretKey(key) ? "********" : value));
    }

    // --reset: Reset to defaults
    if (parser.isSet("reset")) {
        settings.clear();
        settings.sync();
        return CLIResult::success("Settings reset to defaults");
    }

    return CLIResult::error(CLIResult::Code::InvalidArguments,
                            "Specify --list, --get <key>, --set <key> <value> or --reset");
}

} // namespace CLI
} // namespace Hawk
