#include <QCoreApplication>
#include <QGuiApplication>
#include <QTextStream>
#include <cstdio>
#include <memory>

#include "cli/CLIHandler.h"
#include "settings/SandboxSettingsManager.h"
#include "version.h"

namespace {

// True when a run may end up on the host display (the Qt capture engine).
bool mayUseHostDisplay(const QStringList& arguments)
{
    const auto& sandbox = SandboxSettingsManager::instance();
    return arguments.contains(QStringLiteral("--no-sandbox"))
        || arguments.contains(QStringLiteral("--allow-unsandboxed"))
        || !sandbox.isSandboxEnabled() || sandbox.allowUnsandboxedFallback();
}

} // namespace

int main(int argc, char *argv[])
{
    QStringList arguments;
    for (int i = 0; i < argc; ++i) {
        arguments.append(QString::fromLocal8Bit(argv[i]));
    }

    Hawk::CLI::CLIHandler handler;

    // Only runs that may grab the host screen need a display connection.
    std::unique_ptr<QCoreApplication> app;
    if (handler.requiresDisplay(arguments) && mayUseHostDisplay(arguments)) {
        app = std::make_unique<QGuiApplication>(argc, argv);
    } else {
        app = std::make_unique<QCoreApplication>(argc, argv);
    }

    app->setApplicationName(HAWK_APP_NAME);
    app->setOrganizationName("Hawk");
    app->setApplicationVersion(HAWK_VERSION);

    const Hawk::CLI::CLIResult result = handler.process(arguments);

    if (!result.data.isEmpty()) {
        fwrite(result.data.constData(), 1, static_cast<size_t>(result.data.size()), stdout);
        fflush(stdout);
    }
    if (!result.message.isEmpty()) {
        QTextStream stream(result.isSuccess() ? stdout : stderr);
        stream << result.message;
        if (!result.message.endsWith('\n')) {
            stream << '\n';
        }
    }

    return static_cast<int>(result.code);
}
