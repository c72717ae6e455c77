#include "utils/ProcessUtils.h"

#include <QElapsedTimer>
#include <QProcess>
#include <QRegularExpression>
#include <QStandardPaths>

namespace Hawk {
namespace ProcessUtils {

namespace {

constexpr int kStartTimeoutMs = 5000;
constexpr int kKillWaitMs = 1000;

} // namespace

ExecResult run(const QString& program,
               const QStringList& arguments,
               int timeoutMs,
               const QProcessEnvironment& environment,
               const QString& workingDirectory)
{
    ExecResult result;
    QElapsedTimer timer;
    timer.start();

    QProcess process;
    process.setProcessEnvironment(environment);
    if (!workingDirectory.isEmpty()) {
        process.setWorkingDirectory(workingDirectory);
    }
    process.start(program, arguments);
    if (!process.waitForStarted(qMin(kStartTimeoutMs, qMax(1, timeoutMs)))) {
        result.stdErr = QStringLiteral("Failed to start %1: %2").arg(program, process.errorString());
        result.durationMs = timer.elapsed();
        return result;
    }

    const int remainingMs = qMax(1, timeoutMs - static_cast<int>(timer.elapsed()));
    if (!process.waitForFinished(remainingMs)) {
        process.kill();
        process.waitForFinished(kKillWaitMs);
        result.timedOut = true;
    }

    result.stdOut = QString::fromUtf8(process.readAllStandardOutput());
    result.stdErr = QString::fromUtf8(process.readAllStandardError());
    if (!result.timedOut) {
        if (process.exitStatus() == QProcess::CrashExit) {
            result.exitCode = -1;
            if (result.stdErr.isEmpty()) {
                result.stdErr = QStringLiteral("%1 crashed").arg(program);
            }
        } else {
            result.exitCode = process.exitCode();
        }
    }
    result.durationMs = timer.elapsed();
    return result;
}

ExecResult runShell(const QString& command,
                    int timeoutMs,
                    const QProcessEnvironment& environment,
                    const QString& workingDirectory)
{
#ifdef Q_OS_WIN
    return run(QStringLiteral("cmd.exe"), {QStringLiteral("/C"), command},
               timeoutMs, environment, workingDirectory);
#else
    return run(QStringLiteral("/bin/sh"), {QStringLiteral("-c"), command},
               timeoutMs, environment, workingDirectory);
#endif
}

QString shellQuote(const QString& argument)
{
    static const QRegularExpression safePattern(QStringLiteral("^[A-Za-z0-9_@%+=:,./-]+$"));
    if (!argument.isEmpty() && safePattern.match(argument).hasMatch()) {
        return argument;
    }
    QString quoted = argument;
    quoted.replace(QLatin1Char('\''), QStringLiteral("'\\''"));
    return QLatin1Char('\'') + quoted + QLatin1Char('\'');
}

QString shellJoin(const QStringList& arguments)
{
    QStringList quoted;
    quoted.reserve(arguments.size());
    for (const QString& argument : arguments) {
        quoted.append(shellQuote(argument));
    }
    return quoted.join(QLatin1Char(' '));
}

bool isExecutableAvailable(const QString& name)
{
    return !QStandardPaths::findExecutable(name).isEmpty();
}

} // namespace ProcessUtils
} // namespace Hawk
