#ifndef PROCESSUTILS_H
#define PROCESSUTILS_H

#include "sandbox/SandboxTypes.h"

#include <QProcessEnvironment>
#include <QString>
#include <QStringList>

namespace Hawk {
namespace ProcessUtils {

/**
 * @brief Run a program to completion with a hard timeout.
 *
 * The process is killed when the timeout elapses; the result then has
 * timedOut set and whatever output was produced so far.
 */
ExecResult run(const QString& program,
               const QStringList& arguments,
               int timeoutMs,
               const QProcessEnvironment& environment = QProcessEnvironment::systemEnvironment(),
               const QString& workingDirectory = QString());

// Runs command through the platform shell (/bin/sh -c, cmd.exe /C).
ExecResult runShell(const QString& command,
                    int timeoutMs,
                    const QProcessEnvironment& environment = QProcessEnvironment::systemEnvironment(),
                    const QString& workingDirectory = QString());

// POSIX single-quote escaping for building shell command lines.
QString shellQuote(const QString& argument);
QString shellJoin(const QStringList& arguments);

bool isExecutableAvailable(const QString& name);

} // namespace ProcessUtils
} // namespace Hawk

#endif // PROCESSUTILS_H
