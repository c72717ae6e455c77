#include "sandbox/LocalProcessBackend.h"

#include "utils/AtomicFileWriter.h"
#include "utils/ProcessUtils.h"

#include <QDebug>
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QProcess>
#include <QThread>

#ifdef Q_OS_UNIX
#include <signal.h>
#include <sys/types.h>
#endif

namespace Hawk {

namespace {

constexpr int kLockPollMs = 100;

bool copyReplacing(const QString& source, const QString& destination, QString* errorMessage)
{
    if (!QDir().mkpath(QFileInfo(destination).absolutePath())) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to create directory for %1").arg(destination);
        }
        return false;
    }
    if (QFileInfo::exists(destination) && !QFile::remove(destination)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to replace %1").arg(destination);
        }
        return false;
    }
    if (!QFile::copy(source, destination)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to copy %1 to %2").arg(source, destination);
        }
        return false;
    }
    return true;
}

} // namespace

LocalProcessBackend::LocalProcessBackend() = default;

LocalProcessBackend::~LocalProcessBackend()
{
    stop();
}

QString LocalProcessBackend::jailPath() const
{
    return m_jail ? m_jail->path() : QString();
}

int LocalProcessBackend::findFreeDisplay(const QString& lockDirectory)
{
    for (int display = kFirstDisplay; display <= kLastDisplay; ++display) {
        if (!QFileInfo::exists(QStringLiteral("%1/.X%2-lock").arg(lockDirectory).arg(display))) {
            return display;
        }
    }
    return -1;
}

QString LocalProcessBackend::profileContents(const QString& jailPath)
{
    return QStringLiteral(
               "# Hawk sandbox profile\n"
               "include default.profile\n"
               "\n"
               "private %1\n"
               "private-dev\n"
               "private-tmp\n"
               "\n"
               "net none\n"
               "\n"
               "caps.drop all\n"
               "nonewprivs\n"
               "noroot\n"
               "nosound\n"
               "notv\n"
               "novideo\n"
               "seccomp\n"
               "\n"
               "whitelist %1\n")
        .arg(jailPath);
}

QString LocalProcessBackend::resolveJailPath(const QString& jailRoot, const QString& sandboxPath)
{
    QString relative = QDir::cleanPath(sandboxPath.trimmed());
    while (relative.startsWith(QLatin1Char('/'))) {
        relative.remove(0, 1);
    }
    if (relative.isEmpty() || relative == QLatin1String(".")
        || relative == QLatin1String("..") || relative.startsWith(QLatin1String("../"))) {
        return QString();
    }
    return QDir(jailRoot).filePath(relative);
}

bool LocalProcessBackend::start(const SandboxOptions& options, QString* errorMessage)
{
#ifndef Q_OS_LINUX
    Q_UNUSED(options);
    if (errorMessage) {
        *errorMessage = QStringLiteral("Local process sandbox requires Linux");
    }
    return false;
#else
    if (options.platform.compare(QLatin1String("linux"), Qt::CaseInsensitive) != 0) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Local process sandbox cannot host platform %1")
                                .arg(options.platform);
        }
        return false;
    }
    if (!ProcessUtils::isExecutableAvailable(QStringLiteral("Xvfb"))) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Xvfb not found");
        }
        return false;
    }
    if (!ProcessUtils::isExecutableAvailable(QStringLiteral("firejail"))) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("firejail not found");
        }
        return false;
    }

    m_jail = std::make_unique<QTemporaryDir>(QDir::tempPath() + QStringLiteral("/hawk_sandbox_XXXXXX"));
    if (!m_jail->isValid()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to create jail directory: %1").arg(m_jail->errorString());
        }
        m_jail.reset();
        return false;
    }

    m_profilePath = m_jail->filePath(QStringLiteral("hawk.profile"));
    AtomicFileWriter::Error writeError;
    if (!AtomicFileWriter::writeBytes(profileContents(m_jail->path()).toUtf8(), m_profilePath, &writeError)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to write firejail profile: %1").arg(writeError.message);
        }
        m_jail.reset();
        return false;
    }

    if (!startDisplay(options.startTimeoutMs, errorMessage)) {
        m_jail.reset();
        return false;
    }

    m_backendId = QStringLiteral("local%1").arg(m_display);
    qInfo() << "LocalProcessBackend: Started Xvfb on display" << m_display
            << "jail" << m_jail->path();
    return true;
#endif
}

bool LocalProcessBackend::startDisplay(int timeoutMs, QString* errorMessage)
{
#ifdef Q_OS_UNIX
    const int displayNumber = findFreeDisplay();
    if (displayNumber < 0) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("No free display found");
        }
        return false;
    }
    const QString display = QStringLiteral(":%1").arg(displayNumber);

    // Detached so stop() can run from any thread.
    qint64 pid = 0;
    const QStringList arguments = {
        display, QStringLiteral("-screen"), QStringLiteral("0"), QString::fromLatin1(kScreenGeometry),
        QStringLiteral("-nolisten"), QStringLiteral("tcp"),
        QStringLiteral("+extension"), QStringLiteral("GLX"), QStringLiteral("+render")
    };
    if (!QProcess::startDetached(QStringLiteral("Xvfb"), arguments, QString(), &pid) || pid <= 0) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to launch Xvfb");
        }
        return false;
    }
    m_xvfbPid = pid;

    const QString lockFile = QStringLiteral("/tmp/.X%1-lock").arg(displayNumber);
    QElapsedTimer timer;
    timer.start();
    while (!QFileInfo::exists(lockFile)) {
        if (timer.elapsed() > timeoutMs || ::kill(static_cast<pid_t>(m_xvfbPid), 0) != 0) {
            stopDisplay();
            if (errorMessage) {
                *errorMessage = QStringLiteral("Xvfb did not come up on display %1").arg(display);
            }
            return false;
        }
        QThread::msleep(kLockPollMs);
    }

    m_display = display;
    return true;
#else
    Q_UNUSED(timeoutMs);
    if (errorMessage) {
        *errorMessage = QStringLiteral("Xvfb is only supported on Unix");
    }
    return false;
#endif
}

void LocalProcessBackend::stopDisplay()
{
#ifdef Q_OS_UNIX
    if (m_xvfbPid > 0) {
        ::kill(static_cast<pid_t>(m_xvfbPid), SIGTERM);
        m_xvfbPid = 0;
    }
#endif
    m_display.clear();
}

ExecResult LocalProcessBackend::exec(const QString& command, int timeoutMs)
{
    if (!m_jail || m_display.isEmpty()) {
        return ExecResult::failure(QStringLiteral("Local sandbox is not running"));
    }

    QProcessEnvironment environment = QProcessEnvironment::systemEnvironment();
    environment.insert(QStringLiteral("DISPLAY"), m_display);
    const QStringList arguments = {
        QStringLiteral("--quiet"),
        QStringLiteral("--profile=%1").arg(m_profilePath),
        QStringLiteral("/bin/sh"), QStringLiteral("-c"), command
    };
    return ProcessUtils::run(QStringLiteral("firejail"), arguments, timeoutMs,
                             environment, m_jail->path());
}

bool LocalProcessBackend::upload(const QString& localPath, const QString& remotePath, QString* errorMessage)
{
    if (!m_jail) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Local sandbox is not running");
        }
        return false;
    }
    const QString destination = resolveJailPath(m_jail->path(), remotePath);
    if (destination.isEmpty()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Path escapes the sandbox: %1").arg(remotePath);
        }
        return false;
    }
    return copyReplacing(localPath, destination, errorMessage);
}

bool LocalProcessBackend::download(const QString& remotePath, const QString& localPath, QString* errorMessage)
{
    if (!m_jail) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Local sandbox is not running");
        }
        return false;
    }
    const QString source = resolveJailPath(m_jail->path(), remotePath);
    if (source.isEmpty() || !QFileInfo::exists(source)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("File not found in sandbox: %1").arg(remotePath);
        }
        return false;
    }
    return copyReplacing(source, localPath, errorMessage);
}

void LocalProcessBackend::stop()
{
    if (!m_jail && m_xvfbPid == 0) {
        return;
    }
    qInfo() << "LocalProcessBackend: Stopping sandbox" << m_backendId;
    stopDisplay();
    m_jail.reset();
    m_profilePath.clear();
}

} // namespace Hawk
