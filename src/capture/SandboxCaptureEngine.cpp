#include "capture/SandboxCaptureEngine.h"

#include "sandbox/CommandRunner.h"

#include <QDebug>

namespace Hawk {

SandboxCaptureEngine::SandboxCaptureEngine(ICommandRunner *runner, int timeoutMs, QObject *parent)
    : ICaptureEngine(parent)
    , m_runner(runner)
    , m_timeoutMs(timeoutMs > 0 ? timeoutMs : kCaptureTimeoutMs)
{
}

SandboxCaptureEngine::~SandboxCaptureEngine()
{
    stop();
}

QStringList SandboxCaptureEngine::captureCommand(const QRect &region)
{
    QString pipeline = QStringLiteral("import -window root");
    if (!region.isEmpty()) {
        pipeline += QStringLiteral(" -crop %1x%2+%3+%4 +repage")
                        .arg(region.width()).arg(region.height())
                        .arg(region.x()).arg(region.y());
    }
    pipeline += QStringLiteral(" png:- | base64 -w0");
    return {QStringLiteral("sh"), QStringLiteral("-c"), pipeline};
}

QImage SandboxCaptureEngine::decodeFrame(const QByteArray &base64Png)
{
    const QByteArray png = QByteArray::fromBase64(base64Png.trimmed());
    QImage image;
    if (png.isEmpty() || !image.loadFromData(png, "PNG")) {
        return QImage();
    }
    return image;
}

bool SandboxCaptureEngine::setRegion(const QRect &region)
{
    if (!region.isEmpty() && (region.x() < 0 || region.y() < 0)) {
        reportError(QStringLiteral("Capture region must not have negative coordinates"));
        return false;
    }
    m_captureRegion = region;
    return true;
}

bool SandboxCaptureEngine::start()
{
    if (!m_runner) {
        reportError(QStringLiteral("No command runner configured"));
        return false;
    }
    if (m_monitorIndex != 0) {
        reportError(QStringLiteral("Sandbox displays only have monitor 0"));
        return false;
    }
    m_running = true;
    qDebug() << "SandboxCaptureEngine: Started";
    return true;
}

void SandboxCaptureEngine::stop()
{
    if (m_running) {
        m_running = false;
        qDebug() << "SandboxCaptureEngine: Stopped";
    }
}

bool SandboxCaptureEngine::isRunning() const
{
    return m_running;
}

QImage SandboxCaptureEngine::captureFrame()
{
    if (!m_running) {
        reportError(QStringLiteral("Capture engine is not running"));
        return QImage();
    }

    const ExecResult result = m_runner->run(captureCommand(m_captureRegion), m_timeoutMs);
    if (!result.succeeded()) {
        reportError(QStringLiteral("Sandbox capture failed: %1").arg(result.errorSummary()));
        return QImage();
    }

    QImage frame = decodeFrame(result.stdOut.toLatin1());
    if (frame.isNull()) {
        reportError(QStringLiteral("Sandbox capture returned no decodable image"));
        return QImage();
    }
    return frame;
}

} // namespace Hawk
