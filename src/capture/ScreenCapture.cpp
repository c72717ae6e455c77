#include "capture/ScreenCapture.h"

#include <QBuffer>
#include <QDateTime>
#include <QDebug>
#include <QJsonObject>
#include <QThread>

namespace Hawk {

QJsonObject ScreenshotPayload::toJson() const
{
    QJsonObject json;
    json["session_id"] = sessionId;
    json["timestamp"] = timestamp;
    json["frame"] = QString::fromLatin1(frame);
    json["resolution"] = QJsonObject{
        {QStringLiteral("width"), resolution.width()},
        {QStringLiteral("height"), resolution.height()},
    };
    return json;
}

ScreenCapture::ScreenCapture(std::unique_ptr<ICaptureEngine> engine, int fpsTarget)
    : m_engine(std::move(engine))
    , m_fpsTarget(fpsTarget > 0 ? fpsTarget : kDefaultFpsTarget)
{
}

ScreenCapture::~ScreenCapture()
{
    close();
}

void ScreenCapture::setMonitor(int index)
{
    if (m_engine) {
        m_engine->setMonitor(index);
    }
}

void ScreenCapture::setFpsTarget(int fps)
{
    m_fpsTarget = fps > 0 ? fps : kDefaultFpsTarget;
}

qint64 ScreenCapture::frameIntervalUs() const
{
    return 1000000 / m_fpsTarget;
}

void ScreenCapture::throttle()
{
    if (!m_lastFrame.isValid()) {
        return;
    }
    const qint64 elapsedUs = m_lastFrame.nsecsElapsed() / 1000;
    const qint64 remainingUs = frameIntervalUs() - elapsedUs;
    if (remainingUs > 0) {
        QThread::usleep(static_cast<unsigned long>(remainingUs));
    }
}

QByteArray ScreenCapture::encodePng(const QImage& image)
{
    QByteArray png;
    QBuffer buffer(&png);
    buffer.open(QIODevice::WriteOnly);
    if (!image.save(&buffer, "PNG")) {
        return QByteArray();
    }
    return png;
}

bool ScreenCapture::capture(const QString& sessionId, ScreenshotPayload* payload,
                            QString* errorMessage, const QRect& region)
{
    if (!m_engine) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("No capture engine");
        }
        return false;
    }

    throttle();
    // The interval runs from the start of this attempt, failed or not.
    m_lastFrame.start();

    if (region != m_activeRegion || !m_engine->isRunning()) {
        if (!m_engine->setRegion(region)) {
            if (errorMessage) {
                *errorMessage = m_engine->lastError();
            }
            return false;
        }
        m_activeRegion = region;
    }
    if (!m_engine->isRunning() && !m_engine->start()) {
        if (errorMessage) {
            *errorMessage = m_engine->lastError();
        }
        return false;
    }

    const QImage frame = m_engine->captureFrame();
    if (frame.isNull()) {
        if (errorMessage) {
            *errorMessage = m_engine->lastError().isEmpty()
                ? QStringLiteral("Capture returned an empty frame")
                : m_engine->lastError();
        }
        return false;
    }

    const QByteArray png = encodePng(frame);
    if (png.isEmpty()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to encode frame as PNG");
        }
        return false;
    }

    if (payload) {
        payload->sessionId = sessionId;
        payload->timestamp = QDateTime::currentMSecsSinceEpoch() / 1000.0;
        payload->frame = png.toBase64();
        payload->resolution = frame.size();
        payload->image = frame;
    }
    return true;
}

void ScreenCapture::close()
{
    if (m_engine && m_engine->isRunning()) {
        m_engine->stop();
    }
}

} // namespace Hawk
