#ifndef SCREENCAPTURE_H
#define SCREENCAPTURE_H

#include "capture/ICaptureEngine.h"

#include <QElapsedTimer>
#include <QImage>
#include <QJsonObject>
#include <QRect>
#include <QString>
#include <memory>

namespace Hawk {

struct ScreenshotPayload
{
    QString sessionId;
    double timestamp = 0.0;     // unix seconds
    QByteArray frame;           // base64 PNG
    QSize resolution;
    QImage image;               // decoded frame for in-process consumers

    QJsonObject toJson() const;
};

/**
 * @brief Rate-limited frame grabber in front of a capture engine.
 *
 * Consecutive captures are spaced by at least 1/fpsTarget seconds; a call
 * that arrives early sleeps for the remainder of the interval.
 */
class ScreenCapture
{
public:
    static constexpr int kDefaultFpsTarget = 30;

    explicit ScreenCapture(std::unique_ptr<ICaptureEngine> engine,
                           int fpsTarget = kDefaultFpsTarget);
    ~ScreenCapture();

    /**
     * @brief Grab one frame.
     * @param sessionId Session the payload is attributed to
     * @param payload Receives the frame
     * @param errorMessage Receives the engine error on failure
     * @param region Optional region of the monitor; empty for the whole monitor
     * @return true if a frame was captured
     */
    bool capture(const QString& sessionId, ScreenshotPayload* payload,
                 QString* errorMessage = nullptr, const QRect& region = QRect());

    void setMonitor(int index);
    void setFpsTarget(int fps);
    int fpsTarget() const { return m_fpsTarget; }
    qint64 frameIntervalUs() const;

    ICaptureEngine* engine() const { return m_engine.get(); }
    void close();

    static QByteArray encodePng(const QImage& image);

private:
    void throttle();

    std::unique_ptr<ICaptureEngine> m_engine;
    int m_fpsTarget;
    QElapsedTimer m_lastFrame;
    QRect m_activeRegion;
};

} // namespace Hawk

#endif // SCREENCAPTURE_H
