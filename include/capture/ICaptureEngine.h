#ifndef ICAPTUREENGINE_H
#define ICAPTUREENGINE_H

#include <QImage>
#include <QObject>
#include <QRect>
#include <QString>

namespace Hawk {

/**
 * @brief Abstract interface for screen capture engines
 *
 * Implementations include:
 * - QtCaptureEngine: local displays through QScreen::grabWindow()
 * - SandboxCaptureEngine: the sandbox display, grabbed through the sandbox
 *   command contract
 */
class ICaptureEngine : public QObject
{
    Q_OBJECT

public:
    explicit ICaptureEngine(QObject *parent = nullptr) : QObject(parent) {}
    virtual ~ICaptureEngine() = default;

    /**
     * @brief Select the monitor to capture
     * @param index Monitor index, 0 is the primary monitor
     */
    virtual void setMonitor(int index) { m_monitorIndex = index; }
    int monitor() const { return m_monitorIndex; }

    /**
     * @brief Restrict capture to a region of the selected monitor
     * @param region Region in monitor coordinates; an empty rect captures
     *        the whole monitor
     * @return true if the region is usable
     */
    virtual bool setRegion(const QRect &region) = 0;

    /**
     * @brief Initialize and start the capture engine
     * @return true if started successfully
     */
    virtual bool start() = 0;

    /**
     * @brief Stop the capture engine and release resources
     */
    virtual void stop() = 0;

    /**
     * @brief Check if the engine is currently running
     */
    virtual bool isRunning() const = 0;

    /**
     * @brief Capture a single frame synchronously
     * @return Captured frame, or null QImage on failure (see lastError())
     */
    virtual QImage captureFrame() = 0;

    /**
     * @brief Get the name of this capture engine
     */
    virtual QString engineName() const = 0;

    QString lastError() const { return m_lastError; }

signals:
    /**
     * @brief Emitted when a capture error occurs
     * @param message Error description
     */
    void error(const QString &message);

protected:
    void reportError(const QString &message)
    {
        m_lastError = message;
        emit error(message);
    }

    QRect m_captureRegion;
    int m_monitorIndex = 0;
    QString m_lastError;
};

} // namespace Hawk

#endif // ICAPTUREENGINE_H
