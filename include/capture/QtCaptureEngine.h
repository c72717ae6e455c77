#ifndef QTCAPTUREENGINE_H
#define QTCAPTUREENGINE_H

#include "ICaptureEngine.h"

class QScreen;

namespace Hawk {

/**
 * @brief Capture engine for displays this process can see directly
 *
 * Uses QScreen::grabWindow(). Monitor 0 is the primary screen, the other
 * indices follow QGuiApplication::screens() with the primary skipped.
 */
class QtCaptureEngine : public ICaptureEngine
{
    Q_OBJECT

public:
    explicit QtCaptureEngine(QObject *parent = nullptr);
    ~QtCaptureEngine() override;

    bool setRegion(const QRect &region) override;
    bool start() override;
    void stop() override;
    bool isRunning() const override;
    QImage captureFrame() override;
    QString engineName() const override { return QStringLiteral("Qt Screen Grab"); }

    static QScreen *screenForMonitor(int index);

private:
    bool m_running = false;
};

} // namespace Hawk

#endif // QTCAPTUREENGINE_H
