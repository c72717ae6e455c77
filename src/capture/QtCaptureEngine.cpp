#include "capture/QtCaptureEngine.h"

#include <QDebug>
#include <QGuiApplication>
#include <QPixmap>
#include <QScreen>

namespace Hawk {

QtCaptureEngine::QtCaptureEngine(QObject *parent)
    : ICaptureEngine(parent)
{
}

QtCaptureEngine::~QtCaptureEngine()
{
    stop();
}

QScreen *QtCaptureEngine::screenForMonitor(int index)
{
    QScreen *primary = QGuiApplication::primaryScreen();
    if (index <= 0) {
        return primary;
    }

    const QList<QScreen *> screens = QGuiApplication::screens();
    QList<QScreen *> others;
    for (QScreen *screen : screens) {
        if (screen != primary) {
            others.append(screen);
        }
    }
    return index - 1 < others.size() ? others.at(index - 1) : nullptr;
}

bool QtCaptureEngine::setRegion(const QRect &region)
{
    if (!region.isEmpty() && (region.width() < 10 || region.height() < 10)) {
        reportError(QStringLiteral("Capture region too small (minimum 10x10 pixels)"));
        return false;
    }

    m_captureRegion = region;
    return true;
}

bool QtCaptureEngine::start()
{
    if (!screenForMonitor(m_monitorIndex)) {
        reportError(QStringLiteral("Monitor %1 is not available").arg(m_monitorIndex));
        return false;
    }

    m_running = true;
    qDebug() << "QtCaptureEngine: Started capturing monitor" << m_monitorIndex
             << "region" << m_captureRegion;
    return true;
}

void QtCaptureEngine::stop()
{
    if (m_running) {
        m_running = false;
        qDebug() << "QtCaptureEngine: Stopped";
    }
}

bool QtCaptureEngine::isRunning() const
{
    return m_running;
}

QImage QtCaptureEngine::captureFrame()
{
    if (!m_running) {
        reportError(QStringLiteral("Capture engine is not running"));
        return QImage();
    }

    // Screens can disappear between start() and now.
    QScreen *screen = screenForMonitor(m_monitorIndex);
    if (!screen) {
        reportError(QStringLiteral("Monitor %1 is not available").arg(m_monitorIndex));
        return QImage();
    }

    QPixmap pixmap;
    if (m_captureRegion.isEmpty()) {
        pixmap = screen->grabWindow(0);
    } else {
        pixmap = screen->grabWindow(0, m_captureRegion.x(), m_captureRegion.y(),
                                    m_captureRegion.width(), m_captureRegion.height());
    }

    if (pixmap.isNull()) {
        reportError(QStringLiteral("Failed to capture frame"));
        return QImage();
    }

    return pixmap.toImage();
}

} // namespace Hawk
