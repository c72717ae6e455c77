#include "motor/MotorController.h"

#include "motor/KeyMapping.h"

#include <QDebug>
#include <QThread>

namespace Hawk {

MotorController::MotorController(std::unique_ptr<IInputDriver> driver, const QString& platform)
    : m_driver(std::move(driver))
    , m_platform(platform.toLower())
    , m_pauseMs(pauseForPlatform(platform))
{
}

int MotorController::pauseForPlatform(const QString& platform)
{
    // macOS needs longer for accessibility-routed events to land.
    if (platform.compare(QLatin1String("macos"), Qt::CaseInsensitive) == 0) {
        return 100;
    }
    return 50;
}

bool MotorController::click(const BoundingBox& target, MouseButton button, QString* errorMessage)
{
    return click(target.center(), button, errorMessage);
}

bool MotorController::click(const QPoint& point, MouseButton button, QString* errorMessage)
{
    if (!requireDriver(errorMessage)) {
        return false;
    }
    qDebug() << "MotorController: Click at" << point;
    return finish(m_driver->click(point, button, 1, errorMessage));
}

bool MotorController::doubleClick(const BoundingBox& target, QString* errorMessage)
{
    return doubleClick(target.center(), errorMessage);
}

bool MotorController::doubleClick(const QPoint& point, QString* errorMessage)
{
    if (!requireDriver(errorMessage)) {
        return false;
    }
    qDebug() << "MotorController: Double-click at" << point;
    return finish(m_driver->click(point, MouseButton::Left, 2, errorMessage));
}

bool MotorController::rightClick(const BoundingBox& target, QString* errorMessage)
{
    return click(target.center(), MouseButton::Right, errorMessage);
}

bool MotorController::rightClick(const QPoint& point, QString* errorMessage)
{
    return click(point, MouseButton::Right, errorMessage);
}

bool MotorController::typeText(const QString& text, QString* errorMessage)
{
    if (!requireDriver(errorMessage)) {
        return false;
    }
    qDebug() << "MotorController: Typing" << text.size() << "characters";
    return finish(m_driver->typeText(text, errorMessage));
}

bool MotorController::pressKeys(const QStringList& keys, QString* errorMessage)
{
    if (!requireDriver(errorMessage)) {
        return false;
    }
    if (keys.isEmpty()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("No keys to press");
        }
        return false;
    }

    for (const QString& entry : keys) {
        const QStringList chord = KeyMapping::parseChord(entry);
        if (chord.isEmpty()) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("Invalid key: \"%1\"").arg(entry);
            }
            return false;
        }
        qDebug() << "MotorController: Pressing" << chord.join(QLatin1Char('+'));
        if (!finish(m_driver->pressChord(chord, errorMessage))) {
            return false;
        }
    }
    return true;
}

bool MotorController::hotkey(const QStringList& keys, QString* errorMessage)
{
    if (!requireDriver(errorMessage)) {
        return false;
    }

    QStringList chord;
    for (const QString& key : keys) {
        chord.append(KeyMapping::parseChord(key));
    }
    if (chord.isEmpty()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("No keys to press");
        }
        return false;
    }
    qDebug() << "MotorController: Hotkey" << chord.join(QLatin1Char('+'));
    return finish(m_driver->pressChord(chord, errorMessage));
}

bool MotorController::drag(const BoundingBox& start, const BoundingBox& end, QString* errorMessage)
{
    if (!requireDriver(errorMessage)) {
        return false;
    }
    qDebug() << "MotorController: Drag from" << start.center() << "to" << end.center();
    return finish(m_driver->drag(start.center(), end.center(), errorMessage));
}

bool MotorController::scroll(int clicks, const std::optional<QPoint>& at, QString* errorMessage)
{
    if (!requireDriver(errorMessage)) {
        return false;
    }
    if (at && !m_driver->moveTo(*at, errorMessage)) {
        return false;
    }
    qDebug() << "MotorController: Scroll" << clicks;
    return finish(m_driver->scroll(clicks, errorMessage));
}

bool MotorController::moveTo(const QPoint& point, QString* errorMessage)
{
    if (!requireDriver(errorMessage)) {
        return false;
    }
    return finish(m_driver->moveTo(point, errorMessage));
}

void MotorController::wait(double seconds) const
{
    if (seconds <= 0.0) {
        return;
    }
    QThread::msleep(static_cast<unsigned long>(seconds * 1000.0));
}

bool MotorController::finish(bool ok) const
{
    if (ok && m_pauseMs > 0) {
        QThread::msleep(static_cast<unsigned long>(m_pauseMs));
    }
    return ok;
}

bool MotorController::requireDriver(QString* errorMessage) const
{
    if (m_driver) {
        return true;
    }
    if (errorMessage) {
        *errorMessage = QStringLiteral("No input driver");
    }
    return false;
}

} // namespace Hawk
