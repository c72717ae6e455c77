#ifndef MOTORCONTROLLER_H
#define MOTORCONTROLLER_H

#include "detection/ElementTypes.h"
#include "motor/IInputDriver.h"

#include <QPoint>
#include <QString>
#include <QStringList>
#include <memory>
#include <optional>

namespace Hawk {

/**
 * @brief Mouse and keyboard actions on top of an input driver.
 *
 * Box targets are hit at their center. Every successful action is followed
 * by a short platform pause so the target UI can react. Nothing is retried.
 */
class MotorController
{
public:
    explicit MotorController(std::unique_ptr<IInputDriver> driver,
                             const QString& platform = QStringLiteral("linux"));

    static int pauseForPlatform(const QString& platform);

    bool click(const BoundingBox& target, MouseButton button = MouseButton::Left,
               QString* errorMessage = nullptr);
    bool click(const QPoint& point, MouseButton button = MouseButton::Left,
               QString* errorMessage = nullptr);
    bool doubleClick(const BoundingBox& target, QString* errorMessage = nullptr);
    bool doubleClick(const QPoint& point, QString* errorMessage = nullptr);
    bool rightClick(const BoundingBox& target, QString* errorMessage = nullptr);
    bool rightClick(const QPoint& point, QString* errorMessage = nullptr);

    bool typeText(const QString& text, QString* errorMessage = nullptr);

    /**
     * @brief Press each entry in turn.
     *
     * An entry such as "ctrl+c" is sent as one chord; other entries are
     * single keys.
     */
    bool pressKeys(const QStringList& keys, QString* errorMessage = nullptr);

    // Press all keys together as one shortcut.
    bool hotkey(const QStringList& keys, QString* errorMessage = nullptr);

    bool drag(const BoundingBox& start, const BoundingBox& end, QString* errorMessage = nullptr);
    bool scroll(int clicks, const std::optional<QPoint>& at = std::nullopt,
                QString* errorMessage = nullptr);
    bool moveTo(const QPoint& point, QString* errorMessage = nullptr);

    void wait(double seconds) const;

    IInputDriver* driver() const { return m_driver.get(); }
    QString platform() const { return m_platform; }
    int pauseMs() const { return m_pauseMs; }
    void setPauseMs(int pauseMs) { m_pauseMs = qMax(0, pauseMs); }

private:
    bool finish(bool ok) const;
    bool requireDriver(QString* errorMessage) const;

    std::unique_ptr<IInputDriver> m_driver;
    QString m_platform;
    int m_pauseMs;
};

} // namespace Hawk

#endif // MOTORCONTROLLER_H
