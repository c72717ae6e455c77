#ifndef IINPUTDRIVER_H
#define IINPUTDRIVER_H

#include <QPoint>
#include <QString>
#include <QStringList>

namespace Hawk {

enum class MouseButton {
    Left,
    Middle,
    Right
};

/**
 * @brief Synthesizes input on one display.
 *
 * Keys are passed already normalized (see KeyMapping). Every call returns
 * false with a reason on failure; nothing is retried here.
 */
class IInputDriver
{
public:
    virtual ~IInputDriver() = default;

    virtual QString name() const = 0;

    virtual bool moveTo(const QPoint& point, QString* errorMessage) = 0;
    virtual bool click(const QPoint& point, MouseButton button, int count,
                       QString* errorMessage) = 0;
    virtual bool typeText(const QString& text, QString* errorMessage) = 0;

    /**
     * @brief Press keys together and release them in reverse order.
     */
    virtual bool pressChord(const QStringList& keys, QString* errorMessage) = 0;

    virtual bool drag(const QPoint& from, const QPoint& to, QString* errorMessage) = 0;

    /**
     * @brief Scroll the wheel; positive clicks scroll up.
     */
    virtual bool scroll(int clicks, QString* errorMessage) = 0;
};

} // namespace Hawk

#endif // IINPUTDRIVER_H
