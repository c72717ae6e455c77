#ifndef XDOTOOLINPUTDRIVER_H
#define XDOTOOLINPUTDRIVER_H

#include "motor/IInputDriver.h"

#include <QStringList>

namespace Hawk {

class ICommandRunner;

/**
 * @brief X11 input through xdotool.
 *
 * Commands go through an ICommandRunner, so the same driver works against
 * the host display and a sandbox display. The runner is not owned.
 */
class XdotoolInputDriver : public IInputDriver
{
public:
    static constexpr int kDefaultTimeoutMs = 10000;
    static constexpr int kTypeDelayMs = 50;

    explicit XdotoolInputDriver(ICommandRunner* runner, int timeoutMs = kDefaultTimeoutMs);

    QString name() const override { return QStringLiteral("xdotool"); }

    bool moveTo(const QPoint& point, QString* errorMessage) override;
    bool click(const QPoint& point, MouseButton button, int count,
               QString* errorMessage) override;
    bool typeText(const QString& text, QString* errorMessage) override;
    bool pressChord(const QStringList& keys, QString* errorMessage) override;
    bool drag(const QPoint& from, const QPoint& to, QString* errorMessage) override;
    bool scroll(int clicks, QString* errorMessage) override;

    // Argument lists, exposed for tests.
    static QStringList moveCommand(const QPoint& point);
    static QStringList clickCommand(const QPoint& point, MouseButton button, int count);
    static QStringList typeCommand(const QString& text);
    static QStringList chordCommand(const QStringList& keys);
    static QStringList dragCommand(const QPoint& from, const QPoint& to);
    static QStringList scrollCommand(int clicks);
    static int buttonNumber(MouseButton button);

private:
    bool execute(const QStringList& command, QString* errorMessage);

    ICommandRunner* m_runner;
    int m_timeoutMs;
};

} // namespace Hawk

#endif // XDOTOOLINPUTDRIVER_H
