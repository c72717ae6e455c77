#include "motor/XdotoolInputDriver.h"

#include "motor/KeyMapping.h"
#include "sandbox/CommandRunner.h"

#include <QDebug>
#include <QtGlobal>

namespace Hawk {

namespace {

const QString kXdotool = QStringLiteral("xdotool");

QStringList pointArguments(const QPoint& point)
{
    return {QString::number(point.x()), QString::number(point.y())};
}

} // namespace

XdotoolInputDriver::XdotoolInputDriver(ICommandRunner* runner, int timeoutMs)
    : m_runner(runner)
    , m_timeoutMs(timeoutMs)
{
}

int XdotoolInputDriver::buttonNumber(MouseButton button)
{
    switch (button) {
    case MouseButton::Left:
        return 1;
    case MouseButton::Middle:
        return 2;
    case MouseButton::Right:
        return 3;
    }
    return 1;
}

QStringList XdotoolInputDriver::moveCommand(const QPoint& point)
{
    return QStringList{kXdotool, QStringLiteral("mousemove"), QStringLiteral("--sync")}
        + pointArguments(point);
}

QStringList XdotoolInputDriver::clickCommand(const QPoint& point, MouseButton button, int count)
{
    QStringList command = moveCommand(point);
    command << QStringLiteral("click");
    if (count > 1) {
        command << QStringLiteral("--repeat") << QString::number(count);
    }
    command << QString::number(buttonNumber(button));
    return command;
}

QStringList XdotoolInputDriver::typeCommand(const QString& text)
{
    // "--" keeps text that starts with a dash from being read as an option.
    return {kXdotool, QStringLiteral("type"), QStringLiteral("--delay"),
            QString::number(kTypeDelayMs), QStringLiteral("--"), text};
}

QStringList XdotoolInputDriver::chordCommand(const QStringList& keys)
{
    QStringList keysyms;
    for (const QString& key : keys) {
        keysyms.append(KeyMapping::xdotoolKeyName(KeyMapping::normalizeKey(key)));
    }
    return {kXdotool, QStringLiteral("key"), QStringLiteral("--clearmodifiers"),
            keysyms.join(QLatin1Char('+'))};
}

QStringList XdotoolInputDriver::dragCommand(const QPoint& from, const QPoint& to)
{
    QStringList command = moveCommand(from);
    command << QStringLiteral("mousedown") << QStringLiteral("1");
    command << QStringLiteral("mousemove") << QStringLiteral("--sync") << pointArguments(to);
    command << QStringLiteral("mouseup") << QStringLiteral("1");
    return command;
}

QStringList XdotoolInputDriver::scrollCommand(int clicks)
{
    // X11 maps wheel up to button 4 and wheel down to button 5.
    const QString button = clicks >= 0 ? QStringLiteral("4") : QStringLiteral("5");
    return {kXdotool, QStringLiteral("click"), QStringLiteral("--repeat"),
            QString::number(qAbs(clicks)), button};
}

bool XdotoolInputDriver::moveTo(const QPoint& point, QString* errorMessage)
{
    return execute(moveCommand(point), errorMessage);
}

bool XdotoolInputDriver::click(const QPoint& point, MouseButton button, int count,
                               QString* errorMessage)
{
    if (count < 1) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Click count must be at least 1");
        }
        return false;
    }
    return execute(clickCommand(point, button, count), errorMessage);
}

bool XdotoolInputDriver::typeText(const QString& text, QString* errorMessage)
{
    if (text.isEmpty()) {
        return true;
    }
    return execute(typeCommand(text), errorMessage);
}

bool XdotoolInputDriver::pressChord(const QStringList& keys, QString* errorMessage)
{
    if (keys.isEmpty()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("No keys to press");
        }
        return false;
    }
    return execute(chordCommand(keys), errorMessage);
}

bool XdotoolInputDriver::drag(const QPoint& from, const QPoint& to, QString* errorMessage)
{
    return execute(dragCommand(from, to), errorMessage);
}

bool XdotoolInputDriver::scroll(int clicks, QString* errorMessage)
{
    if (clicks == 0) {
        return true;
    }
    return execute(scrollCommand(clicks), errorMessage);
}

bool XdotoolInputDriver::execute(const QStringList& command, QString* errorMessage)
{
    if (!m_runner) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("No command runner");
        }
        return false;
    }

    const ExecResult result = m_runner->run(command, m_timeoutMs);
    if (result.succeeded()) {
        return true;
    }

    const QString summary = result.errorSummary();
    qWarning() << "XdotoolInputDriver:" << command.value(1) << "failed:" << summary;
    if (errorMessage) {
        *errorMessage = QStringLiteral("xdotool %1 failed: %2").arg(command.value(1), summary);
    }
    return false;
}

} // namespace Hawk
