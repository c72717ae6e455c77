#include "motor/IInputDriver.h"
#include "motor/InputDriverFactory.h"
#include "motor/KeyMapping.h"

#include <QDebug>
#include <QHash>
#include <QThread>
#include <QVector>
#include <QtGlobal>

#ifdef Q_OS_WIN
#include <windows.h>

namespace Hawk {

namespace {

constexpr int kClickIntervalMs = 30;

bool sendInputs(QVector<INPUT>& inputs)
{
    if (inputs.isEmpty()) {
        return true;
    }
    const UINT sent = SendInput(static_cast<UINT>(inputs.size()), inputs.data(), sizeof(INPUT));
    return sent == static_cast<UINT>(inputs.size());
}

bool sendMouseInput(DWORD flags, DWORD mouseData = 0)
{
    INPUT input{};
    input.type = INPUT_MOUSE;
    input.mi.dwFlags = flags;
    input.mi.mouseData = mouseData;
    return SendInput(1, &input, sizeof(INPUT)) == 1;
}

INPUT keyInput(WORD virtualKey, bool keyUp)
{
    INPUT input{};
    input.type = INPUT_KEYBOARD;
    input.ki.wVk = virtualKey;
    input.ki.dwFlags = keyUp ? KEYEVENTF_KEYUP : 0;
    return input;
}

INPUT unicodeInput(wchar_t unit, bool keyUp)
{
    INPUT input{};
    input.type = INPUT_KEYBOARD;
    input.ki.wScan = unit;
    input.ki.dwFlags = KEYEVENTF_UNICODE | (keyUp ? KEYEVENTF_KEYUP : 0);
    return input;
}

bool virtualKeyFor(const QString& key, WORD* virtualKey)
{
    static const QHash<QString, WORD> keys = {
        {QStringLiteral("enter"), VK_RETURN},
        {QStringLiteral("tab"), VK_TAB},
        {QStringLiteral("esc"), VK_ESCAPE},
        {QStringLiteral("space"), VK_SPACE},
        {QStringLiteral("backspace"), VK_BACK},
        {QStringLiteral("delete"), VK_DELETE},
        {QStringLiteral("up"), VK_UP},
        {QStringLiteral("down"), VK_DOWN},
        {QStringLiteral("left"), VK_LEFT},
        {QStringLiteral("right"), VK_RIGHT},
        {QStringLiteral("home"), VK_HOME},
        {QStringLiteral("end"), VK_END},
        {QStringLiteral("pageup"), VK_PRIOR},
        {QStringLiteral("pagedown"), VK_NEXT},
        {QStringLiteral("ctrl"), VK_CONTROL},
        {QStringLiteral("alt"), VK_MENU},
        {QStringLiteral("shift"), VK_SHIFT},
        {QStringLiteral("cmd"), VK_LWIN},
        {QStringLiteral("win"), VK_LWIN},
        {QStringLiteral("+"), VK_OEM_PLUS},
    };

    const auto it = keys.constFind(key);
    if (it != keys.constEnd()) {
        *virtualKey = it.value();
        return true;
    }

    if (key.size() == 1) {
        const SHORT scan = VkKeyScanW(key.at(0).unicode());
        if (scan != -1) {
            *virtualKey = static_cast<WORD>(LOBYTE(scan));
            return true;
        }
    }

    if (key.size() >= 2 && key.size() <= 3 && key.startsWith(QLatin1Char('f'))) {
        bool ok = false;
        const int number = key.mid(1).toInt(&ok);
        if (ok && number >= 1 && number <= 24) {
            *virtualKey = static_cast<WORD>(VK_F1 + number - 1);
            return true;
        }
    }
    return false;
}

void setError(QString* errorMessage, const QString& message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
}

class Win32InputDriver final : public IInputDriver
{
public:
    QString name() const override { return QStringLiteral("win32"); }

    bool moveTo(const QPoint& point, QString* errorMessage) override
    {
        if (!SetCursorPos(point.x(), point.y())) {
            setError(errorMessage, QStringLiteral("SetCursorPos failed (error %1)").arg(GetLastError()));
            return false;
        }
        return true;
    }

    bool click(const QPoint& point, MouseButton button, int count, QString* errorMessage) override
    {
        if (count < 1) {
            setError(errorMessage, QStringLiteral("Click count must be at least 1"));
            return false;
        }
        if (!moveTo(point, errorMessage)) {
            return false;
        }

        DWORD downFlag = MOUSEEVENTF_LEFTDOWN;
        DWORD upFlag = MOUSEEVENTF_LEFTUP;
        if (button == MouseButton::Right) {
            downFlag = MOUSEEVENTF_RIGHTDOWN;
            upFlag = MOUSEEVENTF_RIGHTUP;
        } else if (button == MouseButton::Middle) {
            downFlag = MOUSEEVENTF_MIDDLEDOWN;
            upFlag = MOUSEEVENTF_MIDDLEUP;
        }

        for (int i = 0; i < count; ++i) {
            if (i > 0) {
                QThread::msleep(kClickIntervalMs);
            }
            if (!sendMouseInput(downFlag) || !sendMouseInput(upFlag)) {
                setError(errorMessage, QStringLiteral("SendInput rejected mouse click"));
                return false;
            }
        }
        return true;
    }

    bool typeText(const QString& text, QString* errorMessage) override
    {
        QVector<INPUT> inputs;
        inputs.reserve(text.size() * 2);
        for (const QChar ch : text) {
            inputs.append(unicodeInput(static_cast<wchar_t>(ch.unicode()), false));
            inputs.append(unicodeInput(static_cast<wchar_t>(ch.unicode()), true));
        }
        if (!sendInputs(inputs)) {
            setError(errorMessage, QStringLiteral("SendInput rejected text input"));
            return false;
        }
        return true;
    }

    bool pressChord(const QStringList& keys, QString* errorMessage) override
    {
        if (keys.isEmpty()) {
            setError(errorMessage, QStringLiteral("No keys to press"));
            return false;
        }

        QVector<WORD> virtualKeys;
        for (const QString& key : keys) {
            WORD virtualKey = 0;
            if (!virtualKeyFor(KeyMapping::normalizeKey(key), &virtualKey)) {
                setError(errorMessage, QStringLiteral("Unsupported key: %1").arg(key));
                return false;
            }
            virtualKeys.append(virtualKey);
        }

        QVector<INPUT> inputs;
        for (WORD virtualKey : virtualKeys) {
            inputs.append(keyInput(virtualKey, false));
        }
        for (int i = virtualKeys.size() - 1; i >= 0; --i) {
            inputs.append(keyInput(virtualKeys.at(i), true));
        }
        if (!sendInputs(inputs)) {
            setError(errorMessage, QStringLiteral("SendInput rejected key chord"));
            return false;
        }
        return true;
    }

    bool drag(const QPoint& from, const QPoint& to, QString* errorMessage) override
    {
        if (!moveTo(from, errorMessage)) {
            return false;
        }
        if (!sendMouseInput(MOUSEEVENTF_LEFTDOWN)) {
            setError(errorMessage, QStringLiteral("SendInput rejected mouse down"));
            return false;
        }
        const bool moved = moveTo(to, errorMessage);
        // Always release the button, even when the move failed.
        const bool released = sendMouseInput(MOUSEEVENTF_LEFTUP);
        if (moved && !released) {
            setError(errorMessage, QStringLiteral("SendInput rejected mouse up"));
        }
        return moved && released;
    }

    bool scroll(int clicks, QString* errorMessage) override
    {
        if (clicks == 0) {
            return true;
        }
        const int delta = clicks * WHEEL_DELTA;
        if (!sendMouseInput(MOUSEEVENTF_WHEEL, static_cast<DWORD>(delta))) {
            setError(errorMessage, QStringLiteral("SendInput rejected wheel input"));
            return false;
        }
        return true;
    }
};

} // namespace

std::unique_ptr<IInputDriver> createWin32InputDriver()
{
    return std::make_unique<Win32InputDriver>();
}

} // namespace Hawk

#endif // Q_OS_WIN
