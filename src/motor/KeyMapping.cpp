#include "motor/KeyMapping.h"

#include <QHash>

namespace Hawk {
namespace KeyMapping {

QString normalizeKey(const QString& name)
{
    static const QHash<QString, QString> aliases = {
        {QStringLiteral("enter"), QStringLiteral("enter")},
        {QStringLiteral("return"), QStringLiteral("enter")},
        {QStringLiteral("tab"), QStringLiteral("tab")},
        {QStringLiteral("esc"), QStringLiteral("esc")},
        {QStringLiteral("escape"), QStringLiteral("esc")},
        {QStringLiteral("space"), QStringLiteral("space")},
        {QStringLiteral("backspace"), QStringLiteral("backspace")},
        {QStringLiteral("delete"), QStringLiteral("delete")},
        {QStringLiteral("up"), QStringLiteral("up")},
        {QStringLiteral("down"), QStringLiteral("down")},
        {QStringLiteral("left"), QStringLiteral("left")},
        {QStringLiteral("right"), QStringLiteral("right")},
        {QStringLiteral("home"), QStringLiteral("home")},
        {QStringLiteral("end"), QStringLiteral("end")},
        {QStringLiteral("pageup"), QStringLiteral("pageup")},
        {QStringLiteral("pagedown"), QStringLiteral("pagedown")},
        {QStringLiteral("ctrl"), QStringLiteral("ctrl")},
        {QStringLiteral("control"), QStringLiteral("ctrl")},
        {QStringLiteral("alt"), QStringLiteral("alt")},
        {QStringLiteral("shift"), QStringLiteral("shift")},
        {QStringLiteral("cmd"), QStringLiteral("cmd")},
        {QStringLiteral("command"), QStringLiteral("cmd")},
        {QStringLiteral("win"), QStringLiteral("win")},
        {QStringLiteral("windows"), QStringLiteral("win")},
    };

    const QString lowered = name.trimmed().toLower();
    return aliases.value(lowered, lowered);
}

QStringList parseChord(const QString& spec)
{
    const QString trimmed = spec.trimmed();
    if (trimmed == QLatin1String("+")) {
        return {QStringLiteral("+")};
    }

    QStringList keys;
    const QStringList parts = trimmed.split(QLatin1Char('+'));
    for (int i = 0; i < parts.size(); ++i) {
        const QString part = parts.at(i).trimmed();
        if (!part.isEmpty()) {
            keys.append(normalizeKey(part));
        } else if (i == parts.size() - 1 && i > 0) {
            // "ctrl++" ends with the plus key.
            keys.append(QStringLiteral("+"));
        }
    }
    return keys;
}

bool isModifier(const QString& normalizedKey)
{
    return normalizedKey == QLatin1String("ctrl") || normalizedKey == QLatin1String("alt")
        || normalizedKey == QLatin1String("shift") || normalizedKey == QLatin1String("cmd")
        || normalizedKey == QLatin1String("win");
}

QString xdotoolKeyName(const QString& normalizedKey)
{
    static const QHash<QString, QString> keysyms = {
        {QStringLiteral("enter"), QStringLiteral("Return")},
        {QStringLiteral("tab"), QStringLiteral("Tab")},
        {QStringLiteral("esc"), QStringLiteral("Escape")},
        {QStringLiteral("space"), QStringLiteral("space")},
        {QStringLiteral("backspace"), QStringLiteral("BackSpace")},
        {QStringLiteral("delete"), QStringLiteral("Delete")},
        {QStringLiteral("up"), QStringLiteral("Up")},
        {QStringLiteral("down"), QStringLiteral("Down")},
        {QStringLiteral("left"), QStringLiteral("Left")},
        {QStringLiteral("right"), QStringLiteral("Right")},
        {QStringLiteral("home"), QStringLiteral("Home")},
        {QStringLiteral("end"), QStringLiteral("End")},
        {QStringLiteral("pageup"), QStringLiteral("Page_Up")},
        {QStringLiteral("pagedown"), QStringLiteral("Page_Down")},
        {QStringLiteral("ctrl"), QStringLiteral("ctrl")},
        {QStringLiteral("alt"), QStringLiteral("alt")},
        {QStringLiteral("shift"), QStringLiteral("shift")},
        {QStringLiteral("cmd"), QStringLiteral("super")},
        {QStringLiteral("win"), QStringLiteral("super")},
        {QStringLiteral("+"), QStringLiteral("plus")},
    };
    return keysyms.value(normalizedKey, normalizedKey);
}

} // namespace KeyMapping
} // namespace Hawk
