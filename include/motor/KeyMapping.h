#ifndef KEYMAPPING_H
#define KEYMAPPING_H

#include <QString>
#include <QStringList>

namespace Hawk {
namespace KeyMapping {

/**
 * @brief Canonical lower-case name for a key.
 *
 * ENTER/RETURN -> enter, ESC/ESCAPE -> esc, CTRL/CONTROL -> ctrl,
 * CMD/COMMAND -> cmd, WIN/WINDOWS -> win; other names are lower-cased.
 */
QString normalizeKey(const QString& name);

/**
 * @brief Split a chord such as "ctrl+c" into normalized keys.
 *
 * A lone "+" is the plus key itself.
 */
QStringList parseChord(const QString& spec);

bool isModifier(const QString& normalizedKey);

// Keysym name xdotool expects for a normalized key.
QString xdotoolKeyName(const QString& normalizedKey);

} // namespace KeyMapping
} // namespace Hawk

#endif // KEYMAPPING_H
