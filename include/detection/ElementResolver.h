#ifndef ELEMENTRESOLVER_H
#define ELEMENTRESOLVER_H

#include "detection/ElementTypes.h"

#include <QString>
#include <QStringList>
#include <optional>

namespace Hawk {

/**
 * @brief Finds the element a step target refers to in a freshly detected graph.
 *
 * Matching order: exact id, then the best token score against text, role
 * and id (target "file_menu" scores on "file" and "menu"). Equal scores are
 * broken by distance to the hint box, then by reading order.
 */
class ElementResolver
{
public:
    static std::optional<Element> resolve(const ElementGraph& graph,
                                          const QString& target,
                                          const BoundingBox* hint = nullptr);

    // Lower-case tokens of a target reference; "elm" prefixes are dropped
    // and "btn" is read as "button".
    static QStringList tokenize(const QString& target);

    static int score(const Element& element, const QStringList& tokens);
};

} // namespace Hawk

#endif // ELEMENTRESOLVER_H
