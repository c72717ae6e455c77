#ifndef ELEMENTTYPES_H
#define ELEMENTTYPES_H

#include <QJsonObject>
#include <QPoint>
#include <QRect>
#include <QString>
#include <QStringList>
#include <QVector>

namespace Hawk {

/**
 * @brief Axis aligned box in frame pixels, [x1, y1, x2, y2] with x2/y2 exclusive.
 */
struct BoundingBox
{
    int x1 = 0;
    int y1 = 0;
    int x2 = 0;
    int y2 = 0;

    int width() const { return x2 - x1; }
    int height() const { return y2 - y1; }
    bool isEmpty() const { return width() <= 0 || height() <= 0; }
    QPoint center() const { return QPoint((x1 + x2) / 2, (y1 + y2) / 2); }
    bool contains(const BoundingBox& other) const;

    QRect toRect() const { return QRect(x1, y1, width(), height()); }
    static BoundingBox fromRect(const QRect& rect);

    bool operator==(const BoundingBox& other) const
    {
        return x1 == other.x1 && y1 == other.y1 && x2 == other.x2 && y2 == other.y2;
    }
};

// Closed role set reported by detectors.
QStringList elementRoles();
bool isElementRole(const QString& role);

struct Element
{
    QString id;
    BoundingBox bbox;
    QString text;
    QString role;

    QJsonObject toJson() const;
};

struct ElementRelationship
{
    QString sourceId;
    QString relation;
    QString targetId;

    bool operator==(const ElementRelationship& other) const
    {
        return sourceId == other.sourceId && relation == other.relation
            && targetId == other.targetId;
    }
};

/**
 * @brief Elements detected in one frame.
 *
 * Ids are only meaningful inside the graph that produced them; a later
 * frame must be resolved again.
 */
struct ElementGraph
{
    QVector<Element> elements;
    QVector<ElementRelationship> relationships;

    bool isEmpty() const { return elements.isEmpty(); }
    const Element* findById(const QString& id) const;
    QVector<Element> findByRole(const QString& role) const;
    // Case-insensitive substring match on element text.
    QVector<Element> findByText(const QString& text) const;

    QJsonObject toJson() const;
};

} // namespace Hawk

#endif // ELEMENTTYPES_H
