#include "MockElementDetector.h"

Hawk::ElementGraph MockElementDetector::detect(const QImage& frame)
{
    ++m_detectCalls;
    if (frame.isNull()) {
        return Hawk::ElementGraph();
    }
    return m_graph;
}

Hawk::Element MockElementDetector::makeElement(const QString& id, const QString& role,
                                               const QString& text, const QRect& rect)
{
    Hawk::Element element;
    element.id = id;
    element.role = role;
    element.text = text;
    element.bbox = Hawk::BoundingBox::fromRect(rect);
    return element;
}
