#include "detection/LayoutElementDetector.h"

#include <QDebug>

namespace Hawk {

namespace {

Element makeElement(const QString& id, int x1, int y1, int x2, int y2,
                    const QString& text, const QString& role)
{
    Element element;
    element.id = id;
    element.bbox = BoundingBox{x1, y1, x2, y2};
    element.text = text;
    element.role = role;
    return element;
}

} // namespace

bool LayoutElementDetector::initialize()
{
    m_initialized = true;
    qDebug() << "LayoutElementDetector: Initialized";
    return true;
}

ElementGraph LayoutElementDetector::detect(const QImage& frame)
{
    if (frame.isNull()) {
        return ElementGraph();
    }
    return detectForSize(frame.width(), frame.height());
}

ElementGraph LayoutElementDetector::detectForSize(int width, int height) const
{
    ElementGraph graph;

    if (height > 100) {
        graph.elements.append(makeElement(QStringLiteral("elm_title"), 0, 0, width, 30,
                                          QStringLiteral("Application Window"),
                                          QStringLiteral("container")));
    }

    if (height > 150) {
        graph.elements.append(makeElement(QStringLiteral("elm_menubar"), 0, 30, width, 60,
                                          QStringLiteral("File Edit View Help"),
                                          QStringLiteral("menu")));
    }

    if (width > 200 && height > 200) {
        graph.elements.append(makeElement(QStringLiteral("elm_ok_btn"),
                                          width - 200, height - 60, width - 100, height - 30,
                                          QStringLiteral("OK"), QStringLiteral("button")));
        graph.elements.append(makeElement(QStringLiteral("elm_cancel_btn"),
                                          width - 100, height - 60, width - 10, height - 30,
                                          QStringLiteral("Cancel"), QStringLiteral("button")));
    }

    const bool hasContent = width > 100 && height > 200;
    if (hasContent) {
        graph.elements.append(makeElement(QStringLiteral("elm_content"),
                                          10, 70, width - 10, height - 70,
                                          QString(), QStringLiteral("container")));
    }

    if (graph.elements.size() >= 2) {
        graph.relationships.append({QStringLiteral("elm_title"), QStringLiteral("contains"),
                                    QStringLiteral("elm_menubar")});
    }

    if (hasContent) {
        for (const Element& element : graph.elements) {
            if (element.role == QLatin1String("button")) {
                graph.relationships.append({QStringLiteral("elm_content"),
                                            QStringLiteral("contains"), element.id});
            }
        }
    }

    return graph;
}

} // namespace Hawk
