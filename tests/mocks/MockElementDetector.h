#ifndef MOCKELEMENTDETECTOR_H
#define MOCKELEMENTDETECTOR_H

#include "detection/IElementDetector.h"

/**
 * @brief Returns a fixed graph for every frame.
 */
class MockElementDetector : public Hawk::IElementDetector
{
public:
    bool initialize() override { m_initialized = true; return true; }
    bool isInitialized() const override { return m_initialized; }
    Hawk::ElementGraph detect(const QImage& frame) override;
    QString name() const override { return QStringLiteral("mock"); }

    void setGraph(const Hawk::ElementGraph& graph) { m_graph = graph; }
    int detectCallCount() const { return m_detectCalls; }

    static Hawk::Element makeElement(const QString& id, const QString& role, const QString& text,
                                     const QRect& rect);

private:
    bool m_initialized = false;
    Hawk::ElementGraph m_graph;
    int m_detectCalls = 0;
};

#endif // MOCKELEMENTDETECTOR_H
