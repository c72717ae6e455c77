#ifndef CONTOURELEMENTDETECTOR_H
#define CONTOURELEMENTDETECTOR_H

#include "detection/IElementDetector.h"

#include <QVector>

namespace Hawk {

/**
 * @brief Finds rectangular UI elements from edges in the frame.
 *
 * Edges (Canny) are dilated, contours are boxed, and boxes are filtered by
 * size, merged when they overlap almost completely and classified by their
 * shape. Ids are elm_<n> in reading order (top to bottom, left to right).
 */
class ContourElementDetector : public IElementDetector
{
public:
    struct Config {
        double cannyLow = 50.0;
        double cannyHigh = 150.0;
        int dilateIterations = 1;
        int minWidth = 12;
        int minHeight = 8;
        double maxAreaRatio = 0.95;     ///< Drop boxes covering almost the whole frame
        double mergeOverlap = 0.7;      ///< IoU above which two boxes are one element
        int rowTolerance = 10;          ///< Pixels of y difference treated as the same row
        int maxElements = 200;
    };

    ContourElementDetector();
    explicit ContourElementDetector(const Config& config);

    bool initialize() override;
    bool isInitialized() const override { return m_initialized; }
    ElementGraph detect(const QImage& frame) override;
    QString name() const override { return QStringLiteral("contour"); }

    void setConfig(const Config& config) { m_config = config; }
    Config config() const { return m_config; }

    /**
     * @brief Role for a box of the given size inside a frame of the given size.
     */
    static QString classifyRole(const QRect& box, const QSize& frameSize);

private:
    QVector<QRect> findCandidateBoxes(const QImage& frame) const;
    QVector<QRect> mergeOverlapping(const QVector<QRect>& boxes) const;
    void sortReadingOrder(QVector<QRect>& boxes) const;
    static QVector<ElementRelationship> buildContainment(const QVector<Element>& elements);

    bool m_initialized = false;
    Config m_config;
};

} // namespace Hawk

#endif // CONTOURELEMENTDETECTOR_H
