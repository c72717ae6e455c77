#include "detection/ContourElementDetector.h"

#include <QDebug>
#include <algorithm>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace Hawk {

namespace {

cv::Mat toGrayMat(const QImage& image)
{
    QImage gray = image.convertToFormat(QImage::Format_Grayscale8);
    cv::Mat mat(gray.height(), gray.width(), CV_8UC1,
                const_cast<uchar*>(gray.constBits()), gray.bytesPerLine());
    return mat.clone();
}

double intersectionOverUnion(const QRect& a, const QRect& b)
{
    const QRect overlap = a.intersected(b);
    if (overlap.isEmpty()) {
        return 0.0;
    }
    const double overlapArea = static_cast<double>(overlap.width()) * overlap.height();
    const double unionArea = static_cast<double>(a.width()) * a.height()
        + static_cast<double>(b.width()) * b.height() - overlapArea;
    return unionArea > 0.0 ? overlapArea / unionArea : 0.0;
}

qint64 area(const BoundingBox& box)
{
    return static_cast<qint64>(box.width()) * box.height();
}

} // namespace

ContourElementDetector::ContourElementDetector() = default;

ContourElementDetector::ContourElementDetector(const Config& config)
    : m_config(config)
{
}

bool ContourElementDetector::initialize()
{
    m_initialized = true;
    qDebug() << "ContourElementDetector: Initialized successfully";
    return true;
}

ElementGraph ContourElementDetector::detect(const QImage& frame)
{
    ElementGraph graph;
    if (!m_initialized) {
        qWarning() << "ContourElementDetector: Not initialized";
        return graph;
    }
    if (frame.isNull()) {
        return graph;
    }

    QVector<QRect> boxes;
    try {
        boxes = findCandidateBoxes(frame);
    } catch (const cv::Exception& e) {
        qWarning() << "ContourElementDetector: OpenCV error:" << e.what();
        return graph;
    }

    boxes = mergeOverlapping(boxes);
    sortReadingOrder(boxes);
    if (boxes.size() > m_config.maxElements) {
        boxes.resize(m_config.maxElements);
    }

    for (int i = 0; i < boxes.size(); ++i) {
        Element element;
        element.id = QStringLiteral("elm_%1").arg(i + 1);
        element.bbox = BoundingBox::fromRect(boxes.at(i));
        element.role = classifyRole(boxes.at(i), frame.size());
        graph.elements.append(element);
    }
    graph.relationships = buildContainment(graph.elements);

    qDebug() << "ContourElementDetector: Detected" << graph.elements.size() << "elements";
    return graph;
}

QVector<QRect> ContourElementDetector::findCandidateBoxes(const QImage& frame) const
{
    const cv::Mat gray = toGrayMat(frame);

    cv::Mat edges;
    cv::Canny(gray, edges, m_config.cannyLow, m_config.cannyHigh);
    if (m_config.dilateIterations > 0) {
        const cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(3, 3));
        cv::dilate(edges, edges, kernel, cv::Point(-1, -1), m_config.dilateIterations);
    }

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(edges, contours, cv::RETR_LIST, cv::CHAIN_APPROX_SIMPLE);

    const double frameArea = static_cast<double>(frame.width()) * frame.height();
    QVector<QRect> boxes;
    for (const auto& contour : contours) {
        const cv::Rect rect = cv::boundingRect(contour);
        if (rect.width < m_config.minWidth || rect.height < m_config.minHeight) {
            continue;
        }
        if (static_cast<double>(rect.width) * rect.height > frameArea * m_config.maxAreaRatio) {
            continue;
        }
        boxes.append(QRect(rect.x, rect.y, rect.width, rect.height));
    }
    return boxes;
}

QVector<QRect> ContourElementDetector::mergeOverlapping(const QVector<QRect>& boxes) const
{
    QVector<QRect> merged;
    for (const QRect& box : boxes) {
        bool absorbed = false;
        for (QRect& existing : merged) {
            if (intersectionOverUnion(existing, box) >= m_config.mergeOverlap) {
                existing = existing.united(box);
                absorbed = true;
                break;
            }
        }
        if (!absorbed) {
            merged.append(box);
        }
    }
    return merged;
}

void ContourElementDetector::sortReadingOrder(QVector<QRect>& boxes) const
{
    const int tolerance = qMax(1, m_config.rowTolerance);
    std::stable_sort(boxes.begin(), boxes.end(), [tolerance](const QRect& a, const QRect& b) {
        const int rowA = a.y() / tolerance;
        const int rowB = b.y() / tolerance;
        if (rowA != rowB) {
            return rowA < rowB;
        }
        return a.x() < b.x();
    });
}

QString ContourElementDetector::classifyRole(const QRect& box, const QSize& frameSize)
{
    const double aspect = box.height() > 0
        ? static_cast<double>(box.width()) / box.height() : 0.0;

    if (box.width() >= frameSize.width() / 2 && box.height() >= frameSize.height() * 3 / 10) {
        return QStringLiteral("container");
    }
    if (box.height() <= 60 && aspect >= 10.0 && box.y() < frameSize.height() / 10) {
        return QStringLiteral("menu");
    }
    if (box.height() <= 60 && aspect >= 6.0) {
        return QStringLiteral("input");
    }
    if (box.height() <= 60 && aspect >= 1.5) {
        return QStringLiteral("button");
    }
    if (box.width() <= 30 && box.height() <= 30 && aspect >= 0.8 && aspect <= 1.25) {
        return QStringLiteral("checkbox");
    }
    if (box.height() <= 30) {
        return QStringLiteral("text");
    }
    return QStringLiteral("image");
}

QVector<ElementRelationship> ContourElementDetector::buildContainment(const QVector<Element>& elements)
{
    QVector<ElementRelationship> relationships;
    for (int child = 0; child < elements.size(); ++child) {
        int parent = -1;
        for (int candidate = 0; candidate < elements.size(); ++candidate) {
            if (candidate == child) {
                continue;
            }
            const BoundingBox& outer = elements.at(candidate).bbox;
            const BoundingBox& inner = elements.at(child).bbox;
            if (!outer.contains(inner) || area(outer) <= area(inner)) {
                continue;
            }
            // Direct parent only: the smallest box that contains the child.
            if (parent < 0 || area(outer) < area(elements.at(parent).bbox)) {
                parent = candidate;
            }
        }
        if (parent >= 0) {
            relationships.append({elements.at(parent).id, QStringLiteral("contains"),
                                  elements.at(child).id});
        }
    }
    return relationships;
}

} // namespace Hawk
