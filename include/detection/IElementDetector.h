#ifndef IELEMENTDETECTOR_H
#define IELEMENTDETECTOR_H

#include "detection/ElementTypes.h"

#include <QImage>
#include <QString>

namespace Hawk {

/**
 * @brief Interface for strategies that turn a frame into an ElementGraph.
 *
 * detect() must finish in bounded time and never throw for a well-formed
 * frame; anything it cannot handle yields an empty graph.
 */
class IElementDetector
{
public:
    virtual ~IElementDetector() = default;

    /**
     * @brief Initialize the detector.
     * @return true if initialization succeeded
     */
    virtual bool initialize() = 0;

    /**
     * @brief Check if the detector is initialized and ready.
     */
    virtual bool isInitialized() const = 0;

    /**
     * @brief Detect UI elements in the given frame.
     * @param frame Captured frame
     * @return Elements and their relationships
     */
    virtual ElementGraph detect(const QImage& frame) = 0;

    virtual QString name() const = 0;
};

} // namespace Hawk

#endif // IELEMENTDETECTOR_H
