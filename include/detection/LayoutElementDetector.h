#ifndef LAYOUTELEMENTDETECTOR_H
#define LAYOUTELEMENTDETECTOR_H

#include "detection/IElementDetector.h"

namespace Hawk {

/**
 * @brief Deterministic detector that lays out a standard application window.
 *
 * The result depends only on the frame size: a title bar, a menu bar, an
 * OK/Cancel button pair and a content area appear once the frame is large
 * enough to hold them.
 */
class LayoutElementDetector : public IElementDetector
{
public:
    LayoutElementDetector() = default;

    bool initialize() override;
    bool isInitialized() const override { return m_initialized; }
    ElementGraph detect(const QImage& frame) override;
    QString name() const override { return QStringLiteral("layout"); }

    ElementGraph detectForSize(int width, int height) const;

private:
    bool m_initialized = false;
};

} // namespace Hawk

#endif // LAYOUTELEMENTDETECTOR_H
