#include "display/DisplayLayout.h"
#include "utils/CoordinateHelper.h"

DisplayLayout::DisplayLayout(const QVector<DisplayDescriptor> &displays)
    : m_displays(displays)
{
}

std::optional<DisplayDescriptor> DisplayLayout::primary() const
{
    for (const DisplayDescriptor &display : m_displays) {
        if (display.isPrimary) {
            return display;
        }
    }
    return std::nullopt;
}

qreal DisplayLayout::primaryHeight() const
{
    auto p = primary();
    return p ? p->frame.height() : 0.0;
}

std::optional<DisplayDescriptor> DisplayLayout::displayAt(const QPointF &inputPoint) const
{
    for (const DisplayDescriptor &display : m_displays) {
        if (CoordinateHelper::containsPoint(display.frame, inputPoint)) {
            return display;
        }
    }
    return std::nullopt;
}

std::optional<DisplayDescriptor> DisplayLayout::findById(const QString &id) const
{
    if (id.isEmpty()) {
        return std::nullopt;
    }
    for (const DisplayDescriptor &display : m_displays) {
        if (display.id == id) {
            return display;
        }
    }
    return std::nullopt;
}

QRectF DisplayLayout::captureFrame(const DisplayDescriptor &display) const
{
    return CoordinateHelper::toCaptureSpace(display.frame, primaryHeight());
}
