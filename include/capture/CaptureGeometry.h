#ifndef CAPTUREGEOMETRY_H
#define CAPTUREGEOMETRY_H

#include <QRectF>
#include <QSize>
#include <QSizeF>
#include <optional>

/**
 * @brief Rectangle rules shared by the tracker and the capture engine.
 *
 * All functions are pure. Rectangles are in capture space unless noted.
 */
class CaptureGeometry
{
public:
    CaptureGeometry() = delete;

    /**
     * @brief Bound a hit-test result to a sane size.
     *
     * Rectangles wider or taller than kMaxTargetDimension are intersected
     * with the display frame. Smaller ones pass through unchanged.
     * @return nullopt when the intersection is empty or under one unit
     */
    static std::optional<QRectF> clampOversizedTarget(const QRectF &rect,
                                                      const QRectF &displayCaptureFrame);

    // Inflate by kHighlightPadding on every side
    static QRectF padTarget(const QRectF &rect);

    // True when any edge moved by more than tolerance
    static bool isSignificantChange(const QRectF &from, const QRectF &to, qreal tolerance);

    // 0 < width, height < kMaxCaptureDimension
    static bool isValidCaptureRect(const QRectF &rect);

    /**
     * @brief Clamp a display-relative rect into [0, w] x [0, h].
     *
     * A negative origin shrinks the size by the overflow and moves the
     * origin to zero; a far edge past the bound shrinks the size.
     * The result may be empty. Idempotent.
     */
    static QRectF clampToDisplayBounds(const QRectF &relativeRect, const QSizeF &displaySize);

    // Width and height both at least kMinCaptureDimension
    static bool meetsMinimumCaptureSize(const QRectF &rect);
};

#endif // CAPTUREGEOMETRY_H
