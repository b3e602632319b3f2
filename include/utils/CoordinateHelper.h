#ifndef COORDINATEHELPER_H
#define COORDINATEHELPER_H

#include <QPoint>
#include <QPointF>
#include <QRect>
#include <QRectF>
#include <QSize>
#include <QSizeF>

class QScreen;

/**
 * CoordinateHelper - Unified coordinate conversion utilities
 *
 * Two global coordinate systems are in play:
 * - Capture space: origin at the top-left of the primary display, y grows downward.
 *   Element bounds, window frames and capture requests use it.
 * - Input space: origin at the bottom-left of the primary display, y grows upward.
 *   Pointer positions and display frames use it.
 *
 * Every display, primary or not, converts through the primary display's height.
 * Cross-display arithmetic must go through these helpers.
 */
class CoordinateHelper {
public:
    CoordinateHelper() = delete;

    // Capture space <-> input space (self-inverse reflection about the primary display)
    static QPointF toCaptureSpace(const QPointF& inputPoint, qreal primaryHeight);
    static QPointF toInputSpace(const QPointF& capturePoint, qreal primaryHeight);
    static QRectF toCaptureSpace(const QRectF& inputRect, qreal primaryHeight);
    static QRectF toInputSpace(const QRectF& captureRect, qreal primaryHeight);

    // Qt virtual-desktop coordinates <-> capture space.
    // Qt's global origin is not necessarily the primary display's top-left.
    static QPointF primaryOrigin();
    static QPointF fromQtGlobal(const QPointF& qtGlobal);
    static QRectF fromQtGlobal(const QRectF& qtGlobal);
    static QRectF toQtGlobal(const QRectF& captureRect);

    // Global capture-space rect -> rect relative to a display's capture-space frame
    static QRectF toDisplayRelative(const QRectF& captureRect, const QRectF& displayCaptureFrame);

    // Pixel extent for a logical size; rounds up so the request covers the whole area
    static QSize toPixelSize(const QSizeF& logicalSize, qreal scaleFactor);

    // Half-open containment: [left, left + width) x [top, top + height)
    static bool containsPoint(const QRectF& rect, const QPointF& point);

    // Get device pixel ratio from screen (returns 1.0 if screen is null)
    static qreal getDevicePixelRatio(QScreen* screen);

    // Physical (native) pixels to logical pixels
    static QRect toLogical(const QRect& physical, qreal dpr);
};

#endif // COORDINATEHELPER_H
