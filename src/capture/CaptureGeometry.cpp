#include "capture/CaptureGeometry.h"
#include "Constants.h"

#include <QtMath>

using namespace HoverCapture;

std::optional<QRectF> CaptureGeometry::clampOversizedTarget(const QRectF &rect,
                                                             const QRectF &displayCaptureFrame)
{
    QRectF result = rect;
    if (rect.width() > ElementCapture::kMaxTargetDimension ||
        rect.height() > ElementCapture::kMaxTargetDimension) {
        result = rect.intersected(displayCaptureFrame);
    }

    if (result.isEmpty() || !meetsMinimumCaptureSize(result)) {
        return std::nullopt;
    }
    return result;
}

QRectF CaptureGeometry::padTarget(const QRectF &rect)
{
    const qreal p = ElementCapture::kHighlightPadding;
    return rect.adjusted(-p, -p, p, p);
}

bool CaptureGeometry::isSignificantChange(const QRectF &from, const QRectF &to, qreal tolerance)
{
    return qAbs(to.left() - from.left()) > tolerance ||
           qAbs(to.top() - from.top()) > tolerance ||
           qAbs(to.right() - from.right()) > tolerance ||
           qAbs(to.bottom() - from.bottom()) > tolerance;
}

bool CaptureGeometry::isValidCaptureRect(const QRectF &rect)
{
    return rect.width() > 0 && rect.width() < ElementCapture::kMaxCaptureDimension &&
           rect.height() > 0 && rect.height() < ElementCapture::kMaxCaptureDimension;
}

QRectF CaptureGeometry::clampToDisplayBounds(const QRectF &relativeRect, const QSizeF &displaySize)
{
    qreal x = relativeRect.x();
    qreal y = relativeRect.y();
    qreal w = relativeRect.width();
    qreal h = relativeRect.height();

    if (x < 0) {
        w += x;
        x = 0;
    }
    if (y < 0) {
        h += y;
        y = 0;
    }
    if (x > displaySize.width()) {
        x = displaySize.width();
    }
    if (y > displaySize.height()) {
        y = displaySize.height();
    }
    if (x + w > displaySize.width()) {
        w = displaySize.width() - x;
    }
    if (y + h > displaySize.height()) {
        h = displaySize.height() - y;
    }

    return QRectF(x, y, qMax<qreal>(0.0, w), qMax<qreal>(0.0, h));
}

bool CaptureGeometry::meetsMinimumCaptureSize(const QRectF &rect)
{
    return rect.width() >= ElementCapture::kMinCaptureDimension &&
           rect.height() >= ElementCapture::kMinCaptureDimension;
}
