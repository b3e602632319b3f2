#include "utils/CoordinateHelper.h"
#include <QScreen>
#include <QGuiApplication>
#include <QtMath>

// Capture space <-> input space

QPointF CoordinateHelper::toCaptureSpace(const QPointF& inputPoint, qreal primaryHeight)
{
    return QPointF(inputPoint.x(), primaryHeight - inputPoint.y());
}

QPointF CoordinateHelper::toInputSpace(const QPointF& capturePoint, qreal primaryHeight)
{
    return QPointF(capturePoint.x(), primaryHeight - capturePoint.y());
}

QRectF CoordinateHelper::toCaptureSpace(const QRectF& inputRect, qreal primaryHeight)
{
    // The rect's bottom edge in input space becomes its top edge in capture space
    return QRectF(inputRect.x(),
                  primaryHeight - inputRect.y() - inputRect.height(),
                  inputRect.width(),
                  inputRect.height());
}

QRectF CoordinateHelper::toInputSpace(const QRectF& captureRect, qreal primaryHeight)
{
    return QRectF(captureRect.x(),
                  primaryHeight - captureRect.y() - captureRect.height(),
                  captureRect.width(),
                  captureRect.height());
}

// Qt virtual desktop <-> capture space

QPointF CoordinateHelper::primaryOrigin()
{
    QScreen* primary = QGuiApplication::primaryScreen();
    if (!primary) {
        return QPointF(0, 0);
    }
    return QPointF(primary->geometry().topLeft());
}

QPointF CoordinateHelper::fromQtGlobal(const QPointF& qtGlobal)
{
    return qtGlobal - primaryOrigin();
}

QRectF CoordinateHelper::fromQtGlobal(const QRectF& qtGlobal)
{
    return qtGlobal.translated(-primaryOrigin());
}

QRectF CoordinateHelper::toQtGlobal(const QRectF& captureRect)
{
    return captureRect.translated(primaryOrigin());
}

QRectF CoordinateHelper::toDisplayRelative(const QRectF& captureRect, const QRectF& displayCaptureFrame)
{
    return captureRect.translated(-displayCaptureFrame.topLeft());
}

QSize CoordinateHelper::toPixelSize(const QSizeF& logicalSize, qreal scaleFactor)
{
    return QSize(
        qCeil(logicalSize.width() * scaleFactor),
        qCeil(logicalSize.height() * scaleFactor)
    );
}

bool CoordinateHelper::containsPoint(const QRectF& rect, const QPointF& point)
{
    const QRectF r = rect.normalized();
    return point.x() >= r.left() && point.x() < r.left() + r.width() &&
           point.y() >= r.top() && point.y() < r.top() + r.height();
}

qreal CoordinateHelper::getDevicePixelRatio(QScreen* screen)
{
    return screen ? screen->devicePixelRatio() : 1.0;
}

QRect CoordinateHelper::toLogical(const QRect& physical, qreal dpr)
{
    if (qFuzzyIsNull(dpr)) {
        return physical;
    }
    return QRect(
        qRound(physical.x() / dpr),
        qRound(physical.y() / dpr),
        qRound(physical.width() / dpr),
        qRound(physical.height() / dpr)
    );
}
