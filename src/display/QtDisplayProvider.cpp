#include "display/QtDisplayProvider.h"
#include "utils/CoordinateHelper.h"

#include <QCursor>
#include <QGuiApplication>
#include <QScreen>

DisplayLayout QtDisplayProvider::currentLayout() const
{
    QScreen *primaryScreen = QGuiApplication::primaryScreen();
    if (!primaryScreen) {
        return DisplayLayout();
    }

    const qreal primaryHeight = primaryScreen->geometry().height();

    QVector<DisplayDescriptor> displays;
    const QList<QScreen *> screens = QGuiApplication::screens();
    displays.reserve(screens.size());
    for (QScreen *screen : screens) {
        DisplayDescriptor display;
        display.id = screen->name();
        const QRectF captureFrame = CoordinateHelper::fromQtGlobal(QRectF(screen->geometry()));
        display.frame = CoordinateHelper::toInputSpace(captureFrame, primaryHeight);
        display.scaleFactor = CoordinateHelper::getDevicePixelRatio(screen);
        display.isPrimary = (screen == primaryScreen);
        displays.append(display);
    }
    return DisplayLayout(displays);
}

QPointF QtPointerSource::pointerPosition() const
{
    QScreen *primaryScreen = QGuiApplication::primaryScreen();
    const qreal primaryHeight = primaryScreen ? primaryScreen->geometry().height() : 0.0;
    // Use the pixel center so the top row of a display still reflects inside its frame
    const QPointF pixelCenter = QPointF(QCursor::pos()) + QPointF(0.5, 0.5);
    const QPointF capturePoint = CoordinateHelper::fromQtGlobal(pixelCenter);
    return CoordinateHelper::toInputSpace(capturePoint, primaryHeight);
}
