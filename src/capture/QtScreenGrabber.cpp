#include "capture/QtScreenGrabber.h"

#include <QDebug>
#include <QGuiApplication>
#include <QPixmap>
#include <QScreen>
#include <QtMath>

namespace {

QScreen *screenByName(const QString &name)
{
    const QList<QScreen *> screens = QGuiApplication::screens();
    for (QScreen *screen : screens) {
        if (screen->name() == name) {
            return screen;
        }
    }
    return nullptr;
}

} // namespace

QImage QtScreenGrabber::grab(const DisplayDescriptor &display,
                             const QRectF &relativeRect,
                             const QSize &pixelSize)
{
    QScreen *screen = screenByName(display.id);
    if (!screen) {
        qWarning() << "QtScreenGrabber: Display" << display.id << "is no longer connected";
        return QImage();
    }

    if (pixelSize.isEmpty()) {
        qWarning() << "QtScreenGrabber: Invalid pixel size" << pixelSize;
        return QImage();
    }

    // grabWindow takes logical coordinates relative to the screen
    const int x = qFloor(relativeRect.x());
    const int y = qFloor(relativeRect.y());
    const int width = qCeil(relativeRect.right()) - x;
    const int height = qCeil(relativeRect.bottom()) - y;

    QPixmap pixmap = screen->grabWindow(0, x, y, width, height);
    if (pixmap.isNull()) {
        qWarning() << "QtScreenGrabber: grabWindow failed for" << relativeRect << "on" << display.id;
        return QImage();
    }

    QImage image = pixmap.toImage();
    if (image.size() != pixelSize) {
        image = image.scaled(pixelSize, Qt::IgnoreAspectRatio, Qt::SmoothTransformation);
    }
    image.setDevicePixelRatio(display.scaleFactor);
    return image;
}
