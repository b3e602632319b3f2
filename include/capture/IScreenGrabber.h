#ifndef ISCREENGRABBER_H
#define ISCREENGRABBER_H

#include "display/DisplayLayout.h"

#include <QImage>
#include <QRectF>
#include <QSize>

/**
 * @brief Platform screen-grab primitive.
 *
 * Implementations must return an image of exactly pixelSize, or a null
 * image on failure. relativeRect is in the display's logical units,
 * origin at the display's top-left.
 */
class IScreenGrabber
{
public:
    virtual ~IScreenGrabber() = default;

    virtual QImage grab(const DisplayDescriptor &display,
                        const QRectF &relativeRect,
                        const QSize &pixelSize) = 0;
};

#endif // ISCREENGRABBER_H
