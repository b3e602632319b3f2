#ifndef QTSCREENGRABBER_H
#define QTSCREENGRABBER_H

#include "capture/IScreenGrabber.h"

/**
 * @brief Screen grabber using QScreen::grabWindow().
 *
 * The display is looked up by name. Output is resampled when the
 * backend returns a size other than the requested pixel size.
 */
class QtScreenGrabber : public IScreenGrabber
{
public:
    QImage grab(const DisplayDescriptor &display,
                const QRectF &relativeRect,
                const QSize &pixelSize) override;
};

#endif // QTSCREENGRABBER_H
