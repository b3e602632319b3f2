#ifndef MOCKSCREENGRABBER_H
#define MOCKSCREENGRABBER_H

#include "capture/IScreenGrabber.h"

/**
 * @brief Records grab requests and returns a solid image of the requested pixel size
 */
class MockScreenGrabber : public IScreenGrabber
{
public:
    QImage grab(const DisplayDescriptor &display,
                const QRectF &relativeRect,
                const QSize &pixelSize) override;

    // ========== Mock Control Methods ==========

    void setFails(bool fails) { m_fails = fails; }

    // ========== Spy Methods ==========

    int grabCallCount() const { return m_grabCalls; }
    DisplayDescriptor lastDisplay() const { return m_lastDisplay; }
    QRectF lastRelativeRect() const { return m_lastRelativeRect; }
    QSize lastPixelSize() const { return m_lastPixelSize; }

private:
    bool m_fails = false;
    int m_grabCalls = 0;
    DisplayDescriptor m_lastDisplay;
    QRectF m_lastRelativeRect;
    QSize m_lastPixelSize;
};

#endif // MOCKSCREENGRABBER_H
