#ifndef REGIONCAPTUREENGINE_H
#define REGIONCAPTUREENGINE_H

#include "capture/CaptureTypes.h"

#include <QRectF>
#include <QString>

class IPermissionProvider;
class IDisplayProvider;
class IScreenGrabber;

/**
 * @brief Turns a validated capture-space rectangle into an image.
 *
 * Each step is a hard gate and the first failure is returned. There is
 * no retry:
 *   1. screen-recording permission
 *   2. 0 < width, height < kMaxCaptureDimension
 *   3. display lookup by the id recorded while tracking
 *   4. conversion to display-relative coordinates
 *   5. clamp into the display bounds, at least one unit per axis
 *   6. pixel size = ceil(size * scaleFactor)
 *   7. platform grab with explicit pixel dimensions
 *
 * The collaborators are not owned and must outlive the engine.
 */
class RegionCaptureEngine
{
public:
    RegionCaptureEngine(IPermissionProvider *permissions,
                        IDisplayProvider *displays,
                        IScreenGrabber *grabber);

    CaptureResult capture(const QRectF &captureRect, const QString &displayId);

private:
    IPermissionProvider *m_permissions;
    IDisplayProvider *m_displays;
    IScreenGrabber *m_grabber;
};

#endif // REGIONCAPTUREENGINE_H
