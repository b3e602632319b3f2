#include "capture/RegionCaptureEngine.h"
#include "capture/CaptureGeometry.h"
#include "capture/IScreenGrabber.h"
#include "display/IDisplayProvider.h"
#include "platform/IPermissionProvider.h"
#include "utils/CoordinateHelper.h"

#include <QDebug>

RegionCaptureEngine::RegionCaptureEngine(IPermissionProvider *permissions,
                                         IDisplayProvider *displays,
                                         IScreenGrabber *grabber)
    : m_permissions(permissions)
    , m_displays(displays)
    , m_grabber(grabber)
{
}

CaptureResult RegionCaptureEngine::capture(const QRectF &captureRect, const QString &displayId)
{
    qDebug() << "RegionCaptureEngine: Capture requested" << captureRect << "display" << displayId;

    if (!m_permissions || !m_permissions->isScreenRecordingGranted()) {
        if (m_permissions) {
            m_permissions->requestScreenRecording();
        }
        qWarning() << "RegionCaptureEngine: Screen recording permission not granted";
        return CaptureResult::failure(CaptureError::PermissionDenied,
                                      QStringLiteral("Screen recording permission not granted"));
    }

    if (!CaptureGeometry::isValidCaptureRect(captureRect)) {
        qWarning() << "RegionCaptureEngine: Rejecting invalid rectangle" << captureRect;
        return CaptureResult::failure(CaptureError::NoElement,
                                      QStringLiteral("Capture rectangle out of range"));
    }

    const DisplayLayout layout = m_displays ? m_displays->currentLayout() : DisplayLayout();
    const std::optional<DisplayDescriptor> display = layout.findById(displayId);
    if (!display) {
        qWarning() << "RegionCaptureEngine: Display" << displayId << "not found";
        return CaptureResult::failure(CaptureError::NoDisplay,
                                      QStringLiteral("Display %1 not found").arg(displayId));
    }

    const QRectF displayFrame = layout.captureFrame(*display);
    const QRectF relative = CoordinateHelper::toDisplayRelative(captureRect, displayFrame);
    const QRectF clamped = CaptureGeometry::clampToDisplayBounds(relative, displayFrame.size());
    if (!CaptureGeometry::meetsMinimumCaptureSize(clamped)) {
        qWarning() << "RegionCaptureEngine: Nothing left after clamping" << relative
                   << "to" << displayFrame.size();
        return CaptureResult::failure(CaptureError::NoElement,
                                      QStringLiteral("Capture rectangle outside display"));
    }

    const QSize pixelSize = CoordinateHelper::toPixelSize(clamped.size(), display->scaleFactor);
    qDebug() << "RegionCaptureEngine: Grabbing" << clamped << "on" << display->id
             << "scale" << display->scaleFactor << "pixels" << pixelSize;

    QImage image = m_grabber ? m_grabber->grab(*display, clamped, pixelSize) : QImage();
    if (image.isNull()) {
        qWarning() << "RegionCaptureEngine: Platform capture failed";
        return CaptureResult::failure(CaptureError::CaptureFailed,
                                      QStringLiteral("Screen capture failed"));
    }

    return CaptureResult::success(image);
}
