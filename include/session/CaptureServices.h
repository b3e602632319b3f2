#ifndef CAPTURESERVICES_H
#define CAPTURESERVICES_H

#include <QtGlobal>
#include <functional>

class QObject;
class ClickInterceptor;
class IPermissionProvider;
class IDisplayProvider;
class IPointerSource;
class IElementInspector;
class IWindowLister;
class ITargetOverlay;
class RegionCaptureEngine;
class CaptureResultSink;

/**
 * @brief Collaborators shared by every capture session.
 *
 * Nothing here is owned by a session. The interceptor factory is
 * called once per Element session; the interceptor it returns is
 * parented to the session.
 */
struct CaptureServices {
    IPermissionProvider *permissions = nullptr;
    IDisplayProvider *displays = nullptr;
    IPointerSource *pointer = nullptr;
    IElementInspector *inspector = nullptr;    // May be null on platforms without introspection
    IWindowLister *windows = nullptr;
    ITargetOverlay *overlay = nullptr;
    RegionCaptureEngine *engine = nullptr;
    CaptureResultSink *sink = nullptr;
    std::function<ClickInterceptor *(QObject *parent)> createInterceptor;
    qint64 excludedProcessId = 0;
};

#endif // CAPTURESERVICES_H
