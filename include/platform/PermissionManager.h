#ifndef PERMISSIONMANAGER_H
#define PERMISSIONMANAGER_H

#include "platform/IPermissionProvider.h"

// Platform permission state. Windows and X11 need no grants; Wayland
// sessions cannot be captured through the Qt grabber.
class PermissionManager : public IPermissionProvider
{
public:
    PermissionManager() = default;

    bool isAccessibilityGranted() const override;
    bool isScreenRecordingGranted() const override;
    void requestAccessibility() override;
    void requestScreenRecording() override;

    static bool isWaylandSession();
};

#endif // PERMISSIONMANAGER_H
