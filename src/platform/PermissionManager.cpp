#include "platform/PermissionManager.h"

#include <QDebug>
#include <QGuiApplication>
#include <QtGlobal>

bool PermissionManager::isWaylandSession()
{
#if defined(Q_OS_LINUX)
    if (qGuiApp && QGuiApplication::platformName().startsWith(QLatin1String("wayland"))) {
        return true;
    }
    return qEnvironmentVariable("XDG_SESSION_TYPE") == QLatin1String("wayland") &&
           !qEnvironmentVariableIsSet("DISPLAY");
#else
    return false;
#endif
}

bool PermissionManager::isAccessibilityGranted() const
{
    return true;
}

bool PermissionManager::isScreenRecordingGranted() const
{
    return !isWaylandSession();
}

void PermissionManager::requestAccessibility()
{
    qDebug() << "PermissionManager: Accessibility access needs no grant on this platform";
}

void PermissionManager::requestScreenRecording()
{
    if (isWaylandSession()) {
        qWarning() << "PermissionManager: Screen capture is not available in a Wayland session;"
                   << "run under X11 or XWayland";
        return;
    }
    qDebug() << "PermissionManager: Screen recording needs no grant on this platform";
}
