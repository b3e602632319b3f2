#pragma once

#include <QSettings>
#include <QString>
#include "version.h"

namespace HoverCapture {

inline constexpr const char* kOrganizationName = "HoverCapture";
inline constexpr const char* kApplicationName = HOVERCAPTURE_APP_NAME;

// Hotkey binding blobs, one key per capture mode
inline constexpr const char* kSettingsKeyElementShortcut = "elementCapture/shortcut/element";
inline constexpr const char* kSettingsKeyFullscreenShortcut = "elementCapture/shortcut/fullscreen";
inline constexpr const char* kSettingsKeyWindowShortcut = "elementCapture/shortcut/window";

inline bool isDebugSettingsNamespace()
{
    return QString::fromLatin1(HOVERCAPTURE_APP_BUNDLE_ID).endsWith(QStringLiteral(".debug"));
}

inline QString settingsApplicationName()
{
    if (isDebugSettingsNamespace()) {
        return QString::fromUtf8(kApplicationName) + QStringLiteral("-Debug");
    }
    return QString::fromUtf8(kApplicationName);
}

inline QSettings getSettings()
{
#if defined(Q_OS_WIN)
    return QSettings(QSettings::NativeFormat, QSettings::UserScope,
                     QString::fromUtf8(kOrganizationName), settingsApplicationName());
#else
    return QSettings(QString::fromUtf8(kOrganizationName), settingsApplicationName());
#endif
}

} // namespace HoverCapture
