/**
 * @file HotkeyTypes.h
 * @brief Hotkey system type definitions
 *
 * One global hotkey per capture mode. Bindings are persisted as opaque
 * JSON blobs; only this header knows their layout.
 */

#pragma once

#include "capture/CaptureTypes.h"

#include <QByteArray>
#include <QKeySequence>
#include <QObject>
#include <QString>
#include <optional>

namespace HoverCapture {

/**
 * @brief Hotkey action identifiers.
 *
 * Capture actions: 100-199
 */
enum class HotkeyAction {
    None = 0,

    ElementCapture = 100,
    FullscreenCapture = 101,
    WindowCapture = 102,
};

/**
 * @brief Hotkey registration status.
 */
enum class HotkeyStatus {
    Unset,      ///< No binding stored
    Registered, ///< Successfully registered with the OS
    Failed,     ///< Registration failed (conflict with OS or other app)
};

/**
 * @brief Key plus modifiers for one global hotkey.
 */
struct HotkeyBinding {
    int keyCode = 0;                                   ///< Qt::Key
    Qt::KeyboardModifiers modifiers = Qt::NoModifier;

    bool isValid() const { return keyCode != 0 && keyCode != Qt::Key_unknown; }
    QKeySequence toKeySequence() const;
    QString toDisplayString() const;

    QByteArray toBlob() const;
    static std::optional<HotkeyBinding> fromBlob(const QByteArray &blob);

    // Parses portable text such as "Ctrl+Shift+E"; only the first chord is used
    static std::optional<HotkeyBinding> fromString(const QString &text);

    bool operator==(const HotkeyBinding &other) const
    {
        return keyCode == other.keyCode && modifiers == other.modifiers;
    }
    bool operator!=(const HotkeyBinding &other) const { return !(*this == other); }
};

/**
 * @brief Compile-time metadata for hotkey definitions.
 */
struct HotkeyMetadata {
    HotkeyAction action;
    CaptureMode mode;
    const char* displayName;
    const char* settingsKey;
};

inline constexpr HotkeyMetadata kDefaultHotkeys[] = {
    {
        HotkeyAction::ElementCapture,
        CaptureMode::Element,
        "Capture Element",
        "elementCapture/shortcut/element"      // kSettingsKeyElementShortcut
    },
    {
        HotkeyAction::FullscreenCapture,
        CaptureMode::Fullscreen,
        "Capture Screen",
        "elementCapture/shortcut/fullscreen"   // kSettingsKeyFullscreenShortcut
    },
    {
        HotkeyAction::WindowCapture,
        CaptureMode::Window,
        "Capture Window",
        "elementCapture/shortcut/window"       // kSettingsKeyWindowShortcut
    },
};

inline constexpr size_t kDefaultHotkeyCount = sizeof(kDefaultHotkeys) / sizeof(kDefaultHotkeys[0]);

inline const HotkeyMetadata* metadataForAction(HotkeyAction action)
{
    for (const HotkeyMetadata &meta : kDefaultHotkeys) {
        if (meta.action == action) {
            return &meta;
        }
    }
    return nullptr;
}

inline HotkeyAction actionForMode(CaptureMode mode)
{
    switch (mode) {
    case CaptureMode::Element:    return HotkeyAction::ElementCapture;
    case CaptureMode::Fullscreen: return HotkeyAction::FullscreenCapture;
    case CaptureMode::Window:     return HotkeyAction::WindowCapture;
    }
    return HotkeyAction::None;
}

inline QString getStatusDisplayName(HotkeyStatus status)
{
    switch (status) {
    case HotkeyStatus::Unset:      return QObject::tr("Not Set");
    case HotkeyStatus::Registered: return QObject::tr("Active");
    case HotkeyStatus::Failed:     return QObject::tr("Conflict");
    default: return QString();
    }
}

}  // namespace HoverCapture

Q_DECLARE_METATYPE(HoverCapture::HotkeyAction)
Q_DECLARE_METATYPE(HoverCapture::HotkeyStatus)
