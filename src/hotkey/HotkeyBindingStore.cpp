#include "hotkey/HotkeyBindingStore.h"
#include "settings/Settings.h"

namespace HoverCapture {

std::optional<QByteArray> SettingsHotkeyBindingStore::load(const QString &key) const
{
    auto settings = getSettings();
    if (!settings.contains(key)) {
        return std::nullopt;
    }
    return settings.value(key).toByteArray();
}

void SettingsHotkeyBindingStore::save(const QString &key, const QByteArray &blob)
{
    auto settings = getSettings();
    settings.setValue(key, blob);
}

void SettingsHotkeyBindingStore::remove(const QString &key)
{
    auto settings = getSettings();
    settings.remove(key);
}

}  // namespace HoverCapture
