#pragma once

#include <QByteArray>
#include <QString>
#include <optional>

namespace HoverCapture {

/**
 * @brief Persistence for hotkey binding blobs.
 *
 * The store never interprets the blob contents.
 */
class IHotkeyBindingStore
{
public:
    virtual ~IHotkeyBindingStore() = default;

    virtual std::optional<QByteArray> load(const QString &key) const = 0;
    virtual void save(const QString &key, const QByteArray &blob) = 0;
    virtual void remove(const QString &key) = 0;
};

// Blobs stored through HoverCapture::getSettings()
class SettingsHotkeyBindingStore : public IHotkeyBindingStore
{
public:
    std::optional<QByteArray> load(const QString &key) const override;
    void save(const QString &key, const QByteArray &blob) override;
    void remove(const QString &key) override;
};

}  // namespace HoverCapture
