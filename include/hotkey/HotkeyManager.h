/**
 * @file HotkeyManager.h
 * @brief Singleton manager for the capture-mode hotkeys
 *
 * Loads binding blobs from the store, registers them through QHotkey and
 * emits a single actionTriggered signal when any hotkey is activated.
 */

#pragma once

#include "HotkeyBindingStore.h"
#include "HotkeyTypes.h"

#include <QMap>
#include <QObject>
#include <memory>
#include <optional>

class QHotkey;

namespace HoverCapture {

/**
 * @brief Singleton manager for all application hotkeys.
 *
 * Usage:
 * @code
 * HotkeyManager::instance().initialize();
 *
 * connect(&HotkeyManager::instance(), &HotkeyManager::actionTriggered,
 *         this, &MyClass::onHotkeyAction);
 *
 * HotkeyManager::instance().setBinding(HotkeyAction::ElementCapture,
 *                                      {Qt::Key_E, Qt::ControlModifier | Qt::ShiftModifier});
 * @endcode
 */
class HotkeyManager : public QObject
{
    Q_OBJECT

public:
    static HotkeyManager& instance();

    /**
     * @brief Load bindings from the store and register them.
     *
     * @param store Binding store; QSettings-backed when null. Not owned.
     */
    void initialize(IHotkeyBindingStore *store = nullptr);

    /**
     * @brief Unregister all hotkeys. Bindings stay persisted.
     */
    void shutdown();

    bool isInitialized() const { return m_initialized; }

    std::optional<HotkeyBinding> binding(HotkeyAction action) const;
    HotkeyStatus status(HotkeyAction action) const;

    /**
     * @brief Persist and register a binding.
     * @return true if the OS accepted the registration
     */
    bool setBinding(HotkeyAction action, const HotkeyBinding &binding);

    /**
     * @brief Unregister a hotkey and remove its persisted blob.
     */
    void clearBinding(HotkeyAction action);

    /**
     * @brief Action already bound to the same key combination, if any.
     */
    std::optional<HotkeyAction> hasConflict(const HotkeyBinding &binding,
                                            std::optional<HotkeyAction> excludeAction = std::nullopt) const;

signals:
    void actionTriggered(HoverCapture::HotkeyAction action);
    void bindingChanged(HoverCapture::HotkeyAction action);
    void registrationStatusChanged(HoverCapture::HotkeyAction action, HoverCapture::HotkeyStatus status);

private:
    HotkeyManager();
    ~HotkeyManager() override;

    HotkeyManager(const HotkeyManager&) = delete;
    HotkeyManager& operator=(const HotkeyManager&) = delete;

    void loadFromStore();
    bool registerHotkey(HotkeyAction action);
    void unregisterHotkey(HotkeyAction action);
    void unregisterAllHotkeys();
    void setStatus(HotkeyAction action, HotkeyStatus status);

    IHotkeyBindingStore *m_store = nullptr;
    std::unique_ptr<IHotkeyBindingStore> m_defaultStore;
    QMap<HotkeyAction, HotkeyBinding> m_bindings;
    QMap<HotkeyAction, HotkeyStatus> m_statuses;
    QMap<HotkeyAction, QHotkey*> m_hotkeys;
    bool m_initialized = false;
};

}  // namespace HoverCapture
