/**
 * @file HotkeyManager.cpp
 * @brief HotkeyManager implementation
 */

#include "hotkey/HotkeyManager.h"

#include <QDebug>
#include <QHotkey>

namespace HoverCapture {

HotkeyManager::HotkeyManager()
    : QObject(nullptr)
{
    qRegisterMetaType<HotkeyAction>("HotkeyAction");
    qRegisterMetaType<HotkeyAction>("HoverCapture::HotkeyAction");
    qRegisterMetaType<HotkeyStatus>("HotkeyStatus");
    qRegisterMetaType<HotkeyStatus>("HoverCapture::HotkeyStatus");
}

HotkeyManager::~HotkeyManager()
{
    shutdown();
}

HotkeyManager& HotkeyManager::instance()
{
    static HotkeyManager s_instance;
    return s_instance;
}

void HotkeyManager::initialize(IHotkeyBindingStore *store)
{
    if (m_initialized) {
        return;
    }

    if (store) {
        m_store = store;
    } else {
        m_defaultStore = std::make_unique<SettingsHotkeyBindingStore>();
        m_store = m_defaultStore.get();
    }

    loadFromStore();

    for (const HotkeyMetadata &meta : kDefaultHotkeys) {
        if (!m_bindings.contains(meta.action)) {
            setStatus(meta.action, HotkeyStatus::Unset);
        } else if (registerHotkey(meta.action)) {
            setStatus(meta.action, HotkeyStatus::Registered);
        } else {
            setStatus(meta.action, HotkeyStatus::Failed);
            qWarning() << "HotkeyManager: Failed to register" << meta.displayName
                       << m_bindings.value(meta.action).toDisplayString();
        }
    }

    m_initialized = true;
}

void HotkeyManager::shutdown()
{
    if (!m_initialized) {
        return;
    }

    unregisterAllHotkeys();
    m_bindings.clear();
    m_statuses.clear();
    m_store = nullptr;
    m_defaultStore.reset();
    m_initialized = false;
}

std::optional<HotkeyBinding> HotkeyManager::binding(HotkeyAction action) const
{
    auto it = m_bindings.find(action);
    if (it == m_bindings.end()) {
        return std::nullopt;
    }
    return it.value();
}

HotkeyStatus HotkeyManager::status(HotkeyAction action) const
{
    return m_statuses.value(action, HotkeyStatus::Unset);
}

bool HotkeyManager::setBinding(HotkeyAction action, const HotkeyBinding &binding)
{
    const HotkeyMetadata *meta = metadataForAction(action);
    if (!meta || !m_store) {
        return false;
    }

    if (!binding.isValid()) {
        clearBinding(action);
        return true;
    }

    m_bindings[action] = binding;
    m_store->save(QString::fromLatin1(meta->settingsKey), binding.toBlob());
    emit bindingChanged(action);

    const bool registered = registerHotkey(action);
    setStatus(action, registered ? HotkeyStatus::Registered : HotkeyStatus::Failed);
    if (!registered) {
        qWarning() << "HotkeyManager: Failed to register" << meta->displayName
                   << binding.toDisplayString();
    }
    return registered;
}

void HotkeyManager::clearBinding(HotkeyAction action)
{
    const HotkeyMetadata *meta = metadataForAction(action);
    if (!meta) {
        return;
    }

    unregisterHotkey(action);
    m_bindings.remove(action);
    if (m_store) {
        m_store->remove(QString::fromLatin1(meta->settingsKey));
    }
    setStatus(action, HotkeyStatus::Unset);
    emit bindingChanged(action);
}

std::optional<HotkeyAction> HotkeyManager::hasConflict(const HotkeyBinding &binding,
                                                       std::optional<HotkeyAction> excludeAction) const
{
    if (!binding.isValid()) {
        return std::nullopt;
    }

    for (auto it = m_bindings.begin(); it != m_bindings.end(); ++it) {
        if (excludeAction.has_value() && it.key() == excludeAction.value()) {
            continue;
        }
        if (it.value() == binding) {
            return it.key();
        }
    }
    return std::nullopt;
}

void HotkeyManager::loadFromStore()
{
    m_bindings.clear();
    for (const HotkeyMetadata &meta : kDefaultHotkeys) {
        const std::optional<QByteArray> blob = m_store->load(QString::fromLatin1(meta.settingsKey));
        if (!blob) {
            continue;
        }
        const std::optional<HotkeyBinding> binding = HotkeyBinding::fromBlob(*blob);
        if (!binding) {
            qWarning() << "HotkeyManager: Ignoring unreadable binding for" << meta.displayName;
            continue;
        }
        m_bindings.insert(meta.action, *binding);
    }
}

bool HotkeyManager::registerHotkey(HotkeyAction action)
{
    auto it = m_bindings.find(action);
    if (it == m_bindings.end()) {
        return false;
    }

    // Remove existing instance if any
    unregisterHotkey(action);

    if (!QHotkey::isPlatformSupported()) {
        qWarning() << "HotkeyManager: Global hotkeys are not supported on this platform";
        return false;
    }

    const HotkeyBinding binding = it.value();
    auto *hotkey = new QHotkey(static_cast<Qt::Key>(binding.keyCode), binding.modifiers, true, this);
    connect(hotkey, &QHotkey::activated, this, [this, action]() {
        emit actionTriggered(action);
    });
    m_hotkeys[action] = hotkey;

    return hotkey->isRegistered();
}

void HotkeyManager::unregisterHotkey(HotkeyAction action)
{
    QHotkey* hotkey = m_hotkeys.take(action);
    if (hotkey) {
        hotkey->setRegistered(false);
        delete hotkey;
    }
}

void HotkeyManager::unregisterAllHotkeys()
{
    for (QHotkey* hotkey : m_hotkeys) {
        if (hotkey) {
            hotkey->setRegistered(false);
            delete hotkey;
        }
    }
    m_hotkeys.clear();
}

void HotkeyManager::setStatus(HotkeyAction action, HotkeyStatus status)
{
    if (m_statuses.value(action, HotkeyStatus::Unset) == status && m_statuses.contains(action)) {
        return;
    }
    m_statuses[action] = status;
    emit registrationStatusChanged(action, status);
}

}  // namespace HoverCapture
