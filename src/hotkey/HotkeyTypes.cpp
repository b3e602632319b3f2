#include "hotkey/HotkeyTypes.h"

#include <QJsonDocument>
#include <QJsonObject>

namespace HoverCapture {

namespace {

constexpr auto kBlobKeyCode = "keyCode";
constexpr auto kBlobModifiers = "modifiers";

constexpr int kKnownModifierMask = Qt::ShiftModifier | Qt::ControlModifier |
                                   Qt::AltModifier | Qt::MetaModifier | Qt::KeypadModifier;

} // namespace

QKeySequence HotkeyBinding::toKeySequence() const
{
    if (!isValid()) {
        return QKeySequence();
    }
    return QKeySequence(QKeyCombination(modifiers, static_cast<Qt::Key>(keyCode)));
}

QString HotkeyBinding::toDisplayString() const
{
    return toKeySequence().toString(QKeySequence::NativeText);
}

QByteArray HotkeyBinding::toBlob() const
{
    QJsonObject object;
    object.insert(QLatin1String(kBlobKeyCode), keyCode);
    object.insert(QLatin1String(kBlobModifiers), static_cast<int>(modifiers.toInt()));
    return QJsonDocument(object).toJson(QJsonDocument::Compact);
}

std::optional<HotkeyBinding> HotkeyBinding::fromBlob(const QByteArray &blob)
{
    QJsonParseError error;
    const QJsonDocument document = QJsonDocument::fromJson(blob, &error);
    if (error.error != QJsonParseError::NoError || !document.isObject()) {
        return std::nullopt;
    }

    const QJsonObject object = document.object();
    if (!object.value(QLatin1String(kBlobKeyCode)).isDouble()) {
        return std::nullopt;
    }

    HotkeyBinding binding;
    binding.keyCode = object.value(QLatin1String(kBlobKeyCode)).toInt();
    const int rawModifiers = object.value(QLatin1String(kBlobModifiers)).toInt() & kKnownModifierMask;
    binding.modifiers = Qt::KeyboardModifiers(rawModifiers);

    if (!binding.isValid()) {
        return std::nullopt;
    }
    return binding;
}

std::optional<HotkeyBinding> HotkeyBinding::fromString(const QString &text)
{
    const QKeySequence sequence = QKeySequence::fromString(text.trimmed(), QKeySequence::PortableText);
    if (sequence.isEmpty()) {
        return std::nullopt;
    }

    const QKeyCombination combination = sequence[0];
    HotkeyBinding binding;
    binding.keyCode = static_cast<int>(combination.key());
    binding.modifiers = Qt::KeyboardModifiers(combination.keyboardModifiers().toInt() & kKnownModifierMask);

    if (!binding.isValid()) {
        return std::nullopt;
    }
    return binding;
}

}  // namespace HoverCapture
