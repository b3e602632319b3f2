#include "settings/ElementCaptureSettingsManager.h"
#include "settings/Settings.h"

#include <QtGlobal>

namespace {

int clampPreviewDurationMs(int durationMs)
{
    return qBound(ElementCaptureSettingsManager::kMinPreviewDurationMs,
                  durationMs,
                  ElementCaptureSettingsManager::kMaxPreviewDurationMs);
}

} // namespace

ElementCaptureSettingsManager& ElementCaptureSettingsManager::instance()
{
    static ElementCaptureSettingsManager instance;
    return instance;
}

bool ElementCaptureSettingsManager::isCopyToClipboardEnabled() const
{
    auto settings = HoverCapture::getSettings();
    return settings.value(kSettingsKeyCopyToClipboard, kDefaultCopyToClipboard).toBool();
}

void ElementCaptureSettingsManager::setCopyToClipboardEnabled(bool enabled)
{
    auto settings = HoverCapture::getSettings();
    settings.setValue(kSettingsKeyCopyToClipboard, enabled);
}

bool ElementCaptureSettingsManager::isPreviewEnabled() const
{
    auto settings = HoverCapture::getSettings();
    return settings.value(kSettingsKeyShowPreview, kDefaultShowPreview).toBool();
}

void ElementCaptureSettingsManager::setPreviewEnabled(bool enabled)
{
    auto settings = HoverCapture::getSettings();
    settings.setValue(kSettingsKeyShowPreview, enabled);
}

bool ElementCaptureSettingsManager::isCaptureSoundEnabled() const
{
    auto settings = HoverCapture::getSettings();
    return settings.value(kSettingsKeyPlaySound, kDefaultPlaySound).toBool();
}

void ElementCaptureSettingsManager::setCaptureSoundEnabled(bool enabled)
{
    auto settings = HoverCapture::getSettings();
    settings.setValue(kSettingsKeyPlaySound, enabled);
}

int ElementCaptureSettingsManager::loadPreviewDurationMs() const
{
    auto settings = HoverCapture::getSettings();
    bool ok = false;
    const int value = settings.value(kSettingsKeyPreviewDurationMs, kDefaultPreviewDurationMs).toInt(&ok);
    return ok ? clampPreviewDurationMs(value) : kDefaultPreviewDurationMs;
}

void ElementCaptureSettingsManager::savePreviewDurationMs(int durationMs)
{
    auto settings = HoverCapture::getSettings();
    settings.setValue(kSettingsKeyPreviewDurationMs, clampPreviewDurationMs(durationMs));
}
