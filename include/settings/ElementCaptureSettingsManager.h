#ifndef ELEMENTCAPTURESETTINGSMANAGER_H
#define ELEMENTCAPTURESETTINGSMANAGER_H

class ElementCaptureSettingsManager
{
public:
    static ElementCaptureSettingsManager& instance();

    bool isCopyToClipboardEnabled() const;
    void setCopyToClipboardEnabled(bool enabled);

    bool isPreviewEnabled() const;
    void setPreviewEnabled(bool enabled);

    bool isCaptureSoundEnabled() const;
    void setCaptureSoundEnabled(bool enabled);

    int loadPreviewDurationMs() const;
    void savePreviewDurationMs(int durationMs);

    static constexpr bool kDefaultCopyToClipboard = true;
    static constexpr bool kDefaultShowPreview = true;
    static constexpr bool kDefaultPlaySound = true;
    static constexpr int kDefaultPreviewDurationMs = 3000;
    static constexpr int kMinPreviewDurationMs = 1000;
    static constexpr int kMaxPreviewDurationMs = 30000;

    static constexpr const char* kSettingsGroup = "elementCapture";

private:
    ElementCaptureSettingsManager() = default;
    ~ElementCaptureSettingsManager() = default;
    ElementCaptureSettingsManager(const ElementCaptureSettingsManager&) = delete;
    ElementCaptureSettingsManager& operator=(const ElementCaptureSettingsManager&) = delete;

    static constexpr const char* kSettingsKeyCopyToClipboard =
        "elementCapture/copyToClipboard";
    static constexpr const char* kSettingsKeyShowPreview =
        "elementCapture/showPreview";
    static constexpr const char* kSettingsKeyPlaySound =
        "elementCapture/playSound";
    static constexpr const char* kSettingsKeyPreviewDurationMs =
        "elementCapture/previewDurationMs";
};

#endif // ELEMENTCAPTURESETTINGSMANAGER_H
