#ifndef MAINAPPLICATION_H
#define MAINAPPLICATION_H

#include "capture/CaptureTypes.h"
#include "capture/QtScreenGrabber.h"
#include "capture/ResultDelivery.h"
#include "display/QtDisplayProvider.h"
#include "hotkey/HotkeyTypes.h"
#include "platform/PermissionManager.h"

#include <QObject>
#include <memory>

class QSystemTrayIcon;
class QMenu;
class QAction;
class WindowDetector;
class IElementInspector;
class RegionCaptureEngine;
class CaptureResultSink;
class CapturePreviewPopup;
class ElementHighlightOverlay;
class ElementCaptureController;

class MainApplication : public QObject
{
    Q_OBJECT

public:
    explicit MainApplication(QObject *parent = nullptr);
    ~MainApplication();

    void initialize();

    // Starts (or stops, when one is running) a capture in the given mode
    void triggerCapture(CaptureMode mode);

private slots:
    void onHotkeyAction(HoverCapture::HotkeyAction action);
    void onCaptureCompleted(const QImage &image);
    void onCaptureFailed(CaptureError error, const QString &message);
    void onActiveChanged(bool active);

private:
    void setupTrayMenu();
    void setupHotkeys();
    void updateTrayMenuHotkeyText(HoverCapture::HotkeyAction action);
    QAction *actionForHotkey(HoverCapture::HotkeyAction action) const;

    PermissionManager m_permissions;
    QtDisplayProvider m_displays;
    QtPointerSource m_pointer;
    QtScreenGrabber m_grabber;
    QtImageClipboard m_clipboard;
    QtCaptureSound m_captureSound;
    std::unique_ptr<RegionCaptureEngine> m_engine;

    QSystemTrayIcon *m_trayIcon;
    QMenu *m_trayMenu;
    QAction *m_elementCaptureAction;
    QAction *m_fullscreenCaptureAction;
    QAction *m_windowCaptureAction;
    WindowDetector *m_windowDetector;
    IElementInspector *m_elementInspector;
    CapturePreviewPopup *m_previewPopup;
    ElementHighlightOverlay *m_highlightOverlay;
    CaptureResultSink *m_resultSink;
    ElementCaptureController *m_controller;
};

#endif // MAINAPPLICATION_H
