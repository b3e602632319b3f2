#ifndef ELEMENTCAPTURECONTROLLER_H
#define ELEMENTCAPTURECONTROLLER_H

#include "capture/CaptureTypes.h"
#include "session/CaptureServices.h"
#include "session/SessionStateMachine.h"

#include <QImage>
#include <QObject>
#include <QRectF>

class CaptureSession;

/**
 * @brief Entry point for tray actions, hotkeys and the command line.
 *
 * At most one live session exists. A stopped session whose capture is
 * still in flight is kept until it finishes; a new start() always
 * creates a fresh session.
 */
class ElementCaptureController : public QObject
{
    Q_OBJECT

public:
    explicit ElementCaptureController(const CaptureServices &services, QObject *parent = nullptr);
    ~ElementCaptureController() override;

    /**
     * @brief Start a session in the given mode.
     * @return false if a session is already active
     */
    bool start(CaptureMode mode);

    void stop();

    // Hotkey semantics: stop when active, otherwise start
    void toggle(CaptureMode mode);

    bool isActive() const;
    CaptureSession *activeSession() const { return m_session; }

    // Applied to every new session
    void setCaptureDelays(int flashMs, int overlayHideMs);

signals:
    void activeChanged(bool active);
    void sessionStateChanged(SessionState state);
    void captureCompleted(const QImage &image);
    void captureFailed(CaptureError error, const QString &message);

private:
    void onSessionFinished(quint64 sessionId);

    CaptureServices m_services;
    CaptureSession *m_session = nullptr;
    quint64 m_nextSessionId = 1;
    int m_flashDelayMs = -1;
    int m_overlayHideDelayMs = -1;
};

#endif // ELEMENTCAPTURECONTROLLER_H
