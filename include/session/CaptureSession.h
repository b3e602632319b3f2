#ifndef CAPTURESESSION_H
#define CAPTURESESSION_H

#include "capture/CaptureTypes.h"
#include "input/InterceptContext.h"
#include "session/CaptureServices.h"
#include "session/SessionStateMachine.h"

#include <QImage>
#include <QObject>
#include <QRectF>
#include <QString>
#include <memory>

class CancelKeyMonitor;
class ClickInterceptor;
class TargetTracker;

/**
 * @brief One capture attempt, from start request to Stopped.
 *
 * Owns the tracker, click tap and cancel-key monitor for its lifetime
 * and applies the effects returned by SessionStateMachine. Lives on
 * the GUI thread; stop() may be called from any thread.
 *
 * Callbacks carrying another session's id, or arriving in a state that
 * no longer accepts them, are ignored.
 */
class CaptureSession : public QObject
{
    Q_OBJECT

public:
    CaptureSession(quint64 sessionId,
                   CaptureMode mode,
                   const CaptureServices &services,
                   QObject *parent = nullptr);
    ~CaptureSession() override;

    quint64 sessionId() const { return m_sessionId; }
    CaptureMode mode() const { return m_mode; }
    SessionState state() const { return m_state; }

    bool hasTarget() const;
    QRectF currentTarget() const;
    QString activeDisplayId() const;

    // True from BeginCapture until the result reached the sink
    bool isCaptureInFlight() const { return m_captureInFlight; }

    // Delays between flash, overlay hide and grab (defaults 100 ms and 50 ms)
    void setCaptureDelays(int flashMs, int overlayHideMs);

    TargetTracker *tracker() const { return m_tracker; }

    void start();

    // Synchronous and idempotent; marshaled to the session thread when needed
    void stop();

    void cancel();

public slots:
    void onQualifyingClick(quint64 sessionId);
    void onInterceptionRevoked(quint64 sessionId);
    void onCancelRequested(quint64 sessionId);

signals:
    void stateChanged(SessionState state);
    void targetChanged(bool hasTarget, const QRectF &rect, const QString &displayId);
    void captureCompleted(const QImage &image);
    void captureFailed(CaptureError error, const QString &message);
    void permissionDenied();

    // Stopped and no capture left in flight; safe to delete
    void finished(quint64 sessionId);

private:
    void dispatch(SessionEvent event);
    void applyEffect(SessionEffect effect);

    void requestPermissions();
    void armTracking();
    void resolveImmediateTarget();
    void disarmInput();
    void beginCapture(bool afterFlash);
    void performCapture();
    void onTrackerTargetChanged(bool hasTarget, const QRectF &rect, const QString &displayId);
    void emitFinishedIfDone();

    const quint64 m_sessionId;
    const CaptureMode m_mode;
    CaptureServices m_services;
    SessionState m_state = SessionState::Idle;

    std::shared_ptr<InterceptContext> m_context;
    TargetTracker *m_tracker;
    ClickInterceptor *m_interceptor = nullptr;
    CancelKeyMonitor *m_keyMonitor = nullptr;

    QRectF m_captureRect;
    QString m_captureDisplayId;
    bool m_captureInFlight = false;
    bool m_flashRequested = false;
    bool m_finishedEmitted = false;

    int m_flashDelayMs;
    int m_overlayHideDelayMs;
};

#endif // CAPTURESESSION_H
