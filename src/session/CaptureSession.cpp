#include "session/CaptureSession.h"
#include "Constants.h"
#include "capture/CaptureResultSink.h"
#include "capture/RegionCaptureEngine.h"
#include "input/CancelKeyMonitor.h"
#include "input/ClickInterceptor.h"
#include "platform/IPermissionProvider.h"
#include "session/ITargetOverlay.h"
#include "tracking/TargetTracker.h"

#include <QDebug>
#include <QMetaObject>
#include <QThread>
#include <QTimer>

CaptureSession::CaptureSession(quint64 sessionId,
                               CaptureMode mode,
                               const CaptureServices &services,
                               QObject *parent)
    : QObject(parent)
    , m_sessionId(sessionId)
    , m_mode(mode)
    , m_services(services)
    , m_context(std::make_shared<InterceptContext>(sessionId))
    , m_tracker(new TargetTracker(services.displays, services.pointer,
                                  services.inspector, services.windows, this))
    , m_flashDelayMs(HoverCapture::Timer::kFlashBeforeCapture)
    , m_overlayHideDelayMs(HoverCapture::Timer::kOverlayHideBeforeCapture)
{
    m_tracker->setExcludedProcessId(services.excludedProcessId);
    connect(m_tracker, &TargetTracker::targetChanged,
            this, &CaptureSession::onTrackerTargetChanged);
}

CaptureSession::~CaptureSession()
{
    disarmInput();
}

bool CaptureSession::hasTarget() const
{
    return m_tracker->hasTarget();
}

QRectF CaptureSession::currentTarget() const
{
    return m_tracker->currentTarget();
}

QString CaptureSession::activeDisplayId() const
{
    return m_tracker->activeDisplayId();
}

void CaptureSession::setCaptureDelays(int flashMs, int overlayHideMs)
{
    m_flashDelayMs = qMax(0, flashMs);
    m_overlayHideDelayMs = qMax(0, overlayHideMs);
}

void CaptureSession::start()
{
    dispatch(SessionEvent::Start);
}

void CaptureSession::stop()
{
    if (QThread::currentThread() != thread()) {
        QMetaObject::invokeMethod(this, [this]() { stop(); }, Qt::BlockingQueuedConnection);
        return;
    }
    dispatch(SessionEvent::Stop);
}

void CaptureSession::cancel()
{
    dispatch(SessionEvent::Cancel);
}

void CaptureSession::onQualifyingClick(quint64 sessionId)
{
    if (sessionId != m_sessionId) {
        qDebug() << "CaptureSession: Ignoring click for stale session" << sessionId;
        return;
    }
    dispatch(SessionEvent::Click);
}

void CaptureSession::onInterceptionRevoked(quint64 sessionId)
{
    if (sessionId != m_sessionId) {
        return;
    }
    qWarning() << "CaptureSession: Click interception revoked, stopping session" << m_sessionId;
    dispatch(SessionEvent::InterceptionRevoked);
}

void CaptureSession::onCancelRequested(quint64 sessionId)
{
    if (sessionId != m_sessionId) {
        return;
    }
    dispatch(SessionEvent::Cancel);
}

void CaptureSession::dispatch(SessionEvent event)
{
    bool permissionsGranted = true;
    if (event == SessionEvent::Start) {
        IPermissionProvider *permissions = m_services.permissions;
        permissionsGranted = permissions && permissions->isAccessibilityGranted() &&
                             permissions->isScreenRecordingGranted();
    }

    const SessionTransition transition = SessionStateMachine::transition(
        m_state, m_mode, event, permissionsGranted, m_tracker->hasTarget());
    if (!transition.accepted) {
        qDebug() << "CaptureSession:" << SessionStateMachine::eventName(event)
                 << "ignored in" << SessionStateMachine::stateName(m_state);
        return;
    }

    const bool changed = transition.next != m_state;
    if (changed) {
        qDebug() << "CaptureSession:" << m_sessionId << SessionStateMachine::stateName(m_state)
                 << "->" << SessionStateMachine::stateName(transition.next)
                 << "on" << SessionStateMachine::eventName(event);
    }
    m_state = transition.next;

    if (m_state == SessionState::Tracking) {
        m_context->armed.store(true);
    }
    if (changed) {
        emit stateChanged(m_state);
    }

    // Effects may dispatch follow-up events (Armed, TargetResolved, ...)
    for (SessionEffect effect : transition.effects) {
        applyEffect(effect);
    }

    emitFinishedIfDone();
}

void CaptureSession::applyEffect(SessionEffect effect)
{
    switch (effect) {
    case SessionEffect::RequestPermissions:
        requestPermissions();
        break;
    case SessionEffect::ArmTracking:
        armTracking();
        break;
    case SessionEffect::ResolveImmediateTarget:
        resolveImmediateTarget();
        break;
    case SessionEffect::DisarmInput:
        disarmInput();
        break;
    case SessionEffect::FlashOverlay:
        if (m_services.overlay) {
            m_services.overlay->flash();
        }
        m_flashRequested = true;
        break;
    case SessionEffect::HideOverlay:
        if (m_services.overlay) {
            m_services.overlay->deactivate();
        }
        break;
    case SessionEffect::BeginCapture:
        beginCapture(m_flashRequested);
        break;
    }
}

void CaptureSession::requestPermissions()
{
    IPermissionProvider *permissions = m_services.permissions;
    if (permissions) {
        if (!permissions->isAccessibilityGranted()) {
            qDebug() << "CaptureSession: Requesting accessibility permission";
            permissions->requestAccessibility();
        }
        if (!permissions->isScreenRecordingGranted()) {
            qDebug() << "CaptureSession: Requesting screen recording permission";
            permissions->requestScreenRecording();
        }
    }
    emit permissionDenied();
}

void CaptureSession::armTracking()
{
    if (m_services.createInterceptor) {
        m_interceptor = m_services.createInterceptor(this);
    }
    if (!m_interceptor) {
        qWarning() << "CaptureSession: Click interception is not available on this platform";
        dispatch(SessionEvent::ArmingFailed);
        return;
    }
    connect(m_interceptor, &ClickInterceptor::qualifyingClick,
            this, &CaptureSession::onQualifyingClick);
    connect(m_interceptor, &ClickInterceptor::interceptionRevoked,
            this, &CaptureSession::onInterceptionRevoked);

    if (!m_interceptor->install(m_context)) {
        dispatch(SessionEvent::ArmingFailed);
        return;
    }

    m_keyMonitor = new CancelKeyMonitor(this);
    connect(m_keyMonitor, &CancelKeyMonitor::cancelRequested,
            this, &CaptureSession::onCancelRequested);
    if (!m_keyMonitor->install(m_sessionId)) {
        dispatch(SessionEvent::ArmingFailed);
        return;
    }

    if (m_services.overlay) {
        m_services.overlay->activate();
    }
    m_tracker->start();
    qDebug() << "CaptureSession: Armed session" << m_sessionId;
    dispatch(SessionEvent::Armed);

    // Show the first target without waiting for the timer
    if (m_state == SessionState::Tracking) {
        m_tracker->tick();
    }
}

void CaptureSession::resolveImmediateTarget()
{
    const std::optional<TrackedTarget> target = m_tracker->resolveImmediateTarget(m_mode);
    if (!target) {
        qDebug() << "CaptureSession: No" << captureModeName(m_mode) << "target under pointer";
        dispatch(SessionEvent::TargetMissing);
        return;
    }

    m_captureRect = target->rect;
    m_captureDisplayId = target->displayId;
    qDebug() << "CaptureSession: Resolved" << captureModeName(m_mode) << "target"
             << m_captureRect << "on" << m_captureDisplayId;
    dispatch(SessionEvent::TargetResolved);
}

void CaptureSession::disarmInput()
{
    m_context->armed.store(false);
    m_context->hasTarget.store(false);

    if (m_interceptor) {
        m_interceptor->remove();
    }
    if (m_keyMonitor) {
        m_keyMonitor->remove();
    }
    m_tracker->stop();
}

void CaptureSession::beginCapture(bool afterFlash)
{
    if (m_captureInFlight) {
        return;
    }

    if (m_mode == CaptureMode::Element) {
        m_captureRect = m_tracker->currentTarget();
        m_captureDisplayId = m_tracker->activeDisplayId();
    }
    m_captureInFlight = true;
    qDebug() << "CaptureSession: Capturing" << m_captureRect << "on" << m_captureDisplayId;

    if (!afterFlash) {
        QTimer::singleShot(0, this, &CaptureSession::performCapture);
        return;
    }

    // Flash stays visible, then the overlay is hidden so it is not in the image
    QTimer::singleShot(m_flashDelayMs, this, [this]() {
        if (m_services.overlay) {
            m_services.overlay->deactivate();
        }
        QTimer::singleShot(m_overlayHideDelayMs, this, &CaptureSession::performCapture);
    });
}

void CaptureSession::performCapture()
{
    CaptureResult result;
    if (m_services.engine) {
        result = m_services.engine->capture(m_captureRect, m_captureDisplayId);
    } else {
        result = CaptureResult::failure(CaptureError::CaptureFailed,
                                        QStringLiteral("No capture engine"));
    }
    m_captureInFlight = false;

    if (m_services.sink) {
        m_services.sink->deliver(result);
    }

    if (result.isSuccess()) {
        emit captureCompleted(result.image);
    } else {
        emit captureFailed(result.error, result.message);
    }

    dispatch(SessionEvent::CaptureFinished);
    emitFinishedIfDone();
}

void CaptureSession::onTrackerTargetChanged(bool hasTarget, const QRectF &rect, const QString &displayId)
{
    if (m_state != SessionState::Tracking && m_state != SessionState::Arming) {
        return;
    }

    m_context->hasTarget.store(hasTarget);

    if (m_services.overlay) {
        if (hasTarget) {
            m_services.overlay->animateTo(rect, displayId);
        } else {
            m_services.overlay->hideTarget();
        }
    }
    emit targetChanged(hasTarget, rect, displayId);
}

void CaptureSession::emitFinishedIfDone()
{
    if (m_state != SessionState::Stopped || m_captureInFlight || m_finishedEmitted) {
        return;
    }
    m_finishedEmitted = true;
    disarmInput();
    emit finished(m_sessionId);
}
