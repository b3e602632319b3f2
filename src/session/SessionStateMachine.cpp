#include "session/SessionStateMachine.h"

namespace {

SessionTransition to(SessionState next, std::initializer_list<SessionEffect> effects = {})
{
    SessionTransition t;
    t.next = next;
    t.effects = QVector<SessionEffect>(effects);
    t.accepted = true;
    return t;
}

SessionTransition ignored(SessionState state)
{
    SessionTransition t;
    t.next = state;
    return t;
}

} // namespace

SessionTransition SessionStateMachine::transition(SessionState state,
                                                  CaptureMode mode,
                                                  SessionEvent event,
                                                  bool permissionsGranted,
                                                  bool hasTarget)
{
    switch (state) {
    case SessionState::Idle:
        if (event == SessionEvent::Start) {
            if (!permissionsGranted) {
                return to(SessionState::Stopped, {SessionEffect::RequestPermissions});
            }
            if (mode == CaptureMode::Element) {
                return to(SessionState::Arming, {SessionEffect::ArmTracking});
            }
            return to(SessionState::Arming, {SessionEffect::ResolveImmediateTarget});
        }
        if (event == SessionEvent::Stop || event == SessionEvent::Cancel) {
            return to(SessionState::Stopped);
        }
        break;

    case SessionState::Arming:
        switch (event) {
        case SessionEvent::Armed:
            if (mode == CaptureMode::Element) {
                return to(SessionState::Tracking);
            }
            break;
        case SessionEvent::ArmingFailed:
            return to(SessionState::Stopped, {SessionEffect::DisarmInput, SessionEffect::HideOverlay});
        case SessionEvent::TargetResolved:
            if (mode != CaptureMode::Element) {
                return to(SessionState::Capturing, {SessionEffect::BeginCapture});
            }
            break;
        case SessionEvent::TargetMissing:
            return to(SessionState::Stopped);
        case SessionEvent::Stop:
        case SessionEvent::Cancel:
            return to(SessionState::Stopped, {SessionEffect::DisarmInput, SessionEffect::HideOverlay});
        default:
            break;
        }
        break;

    case SessionState::Tracking:
        switch (event) {
        case SessionEvent::Click:
            if (hasTarget) {
                return to(SessionState::Capturing, {SessionEffect::DisarmInput,
                                                    SessionEffect::FlashOverlay,
                                                    SessionEffect::BeginCapture});
            }
            return to(SessionState::Tracking);
        case SessionEvent::Cancel:
        case SessionEvent::Stop:
        case SessionEvent::InterceptionRevoked:
            return to(SessionState::Stopped, {SessionEffect::DisarmInput, SessionEffect::HideOverlay});
        default:
            break;
        }
        break;

    case SessionState::Capturing:
        switch (event) {
        case SessionEvent::CaptureFinished:
        case SessionEvent::Cancel:
        case SessionEvent::Stop:
            return to(SessionState::Stopped, {SessionEffect::HideOverlay});
        default:
            break;
        }
        break;

    case SessionState::Stopped:
        break;
    }

    return ignored(state);
}

QString SessionStateMachine::stateName(SessionState state)
{
    switch (state) {
    case SessionState::Idle:
        return QStringLiteral("Idle");
    case SessionState::Arming:
        return QStringLiteral("Arming");
    case SessionState::Tracking:
        return QStringLiteral("Tracking");
    case SessionState::Capturing:
        return QStringLiteral("Capturing");
    case SessionState::Stopped:
        return QStringLiteral("Stopped");
    }
    return QString();
}

QString SessionStateMachine::eventName(SessionEvent event)
{
    switch (event) {
    case SessionEvent::Start:
        return QStringLiteral("Start");
    case SessionEvent::Armed:
        return QStringLiteral("Armed");
    case SessionEvent::ArmingFailed:
        return QStringLiteral("ArmingFailed");
    case SessionEvent::TargetResolved:
        return QStringLiteral("TargetResolved");
    case SessionEvent::TargetMissing:
        return QStringLiteral("TargetMissing");
    case SessionEvent::Click:
        return QStringLiteral("Click");
    case SessionEvent::Cancel:
        return QStringLiteral("Cancel");
    case SessionEvent::Stop:
        return QStringLiteral("Stop");
    case SessionEvent::InterceptionRevoked:
        return QStringLiteral("InterceptionRevoked");
    case SessionEvent::CaptureFinished:
        return QStringLiteral("CaptureFinished");
    }
    return QString();
}
