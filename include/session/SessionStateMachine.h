#ifndef SESSIONSTATEMACHINE_H
#define SESSIONSTATEMACHINE_H

#include "capture/CaptureTypes.h"

#include <QMetaType>
#include <QString>
#include <QVector>

enum class SessionState {
    Idle,       // Created, not started
    Arming,     // Permissions checked, inputs being installed or target being resolved
    Tracking,   // Element mode: following the pointer, waiting for a click
    Capturing,  // One capture attempt in flight
    Stopped     // Terminal
};

enum class SessionEvent {
    Start,
    Armed,
    ArmingFailed,
    TargetResolved,
    TargetMissing,
    Click,
    Cancel,
    Stop,
    InterceptionRevoked,
    CaptureFinished
};

// Side effects requested by a transition, applied in order by CaptureSession
enum class SessionEffect {
    RequestPermissions,
    ArmTracking,
    ResolveImmediateTarget,
    DisarmInput,
    FlashOverlay,
    HideOverlay,
    BeginCapture
};

struct SessionTransition {
    SessionState next = SessionState::Idle;
    QVector<SessionEffect> effects;
    bool accepted = false;   // false: event ignored in this state
};

/**
 * @brief Pure transition function of a capture session.
 *
 * permissionsGranted is only read for Start; hasTarget only for Click.
 * Stopped absorbs every event.
 */
class SessionStateMachine
{
public:
    SessionStateMachine() = delete;

    static SessionTransition transition(SessionState state,
                                        CaptureMode mode,
                                        SessionEvent event,
                                        bool permissionsGranted = true,
                                        bool hasTarget = false);

    static QString stateName(SessionState state);
    static QString eventName(SessionEvent event);
};

Q_DECLARE_METATYPE(SessionState)

#endif // SESSIONSTATEMACHINE_H
