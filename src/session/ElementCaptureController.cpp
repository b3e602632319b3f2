#include "session/ElementCaptureController.h"
#include "session/CaptureSession.h"

#include <QDebug>

ElementCaptureController::ElementCaptureController(const CaptureServices &services, QObject *parent)
    : QObject(parent)
    , m_services(services)
{
}

ElementCaptureController::~ElementCaptureController()
{
    if (m_session) {
        m_session->stop();
    }
}

bool ElementCaptureController::isActive() const
{
    return m_session && m_session->state() != SessionState::Stopped;
}

void ElementCaptureController::setCaptureDelays(int flashMs, int overlayHideMs)
{
    m_flashDelayMs = flashMs;
    m_overlayHideDelayMs = overlayHideMs;
}

bool ElementCaptureController::start(CaptureMode mode)
{
    if (isActive()) {
        qDebug() << "ElementCaptureController: Session already active, ignoring start";
        return false;
    }

    // A stopped session still delivering its capture detaches and cleans up after itself
    if (m_session) {
        m_session->disconnect(this);
        connect(m_session, &CaptureSession::finished, m_session, &QObject::deleteLater);
        m_session = nullptr;
    }

    const quint64 sessionId = m_nextSessionId++;
    auto *session = new CaptureSession(sessionId, mode, m_services, this);
    if (m_flashDelayMs >= 0 && m_overlayHideDelayMs >= 0) {
        session->setCaptureDelays(m_flashDelayMs, m_overlayHideDelayMs);
    }
    m_session = session;

    connect(session, &CaptureSession::stateChanged,
            this, &ElementCaptureController::sessionStateChanged);
    connect(session, &CaptureSession::captureCompleted,
            this, &ElementCaptureController::captureCompleted);
    connect(session, &CaptureSession::captureFailed,
            this, &ElementCaptureController::captureFailed);
    connect(session, &CaptureSession::stateChanged, this, [this, session](SessionState state) {
        if (session == m_session && state == SessionState::Stopped) {
            emit activeChanged(false);
        }
    });
    connect(session, &CaptureSession::finished,
            this, &ElementCaptureController::onSessionFinished);

    qDebug() << "ElementCaptureController: Starting" << captureModeName(mode)
             << "session" << sessionId;
    emit activeChanged(true);
    session->start();
    return true;
}

void ElementCaptureController::stop()
{
    if (m_session) {
        m_session->stop();
    }
}

void ElementCaptureController::toggle(CaptureMode mode)
{
    if (isActive()) {
        stop();
        return;
    }
    start(mode);
}

void ElementCaptureController::onSessionFinished(quint64 sessionId)
{
    if (!m_session || m_session->sessionId() != sessionId) {
        return;
    }
    qDebug() << "ElementCaptureController: Session" << sessionId << "finished";
    m_session->deleteLater();
    m_session = nullptr;
}
