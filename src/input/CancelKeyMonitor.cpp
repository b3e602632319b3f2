#include "input/CancelKeyMonitor.h"

#include <QCoreApplication>
#include <QDebug>
#include <QKeyEvent>

CancelKeyMonitor *CancelKeyMonitor::s_owner = nullptr;

CancelKeyMonitor::CancelKeyMonitor(QObject *parent)
    : QObject(parent)
{
}

CancelKeyMonitor::~CancelKeyMonitor()
{
    remove();
}

bool CancelKeyMonitor::install(quint64 sessionId)
{
    if (m_installed) {
        return m_sessionId == sessionId;
    }
    if (s_owner) {
        qWarning() << "CancelKeyMonitor: Another monitor is installed";
        return false;
    }
    if (!QCoreApplication::instance()) {
        qWarning() << "CancelKeyMonitor: No application instance";
        return false;
    }

    QCoreApplication::instance()->installEventFilter(this);
    s_owner = this;
    m_sessionId = sessionId;
    m_installed = true;
    return true;
}

void CancelKeyMonitor::remove()
{
    if (!m_installed) {
        return;
    }

    if (QCoreApplication::instance()) {
        QCoreApplication::instance()->removeEventFilter(this);
    }
    if (s_owner == this) {
        s_owner = nullptr;
    }
    m_installed = false;
}

int CancelKeyMonitor::installedCount()
{
    return s_owner ? 1 : 0;
}

bool CancelKeyMonitor::eventFilter(QObject *watched, QEvent *event)
{
    if (m_installed && event->type() == QEvent::KeyPress) {
        auto *keyEvent = static_cast<QKeyEvent *>(event);
        if (keyEvent->key() == Qt::Key_Escape) {
            // Consumed at the first receiver, so each press is seen once
            if (!keyEvent->isAutoRepeat()) {
                emit cancelRequested(m_sessionId);
            }
            return true;
        }
    }
    return QObject::eventFilter(watched, event);
}
