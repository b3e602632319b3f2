#include "input/ClickInterceptor.h"
#include "platform/IPermissionProvider.h"

#include <QDebug>
#include <QMetaObject>

std::atomic<ClickInterceptor *> ClickInterceptor::s_owner{nullptr};

ClickInterceptor::ClickInterceptor(IPermissionProvider *permissions, QObject *parent)
    : QObject(parent)
    , m_permissions(permissions)
{
}

ClickInterceptor::~ClickInterceptor()
{
    // Subclasses remove their tap first; this only releases ownership
    ClickInterceptor *expected = this;
    s_owner.compare_exchange_strong(expected, nullptr);
}

bool ClickInterceptor::install(const std::shared_ptr<InterceptContext> &context)
{
    if (!context) {
        qWarning() << "ClickInterceptor: install without a context";
        return false;
    }

    QMutexLocker locker(&m_mutex);
    if (m_installed) {
        if (m_context == context) {
            return true;
        }
        qWarning() << "ClickInterceptor: Already installed for session" << m_context->sessionId;
        return false;
    }

    ClickInterceptor *expected = nullptr;
    if (!s_owner.compare_exchange_strong(expected, this)) {
        qWarning() << "ClickInterceptor: Another interceptor owns the tap";
        return false;
    }

    // Context must be visible before the first platform callback
    m_context = context;
    if (!installTap()) {
        m_context.reset();
        s_owner.store(nullptr);
        qWarning() << "ClickInterceptor: Platform refused the tap for session" << context->sessionId;
        return false;
    }

    m_installed = true;
    qDebug() << "ClickInterceptor: Installed for session" << context->sessionId;
    return true;
}

void ClickInterceptor::remove()
{
    QMutexLocker locker(&m_mutex);
    if (!m_installed) {
        return;
    }

    removeTap();
    m_installed = false;

    const quint64 sessionId = m_context ? m_context->sessionId : 0;
    m_context.reset();
    s_owner.store(nullptr);
    qDebug() << "ClickInterceptor: Removed for session" << sessionId;
}

bool ClickInterceptor::isInstalled() const
{
    QMutexLocker locker(&m_mutex);
    return m_installed;
}

int ClickInterceptor::installedCount()
{
    return s_owner.load() ? 1 : 0;
}

bool ClickInterceptor::handleButtonDown()
{
    // m_context is only replaced while the tap is down
    InterceptContext *context = m_context.get();
    if (!context || !context->armed.load() || !context->hasTarget.load()) {
        return false;
    }

    const quint64 sessionId = context->sessionId;
    QMetaObject::invokeMethod(this, [this, sessionId]() {
        emit qualifyingClick(sessionId);
    }, Qt::QueuedConnection);
    return true;
}

bool ClickInterceptor::handleTapDisabled()
{
    InterceptContext *context = m_context.get();
    if (!context) {
        return false;
    }
    const quint64 sessionId = context->sessionId;

    const bool accessibilityRevoked = m_permissions && !m_permissions->isAccessibilityGranted();
    if (!accessibilityRevoked && reenableTap()) {
        qDebug() << "ClickInterceptor: Tap re-enabled for session" << sessionId;
        return true;
    }

    qWarning() << "ClickInterceptor: Tap lost for session" << sessionId
               << (accessibilityRevoked ? "(accessibility revoked)" : "(re-enable failed)");
    QMetaObject::invokeMethod(this, [this, sessionId]() {
        emit interceptionRevoked(sessionId);
    }, Qt::QueuedConnection);
    return false;
}
