#ifndef CLICKINTERCEPTOR_H
#define CLICKINTERCEPTOR_H

#include "input/InterceptContext.h"

#include <QMutex>
#include <QObject>
#include <atomic>
#include <memory>

class IPermissionProvider;

/**
 * @brief Process-scoped tap on global left-button-down events.
 *
 * While installed, a press is swallowed when the injected context is
 * armed and has a target; qualifyingClick() is then posted to the GUI
 * thread. Every other press passes through untouched.
 *
 * Only one interceptor may own the tap at a time. remove() is
 * synchronous and idempotent, and may be called from any thread.
 *
 * Platform implementations:
 * - Windows: low-level mouse hook (WH_MOUSE_LL)
 * - Linux: passive synchronous Button1 grab on the X11 root window
 */
class ClickInterceptor : public QObject
{
    Q_OBJECT

public:
    explicit ClickInterceptor(IPermissionProvider *permissions, QObject *parent = nullptr);
    ~ClickInterceptor() override;

    /**
     * @brief Install the tap for one session.
     * @return false if another interceptor owns the tap or the platform refused it
     */
    bool install(const std::shared_ptr<InterceptContext> &context);

    void remove();

    bool isInstalled() const;

    // Number of live taps in the process (0 or 1)
    static int installedCount();

    /**
     * @brief Factory method to create the platform interceptor.
     * @return New ClickInterceptor instance, or nullptr if unavailable
     */
    static ClickInterceptor* create(IPermissionProvider *permissions, QObject *parent = nullptr);

signals:
    void qualifyingClick(quint64 sessionId);
    void interceptionRevoked(quint64 sessionId);

protected:
    virtual bool installTap() = 0;
    virtual void removeTap() = 0;

    // One re-enable attempt after the platform disabled the tap
    virtual bool reenableTap() { return false; }

    /**
     * @brief Decide a left-button-down from the platform context.
     * @return true to swallow the event
     */
    bool handleButtonDown();

    /**
     * @brief Platform disabled the tap (hook timeout, broken connection).
     * @return true if the tap was re-enabled and should keep running
     */
    bool handleTapDisabled();

private:
    IPermissionProvider *m_permissions;
    std::shared_ptr<InterceptContext> m_context;
    mutable QMutex m_mutex;
    bool m_installed = false;

    static std::atomic<ClickInterceptor *> s_owner;
};

#endif // CLICKINTERCEPTOR_H
