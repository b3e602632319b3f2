#include "input/ClickInterceptor.h"

#ifdef Q_OS_WIN
#include <Windows.h>
#endif

#include <QDebug>
#include <QSemaphore>
#include <QThread>

#include <atomic>

#ifdef Q_OS_WIN

/**
 * @brief Windows implementation using a low-level mouse hook.
 *
 * The hook lives on a dedicated thread that does nothing but pump
 * messages, so a busy GUI thread cannot push the callback past
 * LowLevelHooksTimeout. The hook procedure takes no user pointer, so the
 * live interceptor is kept in a single static slot.
 *
 * Windows silently unhooks a low-level hook that exceeds the timeout
 * without notifying the owner, so there is no tap-disabled path on this
 * platform.
 */
class WinClickInterceptor : public ClickInterceptor
{
public:
    explicit WinClickInterceptor(IPermissionProvider *permissions, QObject *parent = nullptr)
        : ClickInterceptor(permissions, parent)
    {
    }

    ~WinClickInterceptor() override
    {
        remove();
    }

protected:
    bool installTap() override
    {
        s_instance.store(this);
        m_hookInstalled = false;
        m_thread = new HookThread(this);
        m_thread->start();
        m_ready.acquire();

        if (!m_hookInstalled) {
            m_thread->wait();
            delete m_thread;
            m_thread = nullptr;
            s_instance.store(nullptr);
            return false;
        }
        return true;
    }

    void removeTap() override
    {
        if (m_thread) {
            if (!PostThreadMessageW(m_threadId, WM_QUIT, 0, 0)) {
                qWarning() << "ClickInterceptor: PostThreadMessage failed, error:" << GetLastError();
            }
            m_thread->wait();
            delete m_thread;
            m_thread = nullptr;
        }
        WinClickInterceptor *self = this;
        s_instance.compare_exchange_strong(self, nullptr);
    }

private:
    class HookThread : public QThread
    {
    public:
        explicit HookThread(WinClickInterceptor *owner) : m_owner(owner) {}

    protected:
        void run() override { m_owner->hookLoop(); }

    private:
        WinClickInterceptor *m_owner;
    };

    // Runs on the hook thread
    void hookLoop()
    {
        // Force the message queue into existence before anyone can post WM_QUIT
        MSG msg;
        PeekMessageW(&msg, nullptr, WM_USER, WM_USER, PM_NOREMOVE);
        m_threadId = GetCurrentThreadId();

        m_hook = SetWindowsHookExW(WH_MOUSE_LL, LowLevelMouseProc, GetModuleHandleW(nullptr), 0);
        if (!m_hook) {
            qWarning() << "ClickInterceptor: Failed to install mouse hook, error:" << GetLastError();
            m_ready.release();
            return;
        }
        m_hookInstalled = true;
        m_ready.release();

        BOOL result;
        while ((result = GetMessageW(&msg, nullptr, 0, 0)) != 0) {
            if (result == -1) {
                qWarning() << "ClickInterceptor: GetMessage failed, error:" << GetLastError();
                break;
            }
            TranslateMessage(&msg);
            DispatchMessageW(&msg);
        }

        if (!UnhookWindowsHookEx(m_hook)) {
            qWarning() << "ClickInterceptor: UnhookWindowsHookEx failed, error:" << GetLastError();
        }
        m_hook = nullptr;
    }

    static LRESULT CALLBACK LowLevelMouseProc(int nCode, WPARAM wParam, LPARAM lParam)
    {
        WinClickInterceptor *instance = s_instance.load();
        if (nCode == HC_ACTION && instance && wParam == WM_LBUTTONDOWN) {
            if (instance->handleButtonDown()) {
                // Swallow: non-zero without passing the event on
                return 1;
            }
        }

        return CallNextHookEx(nullptr, nCode, wParam, lParam);
    }

    HHOOK m_hook = nullptr;
    HookThread *m_thread = nullptr;
    DWORD m_threadId = 0;
    bool m_hookInstalled = false;
    QSemaphore m_ready;

    static std::atomic<WinClickInterceptor *> s_instance;
};

std::atomic<WinClickInterceptor *> WinClickInterceptor::s_instance{nullptr};

#endif // Q_OS_WIN

ClickInterceptor* ClickInterceptor::create(IPermissionProvider *permissions, QObject *parent)
{
#ifdef Q_OS_WIN
    return new WinClickInterceptor(permissions, parent);
#else
    Q_UNUSED(permissions);
    Q_UNUSED(parent);
    return nullptr;
#endif
}
