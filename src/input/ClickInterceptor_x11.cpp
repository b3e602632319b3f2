#include "input/ClickInterceptor.h"
#include "platform/X11ErrorTrap.h"

#include <QDebug>
#include <QThread>

#include <X11/Xlib.h>

#include <atomic>
#include <cerrno>
#include <fcntl.h>
#include <sys/select.h>
#include <unistd.h>

/**
 * @brief Linux implementation using a passive pointer grab on X11.
 *
 * Button1 presses on the root window are grabbed synchronously, so the
 * pointer freezes until the service thread decides: AsyncPointer
 * consumes the press, ReplayPointer sends it on to the window below.
 * The thread owns its own display connection and is woken for teardown
 * through a self-pipe.
 */
class X11ClickInterceptor : public ClickInterceptor
{
public:
    explicit X11ClickInterceptor(IPermissionProvider *permissions, QObject *parent = nullptr)
        : ClickInterceptor(permissions, parent)
    {
    }

    ~X11ClickInterceptor() override
    {
        remove();
    }

protected:
    bool installTap() override
    {
        m_display = XOpenDisplay(nullptr);
        if (!m_display) {
            qWarning() << "ClickInterceptor: Cannot open X display";
            return false;
        }

        if (pipe(m_wakePipe) != 0) {
            qWarning() << "ClickInterceptor: pipe() failed, errno:" << errno;
            closeDisplay();
            return false;
        }
        fcntl(m_wakePipe[0], F_SETFL, O_NONBLOCK);

        if (!grabButton()) {
            qWarning() << "ClickInterceptor: Button grab refused, another client holds it";
            closePipe();
            closeDisplay();
            return false;
        }

        m_stopRequested.store(false);
        m_thread = new GrabThread(this);
        m_thread->start();
        return true;
    }

    void removeTap() override
    {
        if (m_thread) {
            m_stopRequested.store(true);
            const char wake = 'q';
            if (write(m_wakePipe[1], &wake, 1) != 1) {
                qWarning() << "ClickInterceptor: Failed to wake grab thread, errno:" << errno;
            }
            m_thread->wait();
            delete m_thread;
            m_thread = nullptr;
        }

        if (m_display) {
            XUngrabButton(m_display, Button1, AnyModifier, DefaultRootWindow(m_display));
            XSync(m_display, False);
        }
        closePipe();
        closeDisplay();
    }

    // Runs on the grab thread
    bool reenableTap() override
    {
        if (!m_display) {
            return false;
        }
        XUngrabButton(m_display, Button1, AnyModifier, DefaultRootWindow(m_display));
        return grabButton();
    }

private:
    class GrabThread : public QThread
    {
    public:
        explicit GrabThread(X11ClickInterceptor *owner) : m_owner(owner) {}

    protected:
        void run() override { m_owner->eventLoop(); }

    private:
        X11ClickInterceptor *m_owner;
    };

    // BadAccess means another client already holds the button
    bool grabButton()
    {
        X11ErrorTrap errorTrap(m_display);
        XGrabButton(m_display, Button1, AnyModifier, DefaultRootWindow(m_display), True,
                    ButtonPressMask | ButtonReleaseMask, GrabModeSync, GrabModeAsync,
                    None, None);
        const int errorCode = errorTrap.sync();
        if (errorCode != Success) {
            qWarning() << "ClickInterceptor: XGrabButton failed, X error" << errorCode;
            return false;
        }
        return true;
    }

    void eventLoop()
    {
        const int xfd = ConnectionNumber(m_display);
        const int wakeFd = m_wakePipe[0];

        while (!m_stopRequested.load()) {
            while (XPending(m_display) > 0) {
                XEvent event;
                XNextEvent(m_display, &event);
                if (event.type == ButtonPress && event.xbutton.button == Button1) {
                    const bool swallow = handleButtonDown();
                    XAllowEvents(m_display, swallow ? AsyncPointer : ReplayPointer,
                                 event.xbutton.time);
                    XFlush(m_display);
                }
            }

            fd_set readFds;
            FD_ZERO(&readFds);
            FD_SET(xfd, &readFds);
            FD_SET(wakeFd, &readFds);
            const int ready = select(qMax(xfd, wakeFd) + 1, &readFds, nullptr, nullptr, nullptr);
            if (ready < 0) {
                if (errno == EINTR) {
                    continue;
                }
                qWarning() << "ClickInterceptor: select() failed, errno:" << errno;
                if (handleTapDisabled()) {
                    continue;
                }
                // Release the button before the session tears the tap down
                XUngrabButton(m_display, Button1, AnyModifier, DefaultRootWindow(m_display));
                XSync(m_display, False);
                return;
            }
            if (FD_ISSET(wakeFd, &readFds)) {
                char buffer[16];
                while (read(wakeFd, buffer, sizeof(buffer)) > 0) {
                }
            }
        }
    }

    void closePipe()
    {
        for (int &fd : m_wakePipe) {
            if (fd >= 0) {
                close(fd);
                fd = -1;
            }
        }
    }

    void closeDisplay()
    {
        if (m_display) {
            XCloseDisplay(m_display);
            m_display = nullptr;
        }
    }

    Display *m_display = nullptr;
    int m_wakePipe[2] = {-1, -1};
    GrabThread *m_thread = nullptr;
    std::atomic<bool> m_stopRequested{false};
};

ClickInterceptor* ClickInterceptor::create(IPermissionProvider *permissions, QObject *parent)
{
    return new X11ClickInterceptor(permissions, parent);
}
