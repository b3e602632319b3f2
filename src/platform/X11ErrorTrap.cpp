#include "X11ErrorTrap.h"

#include <QDebug>
#include <QHash>
#include <QMutex>
#include <QMutexLocker>

#include <X11/Xlib.h>

#include <mutex>

namespace {

QMutex s_registryMutex;
QHash<Display *, X11ErrorTrap *> s_traps;
std::once_flag s_handlerInstalled;

int trapErrorHandler(Display *display, XErrorEvent *error)
{
    X11ErrorTrap::recordError(display, error->error_code);
    return 0;
}

} // anonymous namespace

X11ErrorTrap::X11ErrorTrap(Display *display)
    : m_display(display)
{
    std::call_once(s_handlerInstalled, []() {
        XSetErrorHandler(trapErrorHandler);
    });

    QMutexLocker locker(&s_registryMutex);
    m_outer = s_traps.value(m_display, nullptr);
    s_traps.insert(m_display, this);
}

X11ErrorTrap::~X11ErrorTrap()
{
    QMutexLocker locker(&s_registryMutex);
    if (m_outer) {
        s_traps.insert(m_display, m_outer);
    } else {
        s_traps.remove(m_display);
    }
}

int X11ErrorTrap::sync()
{
    XSync(m_display, False);
    return takeError();
}

int X11ErrorTrap::takeError()
{
    QMutexLocker locker(&s_registryMutex);
    const int errorCode = m_errorCode;
    m_errorCode = Success;
    return errorCode;
}

void X11ErrorTrap::recordError(Display *display, int errorCode)
{
    QMutexLocker locker(&s_registryMutex);
    X11ErrorTrap *trap = s_traps.value(display, nullptr);
    if (!trap) {
        qWarning() << "X11ErrorTrap: Unhandled X error" << errorCode;
        return;
    }
    if (trap->m_errorCode == Success) {
        trap->m_errorCode = errorCode;
    }
}
