#ifndef X11ERRORTRAP_H
#define X11ERRORTRAP_H

#include <QtGlobal>

typedef struct _XDisplay Display;

/**
 * @brief Scoped capture of asynchronous X protocol errors on one connection.
 *
 * Xlib reports protocol errors through a single process-wide handler whose
 * default terminates the process. While a trap is alive, errors raised on its
 * display are recorded instead and read back with takeError(). Traps on the
 * same display nest; errors on a display without a trap are logged and dropped.
 *
 * A trap may be used on any thread, but only by the thread that owns its
 * display connection.
 */
class X11ErrorTrap
{
public:
    explicit X11ErrorTrap(Display *display);
    ~X11ErrorTrap();

    // Round-trips so every request sent so far has reported, then takeError()
    int sync();

    // First error code since the last call, or Success (0)
    int takeError();

    // Routes an error to the innermost trap registered for display
    static void recordError(Display *display, int errorCode);

private:
    Q_DISABLE_COPY(X11ErrorTrap)

    Display *m_display;
    X11ErrorTrap *m_outer = nullptr;
    int m_errorCode = 0;
};

#endif // X11ERRORTRAP_H
