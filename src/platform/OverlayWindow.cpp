#include "OverlayWindow.h"

#include <QWidget>

#ifdef Q_OS_WIN
#include <Windows.h>
#endif

void configureOverlayWindow(QWidget *widget, OverlayInput input)
{
    if (!widget || !widget->isWindow()) {
        return;
    }
    const bool clickThrough = input == OverlayInput::ClickThrough;

#ifdef Q_OS_WIN
    HWND hwnd = reinterpret_cast<HWND>(widget->winId());
    if (!hwnd) {
        return;
    }

    LONG_PTR exStyle = GetWindowLongPtr(hwnd, GWL_EXSTYLE);
    exStyle |= WS_EX_NOACTIVATE | WS_EX_TOPMOST | WS_EX_TOOLWINDOW;
    if (clickThrough) {
        // WS_EX_TRANSPARENT only takes effect together with WS_EX_LAYERED
        exStyle |= WS_EX_TRANSPARENT | WS_EX_LAYERED;
    } else {
        exStyle &= ~WS_EX_TRANSPARENT;
    }
    SetWindowLongPtr(hwnd, GWL_EXSTYLE, exStyle);
    SetWindowPos(hwnd, HWND_TOPMOST, 0, 0, 0, 0,
                 SWP_NOMOVE | SWP_NOSIZE | SWP_NOACTIVATE | SWP_SHOWWINDOW | SWP_FRAMECHANGED);
#else
    // On X11 Qt maps WA_TransparentForMouseEvents to an empty input shape
    widget->setAttribute(Qt::WA_TransparentForMouseEvents, clickThrough);
    widget->setAttribute(Qt::WA_X11DoNotAcceptFocus, true);
    widget->raise();
#endif
}
