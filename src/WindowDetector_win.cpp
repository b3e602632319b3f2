#include "WindowDetector.h"
#include "utils/CoordinateHelper.h"

#include <QDebug>
#include <QGuiApplication>
#include <QScreen>

#include <windows.h>
#include <dwmapi.h>

#include <cwchar>

#pragma comment(lib, "dwmapi.lib")

namespace {

struct EnumWindowsContext {
    QVector<DetectedWindow> *windows;
};

WindowLayer layerForClass(const WCHAR *className)
{
    if (wcscmp(className, L"Progman") == 0 || wcscmp(className, L"WorkerW") == 0) {
        return WindowLayer::Desktop;
    }
    if (wcscmp(className, L"Shell_TrayWnd") == 0 ||
        wcscmp(className, L"Shell_SecondaryTrayWnd") == 0) {
        return WindowLayer::Panel;
    }
    return WindowLayer::Normal;
}

bool isWindowCloaked(HWND hwnd)
{
    BOOL cloaked = FALSE;
    HRESULT hr = DwmGetWindowAttribute(hwnd, DWMWA_CLOAKED, &cloaked, sizeof(cloaked));
    return SUCCEEDED(hr) && cloaked;
}

// Physical desktop pixels -> Qt logical pixels, using the monitor the rect sits on.
// Qt keeps each monitor's native origin and scales offsets within it.
QRectF physicalToQtGlobal(const RECT &rect)
{
    const QRect physical(rect.left, rect.top, rect.right - rect.left, rect.bottom - rect.top);

    HMONITOR monitor = MonitorFromRect(&rect, MONITOR_DEFAULTTONEAREST);
    MONITORINFOEXW info{};
    info.cbSize = sizeof(info);
    if (!monitor || !GetMonitorInfoW(monitor, reinterpret_cast<LPMONITORINFO>(&info))) {
        return QRectF(physical);
    }

    const QString deviceName = QString::fromWCharArray(info.szDevice);
    const QList<QScreen *> screens = QGuiApplication::screens();
    for (QScreen *screen : screens) {
        if (screen->name() != deviceName) {
            continue;
        }
        const QPoint nativeOrigin(info.rcMonitor.left, info.rcMonitor.top);
        const qreal dpr = CoordinateHelper::getDevicePixelRatio(screen);
        const QRect logicalOffset = CoordinateHelper::toLogical(physical.translated(-nativeOrigin), dpr);
        return QRectF(logicalOffset.translated(screen->geometry().topLeft()));
    }

    return QRectF(physical);
}

BOOL CALLBACK enumWindowsProc(HWND hwnd, LPARAM lParam)
{
    auto *context = reinterpret_cast<EnumWindowsContext *>(lParam);

    // Skip invisible windows
    if (!IsWindowVisible(hwnd) || IsIconic(hwnd)) {
        return TRUE;
    }

    // Skip cloaked windows (hidden UWP apps, virtual desktops)
    if (isWindowCloaked(hwnd)) {
        return TRUE;
    }

    // Prefer extended frame bounds: excludes invisible resize borders and shadows
    RECT rect;
    HRESULT hr = DwmGetWindowAttribute(hwnd, DWMWA_EXTENDED_FRAME_BOUNDS, &rect, sizeof(rect));
    if (FAILED(hr)) {
        if (!GetWindowRect(hwnd, &rect)) {
            return TRUE;
        }
    }

    if (rect.right <= rect.left || rect.bottom <= rect.top) {
        return TRUE;
    }

    // Minimized windows are parked far off-screen
    if (rect.left <= -32000 || rect.top <= -32000) {
        return TRUE;
    }

    WCHAR className[64] = {0};
    GetClassNameW(hwnd, className, 64);

    // Menus ("#32768") and tool windows (tooltips, floating palettes) are transient
    const LONG_PTR exStyle = GetWindowLongPtrW(hwnd, GWL_EXSTYLE);
    if (wcscmp(className, L"#32768") == 0 || (exStyle & WS_EX_TOOLWINDOW)) {
        return TRUE;
    }

    DWORD windowProcessId = 0;
    GetWindowThreadProcessId(hwnd, &windowProcessId);

    DetectedWindow window;
    window.bounds = CoordinateHelper::fromQtGlobal(physicalToQtGlobal(rect));
    window.ownerPid = static_cast<qint64>(windowProcessId);
    window.layer = layerForClass(className);

    context->windows->append(window);
    return TRUE;
}

} // anonymous namespace

class WindowDetector::Private
{
};

WindowDetector::WindowDetector(QObject *parent)
    : IWindowLister(parent)
    , d(new Private)
{
}

WindowDetector::~WindowDetector() = default;

bool WindowDetector::isAvailable() const
{
    return true;
}

QVector<DetectedWindow> WindowDetector::onScreenWindows() const
{
    QVector<DetectedWindow> windows;
    EnumWindowsContext context;
    context.windows = &windows;

    // EnumWindows returns windows in z-order (topmost first)
    EnumWindows(enumWindowsProc, reinterpret_cast<LPARAM>(&context));
    return windows;
}
