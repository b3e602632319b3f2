#include "WindowDetector.h"
#include "utils/CoordinateHelper.h"
#include "platform/X11ErrorTrap.h"

#include <QDebug>
#include <QGuiApplication>
#include <QScreen>

#include <X11/Xatom.h>
#include <X11/Xlib.h>

namespace {

// Reads a 32-bit format property. Returns the item count; data must be XFree'd.
unsigned long readCardinalProperty(Display *display, Window window, Atom property,
                                   Atom type, unsigned char **data)
{
    Atom actualType = None;
    int actualFormat = 0;
    unsigned long itemCount = 0;
    unsigned long bytesAfter = 0;
    *data = nullptr;

    const int status = XGetWindowProperty(display, window, property, 0, 4096, False, type,
                                          &actualType, &actualFormat, &itemCount,
                                          &bytesAfter, data);
    if (status != Success || actualFormat != 32 || !*data) {
        if (*data) {
            XFree(*data);
            *data = nullptr;
        }
        return 0;
    }
    return itemCount;
}

// Desktop and dock types are shell surfaces, not capture targets
WindowLayer readWindowLayer(Display *display, Window window, Atom windowType,
                            Atom typeDesktop, Atom typeDock)
{
    unsigned char *data = nullptr;
    const unsigned long count = readCardinalProperty(display, window, windowType, XA_ATOM, &data);
    WindowLayer layer = WindowLayer::Normal;
    const auto *types = reinterpret_cast<const unsigned long *>(data);
    for (unsigned long i = 0; i < count; ++i) {
        if (types[i] == typeDesktop) {
            layer = WindowLayer::Desktop;
            break;
        }
        if (types[i] == typeDock) {
            layer = WindowLayer::Panel;
            break;
        }
    }
    if (data) {
        XFree(data);
    }
    return layer;
}

// X root coordinates are device pixels. Qt keeps each screen's native
// origin and scales offsets within the screen by its pixel ratio.
QRectF nativeToQtGlobal(const QRect &native)
{
    const QList<QScreen *> screens = QGuiApplication::screens();
    for (QScreen *screen : screens) {
        const qreal dpr = CoordinateHelper::getDevicePixelRatio(screen);
        const QRect logical = screen->geometry();
        const QRect nativeScreen(logical.topLeft(), logical.size() * dpr);
        if (!nativeScreen.contains(native.center())) {
            continue;
        }
        const QRect offset = CoordinateHelper::toLogical(native.translated(-logical.topLeft()), dpr);
        return QRectF(offset.translated(logical.topLeft()));
    }
    return QRectF(native);
}

} // anonymous namespace

class WindowDetector::Private
{
public:
    Display *display = nullptr;
    Atom clientListStacking = None;
    Atom frameExtents = None;
    Atom wmPid = None;
    Atom windowType = None;
    Atom typeDesktop = None;
    Atom typeDock = None;
};

WindowDetector::WindowDetector(QObject *parent)
    : IWindowLister(parent)
    , d(new Private)
{
    d->display = XOpenDisplay(nullptr);
    if (!d->display) {
        qWarning() << "WindowDetector: Cannot open X display, window fallback disabled";
        return;
    }

    d->clientListStacking = XInternAtom(d->display, "_NET_CLIENT_LIST_STACKING", False);
    d->frameExtents = XInternAtom(d->display, "_NET_FRAME_EXTENTS", False);
    d->wmPid = XInternAtom(d->display, "_NET_WM_PID", False);
    d->windowType = XInternAtom(d->display, "_NET_WM_WINDOW_TYPE", False);
    d->typeDesktop = XInternAtom(d->display, "_NET_WM_WINDOW_TYPE_DESKTOP", False);
    d->typeDock = XInternAtom(d->display, "_NET_WM_WINDOW_TYPE_DOCK", False);
}

WindowDetector::~WindowDetector()
{
    if (d->display) {
        XCloseDisplay(d->display);
        d->display = nullptr;
    }
}

bool WindowDetector::isAvailable() const
{
    return d->display != nullptr;
}

QVector<DetectedWindow> WindowDetector::onScreenWindows() const
{
    QVector<DetectedWindow> windows;
    if (!d->display) {
        return windows;
    }

    Display *display = d->display;
    const Window root = DefaultRootWindow(display);

    // Clients can be destroyed between the stacking read and the per-window
    // queries; their BadWindow errors must not reach the default handler.
    X11ErrorTrap errorTrap(display);

    unsigned char *data = nullptr;
    const unsigned long count = readCardinalProperty(display, root, d->clientListStacking,
                                                     XA_WINDOW, &data);
    if (count == 0) {
        return windows;
    }

    // Xlib hands 32-bit properties back as longs
    const auto *stacking = reinterpret_cast<const unsigned long *>(data);

    // _NET_CLIENT_LIST_STACKING is bottom to top
    for (long i = static_cast<long>(count) - 1; i >= 0; --i) {
        const Window window = static_cast<Window>(stacking[i]);

        XWindowAttributes attributes;
        if (!XGetWindowAttributes(display, window, &attributes)) {
            errorTrap.takeError();
            continue;
        }
        if (attributes.map_state != IsViewable || attributes.width <= 0 || attributes.height <= 0) {
            continue;
        }

        int rootX = 0;
        int rootY = 0;
        Window child = None;
        if (!XTranslateCoordinates(display, window, root, 0, 0, &rootX, &rootY, &child)) {
            errorTrap.takeError();
            continue;
        }

        QRect native(rootX, rootY, attributes.width, attributes.height);

        // Include window manager decorations: left, right, top, bottom
        unsigned char *extentsData = nullptr;
        if (readCardinalProperty(display, window, d->frameExtents, XA_CARDINAL, &extentsData) >= 4) {
            const auto *extents = reinterpret_cast<const unsigned long *>(extentsData);
            native.adjust(-static_cast<int>(extents[0]), -static_cast<int>(extents[2]),
                          static_cast<int>(extents[1]), static_cast<int>(extents[3]));
        }
        if (extentsData) {
            XFree(extentsData);
        }

        DetectedWindow detected;
        detected.bounds = CoordinateHelper::fromQtGlobal(nativeToQtGlobal(native));
        detected.layer = readWindowLayer(display, window, d->windowType,
                                         d->typeDesktop, d->typeDock);

        unsigned char *pidData = nullptr;
        if (readCardinalProperty(display, window, d->wmPid, XA_CARDINAL, &pidData) >= 1) {
            detected.ownerPid = static_cast<qint64>(*reinterpret_cast<const unsigned long *>(pidData));
        }
        if (pidData) {
            XFree(pidData);
        }

        const int errorCode = errorTrap.sync();
        if (errorCode != Success) {
            qDebug() << "WindowDetector: Skipping window" << window << "X error" << errorCode;
            continue;
        }

        windows.append(detected);
    }

    XFree(data);
    return windows;
}
