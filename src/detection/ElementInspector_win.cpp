#include "detection/ElementInspectorFactory.h"
#include "detection/IElementInspector.h"
#include "utils/CoordinateHelper.h"

#include <QDebug>
#include <QGuiApplication>
#include <QScreen>
#include <QtGlobal>

#ifdef Q_OS_WIN
#include <windows.h>
#include <uiautomation.h>

namespace {

struct MonitorLookupContext {
    QString targetDeviceName;
    MONITORINFOEXW monitorInfo{};
    bool found = false;
};

BOOL CALLBACK findMonitorByDeviceName(HMONITOR hMonitor, HDC, LPRECT, LPARAM userData)
{
    auto *context = reinterpret_cast<MonitorLookupContext *>(userData);
    if (!context) {
        return TRUE;
    }

    MONITORINFOEXW info{};
    info.cbSize = sizeof(info);
    if (!GetMonitorInfoW(hMonitor, reinterpret_cast<LPMONITORINFO>(&info))) {
        return TRUE;
    }

    if (QString::fromWCharArray(info.szDevice) == context->targetDeviceName) {
        context->monitorInfo = info;
        context->found = true;
        return FALSE;
    }

    return TRUE;
}

bool monitorInfoForScreen(QScreen *screen, MONITORINFOEXW *outInfo)
{
    if (!screen || !outInfo) {
        return false;
    }

    MonitorLookupContext context;
    context.targetDeviceName = screen->name();
    EnumDisplayMonitors(nullptr, nullptr, findMonitorByDeviceName, reinterpret_cast<LPARAM>(&context));
    if (!context.found) {
        return false;
    }

    *outInfo = context.monitorInfo;
    return true;
}

POINT logicalToPhysicalPoint(const QPoint &globalPoint, QScreen *screen)
{
    POINT pt{};
    pt.x = globalPoint.x();
    pt.y = globalPoint.y();
    if (!screen) {
        return pt;
    }

    const qreal dpr = qMax(1.0, screen->devicePixelRatio());
    MONITORINFOEXW monitorInfo{};
    if (!monitorInfoForScreen(screen, &monitorInfo)) {
        pt.x = qRound(globalPoint.x() * dpr);
        pt.y = qRound(globalPoint.y() * dpr);
        return pt;
    }

    const QPoint logicalScreenOrigin = screen->geometry().topLeft();
    pt.x = monitorInfo.rcMonitor.left + qRound((globalPoint.x() - logicalScreenOrigin.x()) * dpr);
    pt.y = monitorInfo.rcMonitor.top + qRound((globalPoint.y() - logicalScreenOrigin.y()) * dpr);
    return pt;
}

// UIA reports physical pixels; map them back into Qt's logical virtual desktop
QRectF physicalToQtGlobal(const RECT &physical)
{
    HMONITOR hMonitor = MonitorFromRect(&physical, MONITOR_DEFAULTTONEAREST);
    MONITORINFOEXW info{};
    info.cbSize = sizeof(info);
    if (!hMonitor || !GetMonitorInfoW(hMonitor, reinterpret_cast<LPMONITORINFO>(&info))) {
        return QRectF(physical.left, physical.top,
                      physical.right - physical.left, physical.bottom - physical.top);
    }

    const QString deviceName = QString::fromWCharArray(info.szDevice);
    for (QScreen *screen : QGuiApplication::screens()) {
        if (screen->name() != deviceName) {
            continue;
        }
        const qreal dpr = qMax(1.0, screen->devicePixelRatio());
        const QRect relative(physical.left - info.rcMonitor.left,
                             physical.top - info.rcMonitor.top,
                             physical.right - physical.left,
                             physical.bottom - physical.top);
        return QRectF(CoordinateHelper::toLogical(relative, dpr)
                          .translated(screen->geometry().topLeft()));
    }

    return QRectF(physical.left, physical.top,
                  physical.right - physical.left, physical.bottom - physical.top);
}

class UiaElementInspector final : public IElementInspector
{
public:
    explicit UiaElementInspector(QObject *parent = nullptr)
        : IElementInspector(parent)
    {
        const HRESULT initHr = CoInitializeEx(nullptr, COINIT_APARTMENTTHREADED);
        m_comInitialized = SUCCEEDED(initHr);
        if (initHr == RPC_E_CHANGED_MODE) {
            m_comInitialized = false;
        }

        const HRESULT hr = CoCreateInstance(
            CLSID_CUIAutomation,
            nullptr,
            CLSCTX_INPROC_SERVER,
            IID_PPV_ARGS(&m_uia));
        if (FAILED(hr)) {
            qWarning() << "UiaElementInspector: UI Automation unavailable, hr =" << Qt::hex << hr;
            m_uia = nullptr;
        }
    }

    ~UiaElementInspector() override
    {
        if (m_uia) {
            m_uia->Release();
            m_uia = nullptr;
        }
        if (m_comInitialized) {
            CoUninitialize();
        }
    }

    std::optional<QRectF> elementRectAt(const QPointF &capturePoint) override
    {
        if (!m_uia) {
            return std::nullopt;
        }

        const QPoint qtGlobal = (capturePoint + CoordinateHelper::primaryOrigin()).toPoint();
        QScreen *screen = QGuiApplication::screenAt(qtGlobal);
        const POINT pt = logicalToPhysicalPoint(qtGlobal, screen);

        IUIAutomationElement *element = nullptr;
        HRESULT hr = m_uia->ElementFromPoint(pt, &element);
        if (FAILED(hr) || !element) {
            return std::nullopt;
        }

        RECT bounds{};
        hr = element->get_CurrentBoundingRectangle(&bounds);
        element->Release();
        if (FAILED(hr) || bounds.right <= bounds.left || bounds.bottom <= bounds.top) {
            return std::nullopt;
        }

        return CoordinateHelper::fromQtGlobal(physicalToQtGlobal(bounds));
    }

private:
    bool m_comInitialized = false;
    IUIAutomation *m_uia = nullptr;
};

} // namespace

IElementInspector* createPlatformElementInspector(QObject *parent)
{
    return new UiaElementInspector(parent);
}

#else

IElementInspector* createPlatformElementInspector(QObject *parent)
{
    Q_UNUSED(parent);
    return nullptr;
}

#endif
