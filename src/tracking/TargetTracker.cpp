#include "tracking/TargetTracker.h"
#include "Constants.h"
#include "capture/CaptureGeometry.h"
#include "detection/IElementInspector.h"
#include "detection/IWindowLister.h"
#include "display/IDisplayProvider.h"
#include "display/IPointerSource.h"
#include "utils/CoordinateHelper.h"

#include <QDebug>
#include <QTimer>

using namespace HoverCapture;

TargetTracker::TargetTracker(IDisplayProvider *displays,
                             IPointerSource *pointer,
                             IElementInspector *inspector,
                             IWindowLister *windows,
                             QObject *parent)
    : QObject(parent)
    , m_displays(displays)
    , m_pointer(pointer)
    , m_inspector(inspector)
    , m_windows(windows)
    , m_timer(new QTimer(this))
{
    m_timer->setInterval(Timer::k60FpsInterval);
    connect(m_timer, &QTimer::timeout, this, &TargetTracker::tick);
}

TargetTracker::~TargetTracker() = default;

void TargetTracker::start()
{
    if (m_timer->isActive()) {
        return;
    }
    resetBaseline();
    m_activeDisplayId.clear();
    m_noTargetReported = false;
    m_timer->start();
    qDebug() << "TargetTracker: Started," << (m_inspector ? "introspection + window list"
                                                          : "window list only");
}

void TargetTracker::stop()
{
    if (!m_timer->isActive()) {
        return;
    }
    m_timer->stop();
    qDebug() << "TargetTracker: Stopped";
}

bool TargetTracker::isRunning() const
{
    return m_timer->isActive();
}

void TargetTracker::tick()
{
    if (!m_displays || !m_pointer) {
        reportNoTarget();
        return;
    }

    // Re-read every tick so hot-plugged displays are picked up
    const DisplayLayout layout = m_displays->currentLayout();
    const QPointF pointer = m_pointer->pointerPosition();

    const std::optional<DisplayDescriptor> display = layout.displayAt(pointer);
    if (!display) {
        reportNoTarget();
        return;
    }

    if (display->id != m_activeDisplayId) {
        m_activeDisplayId = display->id;
        resetBaseline();
        emit activeDisplayChanged(m_activeDisplayId);
    }

    const QPointF capturePoint = CoordinateHelper::toCaptureSpace(pointer, layout.primaryHeight());
    const std::optional<QRectF> hit = hitTest(capturePoint);
    if (!hit) {
        reportNoTarget();
        return;
    }

    const std::optional<QRectF> clamped =
        CaptureGeometry::clampOversizedTarget(*hit, layout.captureFrame(*display));
    if (!clamped) {
        reportNoTarget();
        return;
    }

    const QRectF padded = CaptureGeometry::padTarget(*clamped);
    if (m_hasTarget &&
        !CaptureGeometry::isSignificantChange(m_lastStableRect, padded,
                                              ElementCapture::kHysteresisTolerance)) {
        return;
    }

    m_lastStableRect = padded;
    m_hasTarget = true;
    m_noTargetReported = false;
    emit targetChanged(true, padded, m_activeDisplayId);
}

std::optional<QRectF> TargetTracker::hitTest(const QPointF &capturePoint) const
{
    if (m_inspector) {
        const std::optional<QRectF> element = m_inspector->elementRectAt(capturePoint);
        if (element && element->width() > 0 && element->height() > 0) {
            return element;
        }
    }
    return hitTestWindowAt(capturePoint);
}

std::optional<QRectF> TargetTracker::hitTestWindowAt(const QPointF &capturePoint) const
{
    if (!m_windows) {
        return std::nullopt;
    }

    const QVector<DetectedWindow> windows = m_windows->onScreenWindows();
    for (const DetectedWindow &window : windows) {
        if (window.layer != WindowLayer::Normal) {
            continue;
        }
        if (!CoordinateHelper::containsPoint(window.bounds, capturePoint)) {
            continue;
        }
        if (window.bounds.width() <= ElementCapture::kMinFallbackWindowSize ||
            window.bounds.height() <= ElementCapture::kMinFallbackWindowSize) {
            continue;
        }
        if (m_excludedPid != 0 && window.ownerPid == m_excludedPid) {
            continue;
        }
        return window.bounds;
    }
    return std::nullopt;
}

std::optional<TrackedTarget> TargetTracker::resolveImmediateTarget(CaptureMode mode) const
{
    if (!m_displays || !m_pointer) {
        return std::nullopt;
    }

    const DisplayLayout layout = m_displays->currentLayout();
    const QPointF pointer = m_pointer->pointerPosition();
    std::optional<DisplayDescriptor> display = layout.displayAt(pointer);

    switch (mode) {
    case CaptureMode::Fullscreen:
        if (!display) {
            display = layout.primary();
        }
        if (!display) {
            qWarning() << "TargetTracker: No display for fullscreen capture";
            return std::nullopt;
        }
        return TrackedTarget{layout.captureFrame(*display), display->id};

    case CaptureMode::Window: {
        if (!display) {
            qWarning() << "TargetTracker: Pointer is outside every display";
            return std::nullopt;
        }
        const QPointF capturePoint = CoordinateHelper::toCaptureSpace(pointer, layout.primaryHeight());
        const std::optional<QRectF> window = hitTestWindowAt(capturePoint);
        if (!window) {
            qDebug() << "TargetTracker: No window under pointer" << capturePoint;
            return std::nullopt;
        }
        const std::optional<QRectF> clamped =
            CaptureGeometry::clampOversizedTarget(*window, layout.captureFrame(*display));
        if (!clamped) {
            return std::nullopt;
        }
        return TrackedTarget{*clamped, display->id};
    }

    case CaptureMode::Element:
        break;
    }
    return std::nullopt;
}

void TargetTracker::reportNoTarget()
{
    const bool hadTarget = m_hasTarget;
    resetBaseline();
    if (hadTarget || !m_noTargetReported) {
        m_noTargetReported = true;
        emit targetChanged(false, QRectF(), m_activeDisplayId);
    }
}

void TargetTracker::resetBaseline()
{
    m_hasTarget = false;
    m_lastStableRect = QRectF();
}
