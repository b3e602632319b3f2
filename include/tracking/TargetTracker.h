#ifndef TARGETTRACKER_H
#define TARGETTRACKER_H

#include "capture/CaptureTypes.h"

#include <QObject>
#include <QPointF>
#include <QRectF>
#include <QString>
#include <optional>

class QTimer;
class IDisplayProvider;
class IPointerSource;
class IElementInspector;
class IWindowLister;

// A rectangle to capture and the display it was resolved on
struct TrackedTarget {
    QRectF rect;        // Capture space
    QString displayId;
};

/**
 * @brief Polls the pointer and resolves the rectangle under it.
 *
 * Each tick reads the display layout and pointer, hit-tests through
 * UI introspection and falls back to the window list, bounds oversized
 * results to the active display, pads by kHighlightPadding and filters
 * jitter through a hysteresis baseline.
 *
 * targetChanged(false, ...) is emitted once per loss of target.
 * The collaborators are not owned; the inspector may be null.
 */
class TargetTracker : public QObject
{
    Q_OBJECT

public:
    TargetTracker(IDisplayProvider *displays,
                  IPointerSource *pointer,
                  IElementInspector *inspector,
                  IWindowLister *windows,
                  QObject *parent = nullptr);
    ~TargetTracker() override;

    // Windows owned by this process are skipped by the fallback
    void setExcludedProcessId(qint64 pid) { m_excludedPid = pid; }

    void start();
    void stop();
    bool isRunning() const;

    // One polling step; driven by the internal 16 ms timer
    void tick();

    bool hasTarget() const { return m_hasTarget; }
    QRectF currentTarget() const { return m_hasTarget ? m_lastStableRect : QRectF(); }
    QString activeDisplayId() const { return m_activeDisplayId; }
    QRectF lastStableRect() const { return m_lastStableRect; }

    /**
     * @brief Frontmost qualifying window at a capture-space point.
     *
     * Windows must contain the point, be larger than kMinFallbackWindowSize
     * in both axes, and not belong to the excluded process.
     */
    std::optional<QRectF> hitTestWindowAt(const QPointF &capturePoint) const;

    /**
     * @brief Resolve a target without tracking, for Fullscreen and Window modes.
     *
     * Fullscreen: the display under the pointer (the primary if none).
     * Window: the window under the pointer, on the pointer's display.
     */
    std::optional<TrackedTarget> resolveImmediateTarget(CaptureMode mode) const;

signals:
    void targetChanged(bool hasTarget, const QRectF &rect, const QString &displayId);
    void activeDisplayChanged(const QString &displayId);

private:
    std::optional<QRectF> hitTest(const QPointF &capturePoint) const;
    void reportNoTarget();
    void resetBaseline();

    IDisplayProvider *m_displays;
    IPointerSource *m_pointer;
    IElementInspector *m_inspector;
    IWindowLister *m_windows;
    QTimer *m_timer;

    qint64 m_excludedPid = 0;
    QString m_activeDisplayId;
    QRectF m_lastStableRect;
    bool m_hasTarget = false;
    bool m_noTargetReported = false;
};

#endif // TARGETTRACKER_H
