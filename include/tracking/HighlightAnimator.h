#ifndef HIGHLIGHTANIMATOR_H
#define HIGHLIGHTANIMATOR_H

#include <QRectF>

/**
 * @brief Fixed-step interpolation of the highlight rectangle.
 *
 * The host calls step() once per frame. The first target after a
 * reset is shown immediately; later targets are approached with an
 * adaptive factor that grows with the remaining distance, and the
 * rectangle snaps once every component is within kSnapThreshold.
 */
class HighlightAnimator
{
public:
    void setTarget(const QRectF &target);
    void reset();

    // Advance one frame. Returns true while still moving.
    bool step();

    QRectF displayedRect() const { return m_displayed; }
    QRectF targetRect() const { return m_target; }
    bool hasTarget() const { return m_hasTarget; }
    bool isAnimating() const { return m_animating; }

    // Interpolation factor for a given remaining distance
    static qreal smoothingFactor(qreal distance);

private:
    QRectF m_displayed;
    QRectF m_target;
    bool m_hasTarget = false;
    bool m_animating = false;
};

#endif // HIGHLIGHTANIMATOR_H
