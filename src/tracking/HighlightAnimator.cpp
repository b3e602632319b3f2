#include "tracking/HighlightAnimator.h"
#include "Constants.h"

#include <QtMath>

using namespace HoverCapture;

void HighlightAnimator::setTarget(const QRectF &target)
{
    if (target.isEmpty()) {
        reset();
        return;
    }

    m_target = target;
    if (!m_hasTarget) {
        m_displayed = target;
        m_hasTarget = true;
        m_animating = false;
        return;
    }

    m_animating = (m_displayed != m_target);
}

void HighlightAnimator::reset()
{
    m_displayed = QRectF();
    m_target = QRectF();
    m_hasTarget = false;
    m_animating = false;
}

qreal HighlightAnimator::smoothingFactor(qreal distance)
{
    return qMin(Highlight::kBaseSmoothing * (1.0 + distance / Highlight::kSmoothingDistance),
                Highlight::kMaxSmoothing);
}

bool HighlightAnimator::step()
{
    if (!m_animating) {
        return false;
    }

    const qreal dx = m_target.x() - m_displayed.x();
    const qreal dy = m_target.y() - m_displayed.y();
    const qreal dw = m_target.width() - m_displayed.width();
    const qreal dh = m_target.height() - m_displayed.height();

    const qreal threshold = Highlight::kSnapThreshold;
    if (qAbs(dx) < threshold && qAbs(dy) < threshold &&
        qAbs(dw) < threshold && qAbs(dh) < threshold) {
        m_displayed = m_target;
        m_animating = false;
        return false;
    }

    const qreal factor = smoothingFactor(qSqrt(dx * dx + dy * dy + dw * dw + dh * dh));
    m_displayed = QRectF(m_displayed.x() + dx * factor,
                         m_displayed.y() + dy * factor,
                         m_displayed.width() + dw * factor,
                         m_displayed.height() + dh * factor);
    return true;
}
