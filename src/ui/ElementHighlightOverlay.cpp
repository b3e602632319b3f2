#include "ui/ElementHighlightOverlay.h"
#include "Constants.h"
#include "platform/OverlayWindow.h"
#include "utils/CoordinateHelper.h"

#include <QDebug>
#include <QGuiApplication>
#include <QPainter>
#include <QPainterPath>
#include <QPen>
#include <QScreen>
#include <QTimer>

using namespace HoverCapture;

ElementHighlightOverlay::ElementHighlightOverlay(QWidget *parent)
    : QWidget(parent, Qt::FramelessWindowHint | Qt::WindowStaysOnTopHint | Qt::Tool |
                      Qt::WindowDoesNotAcceptFocus | Qt::NoDropShadowWindowHint)
    , m_frameTimer(new QTimer(this))
{
    setAttribute(Qt::WA_TranslucentBackground);
    setAttribute(Qt::WA_TransparentForMouseEvents);  // Click-through
    setAttribute(Qt::WA_ShowWithoutActivating);
    setFocusPolicy(Qt::NoFocus);

    m_frameTimer->setTimerType(Qt::PreciseTimer);
    m_frameTimer->setInterval(Timer::k60FpsInterval);
    connect(m_frameTimer, &QTimer::timeout, this, &ElementHighlightOverlay::onFrame);
}

ElementHighlightOverlay::~ElementHighlightOverlay()
{
    m_frameTimer->stop();
}

void ElementHighlightOverlay::activate()
{
    m_active = true;
    m_flashing = false;
    m_animator.reset();
}

void ElementHighlightOverlay::animateTo(const QRectF &captureRect, const QString &displayId)
{
    if (!m_active || captureRect.isEmpty()) {
        return;
    }

    if (displayId != m_displayId) {
        // Jumping between displays: no glide across the gap
        moveToDisplay(displayId);
        m_animator.reset();
    } else if (m_animator.hasTarget() && m_animator.targetRect() == captureRect && isVisible()) {
        return;
    }

    m_animator.setTarget(captureRect);

    if (!isVisible()) {
        show();
        raise();
        configureOverlayWindow(this, OverlayInput::ClickThrough);
    }

    if (!m_frameTimer->isActive()) {
        m_frameTimer->start();
    }
    update();
}

void ElementHighlightOverlay::hideTarget()
{
    m_animator.reset();
    m_flashing = false;
    m_frameTimer->stop();
    hide();
}

void ElementHighlightOverlay::flash()
{
    if (!isVisible() || !m_animator.hasTarget()) {
        return;
    }

    m_flashing = true;
    m_flashClock.start();
    if (!m_frameTimer->isActive()) {
        m_frameTimer->start();
    }
    update();
}

void ElementHighlightOverlay::deactivate()
{
    m_active = false;
    hideTarget();
    m_displayId.clear();
}

void ElementHighlightOverlay::onFrame()
{
    const bool moving = m_animator.step();
    if (m_flashing && m_flashClock.elapsed() >= Timer::kFlashDuration) {
        m_flashing = false;
    }

    if (!moving && !m_flashing) {
        m_frameTimer->stop();
    }
    update();
}

void ElementHighlightOverlay::moveToDisplay(const QString &displayId)
{
    m_displayId = displayId;

    for (QScreen *screen : QGuiApplication::screens()) {
        if (screen->name() == displayId) {
            setGeometry(screen->geometry());
            return;
        }
    }

    qWarning() << "ElementHighlightOverlay: Unknown display" << displayId;
    if (QScreen *primary = QGuiApplication::primaryScreen()) {
        setGeometry(primary->geometry());
    }
}

qreal ElementHighlightOverlay::flashProgress() const
{
    if (!m_flashing) {
        return 1.0;
    }
    return qBound(0.0, m_flashClock.elapsed() / qreal(Timer::kFlashDuration), 1.0);
}

void ElementHighlightOverlay::paintEvent(QPaintEvent *event)
{
    Q_UNUSED(event);
    if (!m_animator.hasTarget()) {
        return;
    }

    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing);

    // Capture space -> Qt global -> widget-local
    const QRectF local = CoordinateHelper::toQtGlobal(m_animator.displayedRect())
                             .translated(-QPointF(geometry().topLeft()));
    const qreal inset = Highlight::kBorderWidth / 2.0;
    const QRectF borderRect = local.adjusted(inset, inset, -inset, -inset);

    QPainterPath path;
    path.addRoundedRect(borderRect, Highlight::kCornerRadius, Highlight::kCornerRadius);

    QColor fill = Highlight::borderColor();
    fill.setAlpha(Highlight::kFillAlpha);
    painter.fillPath(path, fill);

    if (m_flashing) {
        const int alpha = qRound(Highlight::kFlashAlpha * (1.0 - flashProgress()));
        painter.fillPath(path, QColor(255, 255, 255, alpha));
    }

    QPen pen(Highlight::borderColor(), Highlight::kBorderWidth);
    pen.setJoinStyle(Qt::RoundJoin);
    painter.setPen(pen);
    painter.setBrush(Qt::NoBrush);
    painter.drawPath(path);
}
