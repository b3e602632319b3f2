#ifndef ELEMENTHIGHLIGHTOVERLAY_H
#define ELEMENTHIGHLIGHTOVERLAY_H

#include "session/ITargetOverlay.h"
#include "tracking/HighlightAnimator.h"

#include <QElapsedTimer>
#include <QRectF>
#include <QString>
#include <QWidget>

class QScreen;
class QTimer;

/**
 * @brief Click-through highlight drawn over the hovered target.
 *
 * One borderless window covers the display that holds the target and
 * follows it across displays. The rectangle glides between targets at
 * the tracking frame rate and snaps when it lands on a new display.
 */
class ElementHighlightOverlay : public QWidget, public ITargetOverlay
{
    Q_OBJECT

public:
    explicit ElementHighlightOverlay(QWidget *parent = nullptr);
    ~ElementHighlightOverlay() override;

    void activate() override;
    void animateTo(const QRectF &captureRect, const QString &displayId) override;
    void hideTarget() override;
    void flash() override;
    void deactivate() override;

    bool isActive() const { return m_active; }
    bool isFlashing() const { return m_flashing; }
    QString displayId() const { return m_displayId; }
    QRectF displayedRect() const { return m_animator.displayedRect(); }

protected:
    void paintEvent(QPaintEvent *event) override;

private:
    void onFrame();
    void moveToDisplay(const QString &displayId);
    qreal flashProgress() const;

    HighlightAnimator m_animator;
    QTimer *m_frameTimer;
    QElapsedTimer m_flashClock;
    QString m_displayId;
    bool m_active = false;
    bool m_flashing = false;
};

#endif // ELEMENTHIGHLIGHTOVERLAY_H
