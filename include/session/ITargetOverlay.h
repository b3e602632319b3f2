#ifndef ITARGETOVERLAY_H
#define ITARGETOVERLAY_H

#include <QRectF>
#include <QString>

/**
 * @brief Visual feedback for the tracked target.
 *
 * animateTo() is idempotent for an unchanged rectangle. deactivate()
 * hides everything and may be called repeatedly.
 */
class ITargetOverlay
{
public:
    virtual ~ITargetOverlay() = default;

    virtual void activate() = 0;
    virtual void animateTo(const QRectF &captureRect, const QString &displayId) = 0;
    virtual void hideTarget() = 0;
    virtual void flash() = 0;
    virtual void deactivate() = 0;
};

#endif // ITARGETOVERLAY_H
