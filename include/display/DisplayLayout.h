#ifndef DISPLAYLAYOUT_H
#define DISPLAYLAYOUT_H

#include <QPointF>
#include <QRectF>
#include <QString>
#include <QVector>
#include <optional>

// One connected display. frame is in input space (bottom-left origin).
struct DisplayDescriptor {
    QString id;             // Platform screen name, stable while the display is connected
    QRectF frame;           // Logical frame, input space
    qreal scaleFactor = 1.0;
    bool isPrimary = false;
};

/**
 * @brief Snapshot of the connected displays.
 *
 * Exactly one descriptor is primary. The primary's height anchors the
 * capture space <-> input space conversion for every display.
 */
class DisplayLayout
{
public:
    DisplayLayout() = default;
    explicit DisplayLayout(const QVector<DisplayDescriptor> &displays);

    const QVector<DisplayDescriptor> &displays() const { return m_displays; }
    bool isEmpty() const { return m_displays.isEmpty(); }

    std::optional<DisplayDescriptor> primary() const;
    qreal primaryHeight() const;

    // Display whose input-space frame contains the point (half-open)
    std::optional<DisplayDescriptor> displayAt(const QPointF &inputPoint) const;
    std::optional<DisplayDescriptor> findById(const QString &id) const;

    // Display frame converted to capture space
    QRectF captureFrame(const DisplayDescriptor &display) const;

private:
    QVector<DisplayDescriptor> m_displays;
};

#endif // DISPLAYLAYOUT_H
