#ifndef IELEMENTINSPECTOR_H
#define IELEMENTINSPECTOR_H

#include <QObject>
#include <QPointF>
#include <QRectF>
#include <optional>

/**
 * @brief UI introspection: bounds of the deepest element at a point.
 *
 * Points and rectangles are in capture space. Returns nullopt when no
 * element is reachable (no accessible tree, permission missing, etc).
 */
class IElementInspector : public QObject
{
public:
    explicit IElementInspector(QObject *parent = nullptr)
        : QObject(parent) {}
    ~IElementInspector() override = default;

    virtual std::optional<QRectF> elementRectAt(const QPointF &capturePoint) = 0;
};

#endif // IELEMENTINSPECTOR_H
