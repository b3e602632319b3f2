#ifndef IPOINTERSOURCE_H
#define IPOINTERSOURCE_H

#include <QPointF>

// Current pointer position in input space
class IPointerSource
{
public:
    virtual ~IPointerSource() = default;

    virtual QPointF pointerPosition() const = 0;
};

#endif // IPOINTERSOURCE_H
