#ifndef IDISPLAYPROVIDER_H
#define IDISPLAYPROVIDER_H

#include "display/DisplayLayout.h"

/**
 * @brief Source of the current display layout.
 *
 * Queried on every tracking tick so displays may come and go while a
 * session is running.
 */
class IDisplayProvider
{
public:
    virtual ~IDisplayProvider() = default;

    virtual DisplayLayout currentLayout() const = 0;
};

#endif // IDISPLAYPROVIDER_H
