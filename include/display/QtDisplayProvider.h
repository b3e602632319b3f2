#ifndef QTDISPLAYPROVIDER_H
#define QTDISPLAYPROVIDER_H

#include "display/IDisplayProvider.h"
#include "display/IPointerSource.h"

/**
 * @brief Display layout built from QGuiApplication::screens().
 *
 * Qt reports screen geometry in its virtual desktop; frames are shifted
 * to the primary display's origin and reflected into input space.
 */
class QtDisplayProvider : public IDisplayProvider
{
public:
    DisplayLayout currentLayout() const override;
};

// Pointer position from QCursor::pos(), converted to input space
class QtPointerSource : public IPointerSource
{
public:
    QPointF pointerPosition() const override;
};

#endif // QTDISPLAYPROVIDER_H
