#ifndef WINDOWDETECTOR_H
#define WINDOWDETECTOR_H

#include "detection/IWindowLister.h"

#include <memory>

/**
 * @brief Platform window enumeration.
 *
 * Windows: EnumWindows in z-order, DWM extended frame bounds.
 * Linux: _NET_CLIENT_LIST_STACKING on the X11 root window.
 *
 * Bounds are converted from native pixels to capture space.
 */
class WindowDetector : public IWindowLister
{
    Q_OBJECT

public:
    explicit WindowDetector(QObject *parent = nullptr);
    ~WindowDetector() override;

    QVector<DetectedWindow> onScreenWindows() const override;

    // False when the native window list cannot be read (no X display)
    bool isAvailable() const;

private:
    class Private;
    std::unique_ptr<Private> d;
};

#endif // WINDOWDETECTOR_H
