#ifndef IWINDOWLISTER_H
#define IWINDOWLISTER_H

#include <QObject>
#include <QRectF>
#include <QVector>

// Shell surfaces are reported so the fallback can step past them
enum class WindowLayer {
    Normal,
    Desktop,    // Wallpaper / icon host
    Panel       // Taskbar, dock, status bar
};

// On-screen window in capture space
struct DetectedWindow {
    QRectF bounds;          // Visible frame, capture space, logical units
    qint64 ownerPid = 0;
    WindowLayer layer = WindowLayer::Normal;
};

/**
 * @brief Window-list fallback used when introspection finds nothing.
 *
 * onScreenWindows() returns visible windows front to back.
 */
class IWindowLister : public QObject
{
public:
    explicit IWindowLister(QObject *parent = nullptr)
        : QObject(parent) {}
    ~IWindowLister() override = default;

    virtual QVector<DetectedWindow> onScreenWindows() const = 0;
};

#endif // IWINDOWLISTER_H
