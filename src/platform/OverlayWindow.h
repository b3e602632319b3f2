#ifndef OVERLAYWINDOW_H
#define OVERLAYWINDOW_H

class QWidget;

enum class OverlayInput {
    ClickThrough,   // Pointer events reach the windows underneath
    Interactive,
};

// Keeps a shown top-level widget above normal windows without ever taking focus.
// Call after show(); native window styles are reset when the window is recreated.
void configureOverlayWindow(QWidget *widget, OverlayInput input);

#endif // OVERLAYWINDOW_H
