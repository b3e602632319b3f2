#ifndef HOVERCAPTURE_CONSTANTS_H
#define HOVERCAPTURE_CONSTANTS_H

#include <QColor>

namespace HoverCapture {

// ============================================================================
// TIMER & ANIMATION (milliseconds)
// ============================================================================
namespace Timer {
constexpr int k60FpsInterval = 16;            // Target tracking / overlay tick
constexpr int kFlashDuration = 80;            // Capture flash fade-out
constexpr int kFlashBeforeCapture = 100;      // Flash visible before overlay hides
constexpr int kOverlayHideBeforeCapture = 50; // Overlay hidden before grabbing
constexpr int kPreviewFadeIn = 300;           // Preview popup fade-in
constexpr int kPreviewFadeOut = 250;          // Preview popup fade-out
}  // namespace Timer

// ============================================================================
// ELEMENT CAPTURE GEOMETRY (capture-space units)
// ============================================================================
namespace ElementCapture {
constexpr qreal kHighlightPadding = 4.0;       // Inflation applied to every target
constexpr qreal kHysteresisTolerance = 2.0;    // Edge movement ignored below this
constexpr qreal kMaxTargetDimension = 10000.0; // Larger targets are clamped to the display
constexpr qreal kMaxCaptureDimension = 50000.0;// Capture requests must stay below this
constexpr qreal kMinFallbackWindowSize = 50.0; // Window fallback ignores windows this small
constexpr qreal kMinCaptureDimension = 1.0;    // Smallest capturable extent after clamping
}  // namespace ElementCapture

// ============================================================================
// HIGHLIGHT OVERLAY
// ============================================================================
namespace Highlight {
constexpr qreal kBaseSmoothing = 0.18;         // Interpolation factor when close
constexpr qreal kMaxSmoothing = 0.4;           // Interpolation factor cap when far
constexpr qreal kSmoothingDistance = 200.0;    // Distance at which smoothing doubles
constexpr qreal kSnapThreshold = 0.3;          // Snap when every component is this close
constexpr int kBorderWidth = 2;
constexpr int kCornerRadius = 6;
constexpr int kFillAlpha = 26;
constexpr int kFlashAlpha = 204;

inline QColor borderColor() { return QColor(50, 173, 230); }
}  // namespace Highlight

// ============================================================================
// PREVIEW POPUP (pixels)
// ============================================================================
namespace Preview {
constexpr int kWidth = 280;
constexpr int kHeight = 220;
constexpr int kScreenMargin = 20;
constexpr int kCornerRadius = 28;
}  // namespace Preview

}  // namespace HoverCapture

#endif // HOVERCAPTURE_CONSTANTS_H
