#ifndef CAPTURETYPES_H
#define CAPTURETYPES_H

#include <QImage>
#include <QMetaType>
#include <QString>

enum class CaptureMode {
    Element,     // Hover-and-click on a UI element or window
    Fullscreen,  // Whole display under the pointer, captured immediately
    Window       // Window under the pointer, captured immediately
};

enum class CaptureError {
    None,
    PermissionDenied,
    NoDisplay,
    NoElement,
    CaptureFailed
};

inline QString captureModeName(CaptureMode mode)
{
    switch (mode) {
    case CaptureMode::Element:
        return QStringLiteral("element");
    case CaptureMode::Fullscreen:
        return QStringLiteral("fullscreen");
    case CaptureMode::Window:
        return QStringLiteral("window");
    }
    return QString();
}

inline bool captureModeFromName(const QString &name, CaptureMode &mode)
{
    const QString normalized = name.trimmed().toLower();
    if (normalized == QLatin1String("element")) {
        mode = CaptureMode::Element;
    } else if (normalized == QLatin1String("fullscreen")) {
        mode = CaptureMode::Fullscreen;
    } else if (normalized == QLatin1String("window")) {
        mode = CaptureMode::Window;
    } else {
        return false;
    }
    return true;
}

inline QString captureErrorName(CaptureError error)
{
    switch (error) {
    case CaptureError::None:
        return QStringLiteral("None");
    case CaptureError::PermissionDenied:
        return QStringLiteral("PermissionDenied");
    case CaptureError::NoDisplay:
        return QStringLiteral("NoDisplay");
    case CaptureError::NoElement:
        return QStringLiteral("NoElement");
    case CaptureError::CaptureFailed:
        return QStringLiteral("CaptureFailed");
    }
    return QString();
}

/**
 * @brief Outcome of one region capture.
 *
 * Success means error == None and a non-null image.
 */
struct CaptureResult {
    QImage image;
    CaptureError error = CaptureError::None;
    QString message;

    bool isSuccess() const { return error == CaptureError::None && !image.isNull(); }

    static CaptureResult success(const QImage &image)
    {
        CaptureResult result;
        result.image = image;
        return result;
    }

    static CaptureResult failure(CaptureError error, const QString &message)
    {
        CaptureResult result;
        result.error = error;
        result.message = message;
        return result;
    }
};

Q_DECLARE_METATYPE(CaptureMode)
Q_DECLARE_METATYPE(CaptureError)

#endif // CAPTURETYPES_H
