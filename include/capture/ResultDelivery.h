#ifndef RESULTDELIVERY_H
#define RESULTDELIVERY_H

#include <QImage>

// Destination for a captured image on the system clipboard
class IImageClipboard
{
public:
    virtual ~IImageClipboard() = default;

    virtual void setImage(const QImage &image) = 0;
};

// Short-lived visual confirmation of a capture
class IPreviewPresenter
{
public:
    virtual ~IPreviewPresenter() = default;

    virtual void showPreview(const QImage &image, int durationMs) = 0;
};

// Audible confirmation of a successful capture
class ICaptureSound
{
public:
    virtual ~ICaptureSound() = default;

    virtual void play() = 0;
};

// QGuiApplication::clipboard()
class QtImageClipboard : public IImageClipboard
{
public:
    void setImage(const QImage &image) override;
};

// QApplication::beep(), the platform alert sound
class QtCaptureSound : public ICaptureSound
{
public:
    void play() override;
};

#endif // RESULTDELIVERY_H
