#ifndef CAPTURERESULTSINK_H
#define CAPTURERESULTSINK_H

#include "capture/CaptureTypes.h"

#include <QObject>

class ICaptureSound;
class IImageClipboard;
class IPreviewPresenter;

/**
 * @brief Delivers capture results to the user.
 *
 * Success: sound, clipboard, then preview, each when enabled in
 * ElementCaptureSettingsManager. Failure: diagnostic log only.
 * Any collaborator may be null.
 */
class CaptureResultSink : public QObject
{
    Q_OBJECT

public:
    CaptureResultSink(IImageClipboard *clipboard,
                      IPreviewPresenter *preview,
                      ICaptureSound *sound = nullptr,
                      QObject *parent = nullptr);

    void deliver(const CaptureResult &result);

signals:
    void delivered(const QImage &image);
    void failed(CaptureError error, const QString &message);

private:
    IImageClipboard *m_clipboard;
    IPreviewPresenter *m_preview;
    ICaptureSound *m_sound;
};

#endif // CAPTURERESULTSINK_H
