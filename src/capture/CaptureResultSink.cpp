#include "capture/CaptureResultSink.h"
#include "capture/ResultDelivery.h"
#include "settings/ElementCaptureSettingsManager.h"

#include <QApplication>
#include <QClipboard>
#include <QDebug>
#include <QGuiApplication>

void QtImageClipboard::setImage(const QImage &image)
{
    QClipboard *clipboard = QGuiApplication::clipboard();
    if (!clipboard) {
        qWarning() << "QtImageClipboard: No clipboard available";
        return;
    }
    clipboard->setImage(image);
}

void QtCaptureSound::play()
{
    QApplication::beep();
}

CaptureResultSink::CaptureResultSink(IImageClipboard *clipboard,
                                     IPreviewPresenter *preview,
                                     ICaptureSound *sound,
                                     QObject *parent)
    : QObject(parent)
    , m_clipboard(clipboard)
    , m_preview(preview)
    , m_sound(sound)
{
}

void CaptureResultSink::deliver(const CaptureResult &result)
{
    if (!result.isSuccess()) {
        const CaptureError error = result.error == CaptureError::None ? CaptureError::CaptureFailed
                                                                       : result.error;
        qDebug() << "CaptureResultSink: Capture ended with" << captureErrorName(error)
                 << result.message;
        emit failed(error, result.message);
        return;
    }

    const auto &settings = ElementCaptureSettingsManager::instance();

    if (m_sound && settings.isCaptureSoundEnabled()) {
        m_sound->play();
    }

    if (m_clipboard && settings.isCopyToClipboardEnabled()) {
        m_clipboard->setImage(result.image);
        qDebug() << "CaptureResultSink: Copied" << result.image.size() << "to clipboard";
    }

    if (m_preview && settings.isPreviewEnabled()) {
        m_preview->showPreview(result.image, settings.loadPreviewDurationMs());
    }

    emit delivered(result.image);
}
