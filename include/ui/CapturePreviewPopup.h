#ifndef CAPTUREPREVIEWPOPUP_H
#define CAPTUREPREVIEWPOPUP_H

#include "capture/ResultDelivery.h"

#include <QImage>
#include <QWidget>

class QLabel;
class QPropertyAnimation;
class QTimer;

/**
 * @brief Floating thumbnail shown after a successful capture.
 *
 * Appears in the bottom-right corner of the primary screen without
 * taking focus, then fades out after the requested duration. A new
 * preview replaces the one on screen.
 */
class CapturePreviewPopup : public QWidget, public IPreviewPresenter
{
    Q_OBJECT

public:
    explicit CapturePreviewPopup(QWidget *parent = nullptr);
    ~CapturePreviewPopup() override;

    void showPreview(const QImage &image, int durationMs) override;

    QImage image() const { return m_image; }
    bool isDismissPending() const;

private:
    void setupUi();
    void positionOnScreen();
    void fadeOut();

    QImage m_image;
    QLabel *m_imageLabel;
    QLabel *m_sizeLabel;
    QWidget *m_contentWidget;
    QTimer *m_dismissTimer;
    QPropertyAnimation *m_fadeAnimation;
};

#endif // CAPTUREPREVIEWPOPUP_H
