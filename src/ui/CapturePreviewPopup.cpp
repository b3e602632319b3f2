#include "ui/CapturePreviewPopup.h"
#include "Constants.h"
#include "platform/OverlayWindow.h"

#include <QGuiApplication>
#include <QLabel>
#include <QPixmap>
#include <QPropertyAnimation>
#include <QScreen>
#include <QTimer>
#include <QVBoxLayout>

using namespace HoverCapture;

CapturePreviewPopup::CapturePreviewPopup(QWidget *parent)
    : QWidget(parent, Qt::Tool | Qt::FramelessWindowHint | Qt::WindowStaysOnTopHint |
                      Qt::WindowDoesNotAcceptFocus)
    , m_imageLabel(nullptr)
    , m_sizeLabel(nullptr)
    , m_contentWidget(nullptr)
    , m_dismissTimer(new QTimer(this))
    , m_fadeAnimation(new QPropertyAnimation(this, "windowOpacity", this))
{
    setAttribute(Qt::WA_TranslucentBackground);
    setAttribute(Qt::WA_ShowWithoutActivating);
    setFocusPolicy(Qt::NoFocus);

    setupUi();

    m_dismissTimer->setSingleShot(true);
    connect(m_dismissTimer, &QTimer::timeout, this, &CapturePreviewPopup::fadeOut);

    connect(m_fadeAnimation, &QPropertyAnimation::finished, this, [this]() {
        if (qFuzzyIsNull(windowOpacity())) {
            hide();
        }
    });
}

CapturePreviewPopup::~CapturePreviewPopup()
{
    m_dismissTimer->stop();
    m_fadeAnimation->stop();
}

void CapturePreviewPopup::setupUi()
{
    auto* mainLayout = new QVBoxLayout(this);
    mainLayout->setContentsMargins(0, 0, 0, 0);

    m_contentWidget = new QWidget(this);
    m_contentWidget->setObjectName("previewContent");
    m_contentWidget->setStyleSheet(QString(
        "#previewContent {"
        "  background-color: rgba(30, 30, 30, 230);"
        "  border-radius: %1px;"
        "}"
    ).arg(Preview::kCornerRadius / 2));

    auto* contentLayout = new QVBoxLayout(m_contentWidget);
    contentLayout->setContentsMargins(12, 12, 12, 10);
    contentLayout->setSpacing(6);

    m_imageLabel = new QLabel(m_contentWidget);
    m_imageLabel->setAlignment(Qt::AlignCenter);
    m_imageLabel->setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Expanding);

    m_sizeLabel = new QLabel(m_contentWidget);
    m_sizeLabel->setAlignment(Qt::AlignCenter);
    m_sizeLabel->setStyleSheet("color: rgba(255, 255, 255, 200); font-size: 11px;");

    contentLayout->addWidget(m_imageLabel, 1);
    contentLayout->addWidget(m_sizeLabel);

    mainLayout->addWidget(m_contentWidget);

    setFixedSize(Preview::kWidth, Preview::kHeight);
}

void CapturePreviewPopup::showPreview(const QImage &image, int durationMs)
{
    if (image.isNull()) {
        return;
    }

    m_image = image;
    m_dismissTimer->stop();
    m_fadeAnimation->stop();

    // Thumbnail area is the popup minus margins and the caption line
    const QSize thumbArea(Preview::kWidth - 24, Preview::kHeight - 48);
    QPixmap pixmap = QPixmap::fromImage(image);
    pixmap.setDevicePixelRatio(1.0);
    const qreal dpr = devicePixelRatioF();
    QPixmap scaled = pixmap.scaled(thumbArea * dpr, Qt::KeepAspectRatio, Qt::SmoothTransformation);
    scaled.setDevicePixelRatio(dpr);
    m_imageLabel->setPixmap(scaled);
    m_sizeLabel->setText(QStringLiteral("%1 x %2").arg(image.width()).arg(image.height()));

    positionOnScreen();

    const bool wasVisible = isVisible();
    if (!wasVisible) {
        setWindowOpacity(0.0);
    }
    QWidget::show();
    raise();
    configureOverlayWindow(this, OverlayInput::Interactive);

    m_fadeAnimation->setDuration(Timer::kPreviewFadeIn);
    m_fadeAnimation->setStartValue(windowOpacity());
    m_fadeAnimation->setEndValue(1.0);
    m_fadeAnimation->setEasingCurve(QEasingCurve::OutCubic);
    m_fadeAnimation->start();

    m_dismissTimer->start(qMax(0, durationMs));
}

bool CapturePreviewPopup::isDismissPending() const
{
    return m_dismissTimer->isActive();
}

void CapturePreviewPopup::positionOnScreen()
{
    QScreen* screen = QGuiApplication::primaryScreen();
    if (!screen) {
        return;
    }

    const QRect screenGeometry = screen->availableGeometry();
    const int x = screenGeometry.right() - width() - Preview::kScreenMargin;
    const int y = screenGeometry.bottom() - height() - Preview::kScreenMargin;
    move(x, y);
}

void CapturePreviewPopup::fadeOut()
{
    m_fadeAnimation->stop();
    m_fadeAnimation->setDuration(Timer::kPreviewFadeOut);
    m_fadeAnimation->setStartValue(windowOpacity());
    m_fadeAnimation->setEndValue(0.0);
    m_fadeAnimation->setEasingCurve(QEasingCurve::InCubic);
    m_fadeAnimation->start();
}
