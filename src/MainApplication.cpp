#include "MainApplication.h"
#include "capture/CaptureResultSink.h"
#include "capture/RegionCaptureEngine.h"
#include "detection/ElementInspectorFactory.h"
#include "detection/IElementInspector.h"
#include "hotkey/HotkeyManager.h"
#include "input/ClickInterceptor.h"
#include "session/ElementCaptureController.h"
#include "ui/CapturePreviewPopup.h"
#include "ui/ElementHighlightOverlay.h"
#include "WindowDetector.h"

#include <QAction>
#include <QApplication>
#include <QCoreApplication>
#include <QDebug>
#include <QMenu>
#include <QPainter>
#include <QPixmap>
#include <QSystemTrayIcon>

using namespace HoverCapture;

namespace {

QIcon createTrayIcon()
{
    QPixmap pixmap(32, 32);
    pixmap.fill(Qt::transparent);

    QPainter painter(&pixmap);
    painter.setRenderHint(QPainter::Antialiasing);
    QPen pen(QColor(50, 173, 230), 3);
    painter.setPen(pen);
    painter.setBrush(QColor(50, 173, 230, 60));
    painter.drawRoundedRect(QRectF(5.5, 5.5, 21, 21), 5, 5);
    painter.setBrush(QColor(50, 173, 230));
    painter.setPen(Qt::NoPen);
    painter.drawEllipse(QPointF(16, 16), 4, 4);
    painter.end();

    return QIcon(pixmap);
}

}  // namespace

MainApplication::MainApplication(QObject* parent)
    : QObject(parent)
    , m_trayIcon(nullptr)
    , m_trayMenu(nullptr)
    , m_elementCaptureAction(nullptr)
    , m_fullscreenCaptureAction(nullptr)
    , m_windowCaptureAction(nullptr)
    , m_windowDetector(nullptr)
    , m_elementInspector(nullptr)
    , m_previewPopup(nullptr)
    , m_highlightOverlay(nullptr)
    , m_resultSink(nullptr)
    , m_controller(nullptr)
{
}

MainApplication::~MainApplication()
{
    if (m_controller) {
        m_controller->stop();
    }
    HotkeyManager::instance().shutdown();
    delete m_trayMenu;
    delete m_highlightOverlay;
    delete m_previewPopup;
}

void MainApplication::initialize()
{
    qRegisterMetaType<CaptureMode>("CaptureMode");
    qRegisterMetaType<CaptureError>("CaptureError");

    m_windowDetector = new WindowDetector(this);
    if (!m_windowDetector->isAvailable()) {
        qWarning() << "MainApplication: Window listing unavailable, window fallback disabled";
    }

    m_elementInspector = createPlatformElementInspector(this);
    if (!m_elementInspector) {
        qDebug() << "MainApplication: No element inspector on this platform, using window bounds";
    }

    m_engine = std::make_unique<RegionCaptureEngine>(&m_permissions, &m_displays, &m_grabber);

    // Top-level widgets: not parented to a QObject
    m_previewPopup = new CapturePreviewPopup();
    m_highlightOverlay = new ElementHighlightOverlay();

    m_resultSink = new CaptureResultSink(&m_clipboard, m_previewPopup, &m_captureSound, this);

    CaptureServices services;
    services.permissions = &m_permissions;
    services.displays = &m_displays;
    services.pointer = &m_pointer;
    services.inspector = m_elementInspector;
    services.windows = m_windowDetector;
    services.overlay = m_highlightOverlay;
    services.engine = m_engine.get();
    services.sink = m_resultSink;
    services.createInterceptor = [this](QObject *parent) {
        return ClickInterceptor::create(&m_permissions, parent);
    };
    services.excludedProcessId = QCoreApplication::applicationPid();

    m_controller = new ElementCaptureController(services, this);
    connect(m_controller, &ElementCaptureController::captureCompleted,
            this, &MainApplication::onCaptureCompleted);
    connect(m_controller, &ElementCaptureController::captureFailed,
            this, &MainApplication::onCaptureFailed);
    connect(m_controller, &ElementCaptureController::activeChanged,
            this, &MainApplication::onActiveChanged);

    setupTrayMenu();
    setupHotkeys();

    qDebug() << "HoverCapture initialized and running in system tray";
}

void MainApplication::setupTrayMenu()
{
    m_trayIcon = new QSystemTrayIcon(createTrayIcon(), this);
    m_trayMenu = new QMenu();

    m_elementCaptureAction = m_trayMenu->addAction("Capture Element");
    connect(m_elementCaptureAction, &QAction::triggered, this, [this]() {
        triggerCapture(CaptureMode::Element);
    });

    m_fullscreenCaptureAction = m_trayMenu->addAction("Capture Screen");
    connect(m_fullscreenCaptureAction, &QAction::triggered, this, [this]() {
        triggerCapture(CaptureMode::Fullscreen);
    });

    m_windowCaptureAction = m_trayMenu->addAction("Capture Window");
    connect(m_windowCaptureAction, &QAction::triggered, this, [this]() {
        triggerCapture(CaptureMode::Window);
    });

    m_trayMenu->addSeparator();

    QAction* exitAction = m_trayMenu->addAction("Exit");
    connect(exitAction, &QAction::triggered, qApp, &QCoreApplication::quit);

    m_trayIcon->setContextMenu(m_trayMenu);
    m_trayIcon->setToolTip("HoverCapture - Element Capture");
    m_trayIcon->show();
}

void MainApplication::setupHotkeys()
{
    auto &hotkeys = HotkeyManager::instance();
    connect(&hotkeys, &HotkeyManager::actionTriggered,
            this, &MainApplication::onHotkeyAction);
    connect(&hotkeys, &HotkeyManager::bindingChanged,
            this, &MainApplication::updateTrayMenuHotkeyText);

    hotkeys.initialize();

    for (const HotkeyMetadata &meta : kDefaultHotkeys) {
        updateTrayMenuHotkeyText(meta.action);
        if (hotkeys.status(meta.action) == HotkeyStatus::Failed) {
            m_trayIcon->showMessage("Hotkey Registration Failed",
                QString("%1 shortcut %2 is in use by another application.")
                    .arg(QString::fromLatin1(meta.displayName),
                         hotkeys.binding(meta.action).value_or(HotkeyBinding()).toDisplayString()),
                QSystemTrayIcon::Warning, 5000);
        }
    }
}

QAction *MainApplication::actionForHotkey(HotkeyAction action) const
{
    switch (action) {
    case HotkeyAction::ElementCapture:
        return m_elementCaptureAction;
    case HotkeyAction::FullscreenCapture:
        return m_fullscreenCaptureAction;
    case HotkeyAction::WindowCapture:
        return m_windowCaptureAction;
    default:
        return nullptr;
    }
}

void MainApplication::updateTrayMenuHotkeyText(HotkeyAction action)
{
    QAction *menuAction = actionForHotkey(action);
    const HotkeyMetadata *meta = metadataForAction(action);
    if (!menuAction || !meta) {
        return;
    }

    const auto binding = HotkeyManager::instance().binding(action);
    if (binding) {
        menuAction->setText(QString("%1 (%2)").arg(QString::fromLatin1(meta->displayName), binding->toDisplayString()));
    } else {
        menuAction->setText(QString::fromLatin1(meta->displayName));
    }
}

void MainApplication::triggerCapture(CaptureMode mode)
{
    // Close any open popup menus so the tray menu is not captured
    if (QWidget *popup = QApplication::activePopupWidget()) {
        popup->close();
    }

    qDebug() << "MainApplication: Capture triggered, mode" << captureModeName(mode);
    m_controller->toggle(mode);
}

void MainApplication::onHotkeyAction(HotkeyAction action)
{
    const HotkeyMetadata *meta = metadataForAction(action);
    if (!meta) {
        qWarning() << "MainApplication: Unknown hotkey action" << static_cast<int>(action);
        return;
    }
    triggerCapture(meta->mode);
}

void MainApplication::onCaptureCompleted(const QImage &image)
{
    qDebug() << "MainApplication: Capture completed" << image.size();
}

void MainApplication::onCaptureFailed(CaptureError error, const QString &message)
{
    qDebug() << "MainApplication: Capture failed" << captureErrorName(error) << message;
}

void MainApplication::onActiveChanged(bool active)
{
    m_trayIcon->setToolTip(active ? "HoverCapture - Click to capture, Esc to cancel"
                                  : "HoverCapture - Element Capture");
}
