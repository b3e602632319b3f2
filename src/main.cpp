#include <QApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QTimer>
#include "MainApplication.h"
#include "hotkey/HotkeyManager.h"
#include "version.h"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    // Critical: Don't quit when last window closes (we're a tray app)
    app.setQuitOnLastWindowClosed(false);

    app.setApplicationName(HOVERCAPTURE_APP_NAME);
    app.setOrganizationName("HoverCapture");
    app.setApplicationVersion(HOVERCAPTURE_APP_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription("Hover over an element, window or screen and click to capture it");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption captureOption(
        QStringList() << "c" << "capture",
        "Start a capture right away. <mode> is element, fullscreen or window.",
        "mode");
    parser.addOption(captureOption);
    QCommandLineOption bindOption(
        "bind",
        "Store a global shortcut, e.g. element=Ctrl+Shift+E. May be repeated.",
        "mode=keys");
    parser.addOption(bindOption);
    QCommandLineOption unbindOption(
        "unbind",
        "Remove the stored global shortcut for <mode>. May be repeated.",
        "mode");
    parser.addOption(unbindOption);
    parser.process(app);

    CaptureMode initialMode = CaptureMode::Element;
    const bool captureRequested = parser.isSet(captureOption);
    if (captureRequested && !captureModeFromName(parser.value(captureOption), initialMode)) {
        qWarning() << "Unknown capture mode:" << parser.value(captureOption);
        return 1;
    }

    MainApplication mainApp;
    mainApp.initialize();

    auto &hotkeys = HoverCapture::HotkeyManager::instance();
    for (const QString &mode : parser.values(unbindOption)) {
        CaptureMode unbindMode = CaptureMode::Element;
        if (!captureModeFromName(mode, unbindMode)) {
            qWarning() << "Unknown capture mode:" << mode;
            continue;
        }
        hotkeys.clearBinding(HoverCapture::actionForMode(unbindMode));
    }
    for (const QString &value : parser.values(bindOption)) {
        const int separator = value.indexOf('=');
        CaptureMode bindMode = CaptureMode::Element;
        if (separator <= 0 || !captureModeFromName(value.left(separator), bindMode)) {
            qWarning() << "Invalid --bind value:" << value;
            continue;
        }
        const auto binding = HoverCapture::HotkeyBinding::fromString(value.mid(separator + 1));
        if (!binding) {
            qWarning() << "Invalid shortcut:" << value.mid(separator + 1);
            continue;
        }
        if (!hotkeys.setBinding(HoverCapture::actionForMode(bindMode), *binding)) {
            qWarning() << "Shortcut stored but could not be registered:" << binding->toDisplayString();
        }
    }

    if (captureRequested) {
        QTimer::singleShot(0, &mainApp, [&mainApp, initialMode]() {
            mainApp.triggerCapture(initialMode);
        });
    }

    return app.exec();
}
