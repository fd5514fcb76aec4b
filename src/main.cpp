#include <QApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <QTimer>
#include "core/config.hpp"
#include "core/devicechangewatcher.hpp"
#include "core/mainarea.hpp"
#include "device/storageinfoprovider.hpp"
#include "fs/filesystem.hpp"
#include "gui/windows/mainwindow.hpp"

Q_LOGGING_CATEGORY(lcApp, "usbdeck.app")

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    QApplication::setApplicationName(QStringLiteral("usbdeck"));
    QApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Browse and eject attached USB storage devices"));
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption(QStringList() << QStringLiteral("c") << QStringLiteral("config"),
                                    QStringLiteral("Read panel options from <file>."),
                                    QStringLiteral("file"));
    parser.addOption(configOption);
    parser.process(app);

    usbdeck::core::PanelConfig config;
    if (parser.isSet(configOption)) {
        try {
            config = usbdeck::core::PanelConfig::load(parser.value(configOption).toStdString());
        } catch (const usbdeck::core::ConfigError& e) {
            qCWarning(lcApp) << "Using default options:" << e.what();
        }
    }
    if (!config.logging_rules.empty()) {
        QLoggingCategory::setFilterRules(QString::fromStdString(config.logging_rules));
    }

    auto providerFactory = []() -> std::unique_ptr<usbdeck::device::DeviceEnumerationProvider> {
        return std::make_unique<usbdeck::device::StorageInfoProvider>();
    };
    auto filesystem = std::make_shared<usbdeck::fs::LocalFileSystem>();
    auto filesystemFactory = [filesystem](const usbdeck::device::StorageDeviceInfo&) -> std::shared_ptr<usbdeck::fs::FileSystem> {
        return filesystem;
    };

    auto mainArea = std::make_unique<usbdeck::core::MainArea>(providerFactory, filesystemFactory, config);
    usbdeck::gui::MainWindow window(std::move(mainArea));
    window.show();

    usbdeck::core::MountDirectoryWatcher watcher;
    if (config.watch_device_changes) {
        window.mainArea().setDeviceChangeWatcher(&watcher);
        watcher.start();
    }

    if (config.refresh_on_startup) {
        QTimer::singleShot(0, &window.mainArea(), &usbdeck::core::MainArea::requestRefresh);
    }

    return app.exec();
}
