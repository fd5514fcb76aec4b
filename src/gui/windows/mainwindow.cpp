#include "mainwindow.hpp"
#include "gui/widgets/drivelist.hpp"
#include "gui/widgets/filepage.hpp"
#include "gui/widgets/sidebar.hpp"
#include <QHBoxLayout>
#include <QMenu>
#include <QMenuBar>
#include <QMessageBox>
#include <QStackedWidget>
#include <QStatusBar>
#include <QToolBar>

namespace usbdeck::gui {

namespace {

constexpr int kStatusTimeoutMs = 5000;

QString orDash(const std::optional<std::string>& value) {
    return value ? QString::fromStdString(*value) : QStringLiteral("-");
}

} // namespace

MainWindow::MainWindow(std::unique_ptr<core::MainArea> main_area, QWidget* parent)
    : QMainWindow(parent)
    , main_area_(std::move(main_area)) {
    setupUi();
    setupMenusAndActions();
    connectMainArea();

    main_area_->setPageHost(this);
    main_area_->setOverviewSelection(drive_list_);

    onStateChanged(main_area_->snapshot());
    onCurrentViewChanged(main_area_->currentView());
}

// Pages die with main_area_; their widgets must not outlive the host link
MainWindow::~MainWindow() {
    main_area_->setPageHost(nullptr);
    main_area_->setOverviewSelection(nullptr);
    for (auto& kv : page_widgets_) {
        stack_->removeWidget(kv.second);
        delete kv.second;
    }
    page_widgets_.clear();
    main_area_.reset();
}

void MainWindow::setupUi() {
    setWindowTitle(tr("USB Devices"));
    resize(900, 560);

    auto* central = new QWidget(this);
    auto* layout = new QHBoxLayout(central);

    sidebar_ = new Sidebar(central);
    stack_ = new QStackedWidget(central);
    drive_list_ = new DriveList(stack_);
    stack_->addWidget(drive_list_);

    layout->addWidget(sidebar_);
    layout->addWidget(stack_, 1);
    setCentralWidget(central);

    connect(sidebar_, &Sidebar::overviewRequested, main_area_.get(), &core::MainArea::showOverview);
    connect(sidebar_, &Sidebar::deviceRequested, this, [this](const QString& id) {
        main_area_->showDevice(device::DeviceId{id.toStdString()});
    });
    connect(drive_list_, &DriveList::deviceActivated, this, [this](const QString& id) {
        main_area_->showDevice(device::DeviceId{id.toStdString()});
    });
    connect(drive_list_, &DriveList::deviceSelectionChanged, this, &MainWindow::onSelectionChanged);

    statusBar()->showMessage(tr("Ready"));
}

void MainWindow::setupMenusAndActions() {
    actions_.refresh = new QAction(QIcon::fromTheme(QStringLiteral("view-refresh")), tr("&Refresh"), this);
    actions_.details = new QAction(QIcon::fromTheme(QStringLiteral("document-properties")), tr("&Details..."), this);
    actions_.eject = new QAction(QIcon::fromTheme(QStringLiteral("media-eject")), tr("&Eject"), this);
    actions_.quit = new QAction(QIcon::fromTheme(QStringLiteral("application-exit")), tr("&Quit"), this);

    actions_.refresh->setShortcut(QKeySequence::Refresh);
    actions_.eject->setShortcut(tr("Ctrl+E"));
    actions_.quit->setShortcut(QKeySequence::Quit);

    QMenu* fileMenu = menuBar()->addMenu(tr("&File"));
    fileMenu->addAction(actions_.quit);

    QMenu* deviceMenu = menuBar()->addMenu(tr("&Device"));
    deviceMenu->addAction(actions_.refresh);
    deviceMenu->addSeparator();
    deviceMenu->addAction(actions_.details);
    deviceMenu->addAction(actions_.eject);

    connect(actions_.refresh, &QAction::triggered, main_area_.get(), &core::MainArea::requestRefresh);
    connect(actions_.details, &QAction::triggered, main_area_.get(), &core::MainArea::requestDetails);
    connect(actions_.eject, &QAction::triggered, main_area_.get(), &core::MainArea::requestEject);
    connect(actions_.quit, &QAction::triggered, this, &QWidget::close);

    auto* toolbar = new QToolBar(tr("Main Toolbar"), this);
    toolbar->setMovable(false);
    toolbar->setIconSize(QSize(24, 24));
    toolbar->setToolButtonStyle(Qt::ToolButtonTextUnderIcon);
    toolbar->addAction(actions_.refresh);
    toolbar->addSeparator();
    toolbar->addAction(actions_.details);
    toolbar->addAction(actions_.eject);
    addToolBar(toolbar);

    updateActions();
}

void MainWindow::connectMainArea() {
    core::MainArea* area = main_area_.get();
    connect(area, &core::MainArea::stateChanged, this, &MainWindow::onStateChanged);
    connect(area, &core::MainArea::currentViewChanged, this, &MainWindow::onCurrentViewChanged);
    connect(area, &core::MainArea::interactivityChanged, this, &MainWindow::onInteractivityChanged);
    connect(area, &core::MainArea::detailsRequested, this, &MainWindow::onDetailsRequested);
    connect(area, &core::MainArea::refreshFailed, this, &MainWindow::onError);
    connect(area, &core::MainArea::ejectCompleted, this, &MainWindow::onEjectCompleted);
}

void MainWindow::attachPage(const device::DeviceId& id, core::FileBrowserPage& page) {
    auto* widget = new FilePage(page, stack_);
    stack_->addWidget(widget);
    page_widgets_[id] = widget;

    connect(widget, &FilePage::errorOccurred, this, &MainWindow::onError);
    connect(widget, &FilePage::refreshAllRequested, this, [this, id]() {
        main_area_->requestPageRefresh(id);
    });
}

void MainWindow::detachPage(const device::DeviceId& id) {
    auto it = page_widgets_.find(id);
    if (it == page_widgets_.end()) {
        return;
    }
    FilePage* widget = it->second;
    page_widgets_.erase(it);
    stack_->removeWidget(widget);
    delete widget;
}

void MainWindow::closeEvent(QCloseEvent* event) {
    main_area_->beginClosing();
    event->accept();
}

void MainWindow::onStateChanged(const core::MainAreaSnapshot& snapshot) {
    snapshot_ = snapshot;
    drive_list_->setDevices(snapshot.devices);
    sidebar_->setStorages(snapshot.storages);

    if (snapshot.is_scanning) {
        statusBar()->showMessage(tr("Scanning devices..."));
    } else {
        statusBar()->showMessage(tr("%n device(s)", nullptr, static_cast<int>(snapshot.devices.size())));
    }
    updateActions();
}

void MainWindow::onCurrentViewChanged(const core::ViewTarget& view) {
    if (view.isOverview()) {
        stack_->setCurrentWidget(drive_list_);
        sidebar_->selectOverview();
        return;
    }

    auto it = page_widgets_.find(view.deviceId);
    if (it == page_widgets_.end()) {
        stack_->setCurrentWidget(drive_list_);
        sidebar_->selectOverview();
        return;
    }
    it->second->render();
    stack_->setCurrentWidget(it->second);
    sidebar_->selectDevice(QString::fromStdString(view.deviceId.instanceId));
}

void MainWindow::onInteractivityChanged(bool enabled) {
    interactive_ = enabled;
    centralWidget()->setEnabled(enabled);
    updateActions();
}

void MainWindow::onDetailsRequested(const device::StorageDeviceInfo& storage) {
    const device::BaseDeviceInfo& base = storage.base;

    QString text;
    text += tr("Device: %1\n").arg(QString::fromStdString(base.id.instanceId));
    text += tr("Manufacturer: %1\n").arg(orDash(base.manufacturer));
    text += tr("Product: %1\n").arg(orDash(base.product));
    text += tr("Serial number: %1\n").arg(orDash(base.serialNumber));
    if (base.vendorId && base.productId) {
        text += tr("VID:PID: %1:%2\n")
            .arg(QString::fromStdString(*base.vendorId), QString::fromStdString(*base.productId));
    }
    if (base.usbVersion) {
        text += tr("USB version: %1\n").arg(QString::fromStdString(*base.usbVersion));
    }
    if (base.speedMbps) {
        text += tr("Speed: %1 Mbit/s\n").arg(*base.speedMbps);
    }

    for (const device::VolumeInfo& volume : storage.volumes) {
        text += QLatin1Char('\n');
        text += tr("Volume: %1\n").arg(orDash(volume.volumeLabel));
        if (volume.mountPath) {
            text += tr("Mounted at: %1\n").arg(QString::fromStdString(volume.mountPath->string()));
        }
        text += tr("File system: %1\n").arg(orDash(volume.fileSystem));
        if (volume.totalBytes) {
            text += tr("Capacity: %1\n").arg(formatSize(*volume.totalBytes));
        }
        if (volume.freeBytes) {
            text += tr("Free: %1\n").arg(formatSize(*volume.freeBytes));
        }
    }

    QMessageBox::information(this, tr("Device Details"), text);
}

void MainWindow::onError(const QString& message) {
    statusBar()->showMessage(message, kStatusTimeoutMs);
}

void MainWindow::onEjectCompleted(const QString& message) {
    statusBar()->showMessage(message, kStatusTimeoutMs);
}

void MainWindow::onSelectionChanged(const QString& instance_id) {
    Q_UNUSED(instance_id);
    updateActions();
}

void MainWindow::updateActions() {
    bool storageSelected = drive_list_ && snapshot_.isStorageSelected(drive_list_->selectedDevice());

    actions_.refresh->setEnabled(interactive_);
    actions_.details->setEnabled(interactive_ && storageSelected);
    actions_.eject->setEnabled(interactive_ && storageSelected);
}

QString MainWindow::formatSize(std::uint64_t size) const {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = KB * 1024;
    constexpr std::uint64_t GB = MB * 1024;

    if (size >= GB) return QString("%1 GB").arg(static_cast<double>(size) / GB, 0, 'f', 1);
    if (size >= MB) return QString("%1 MB").arg(static_cast<double>(size) / MB, 0, 'f', 1);
    if (size >= KB) return QString("%1 KB").arg(static_cast<double>(size) / KB, 0, 'f', 1);
    return QString("%1 B").arg(size);
}

} // namespace usbdeck::gui
