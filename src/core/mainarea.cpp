#include "mainarea.hpp"
#include "logging.hpp"
#include "refreshcoordinator.hpp"
#include <QTimer>
#include <utility>

namespace usbdeck::core {

namespace {

const char* const kDeviceGoneMessage =
    "The selected device is no longer present. Refresh the device list and try again.";

} // namespace

MainArea::MainArea(device::ProviderFactory provider_factory,
                   Navigation::FileSystemFactory filesystem_factory,
                   const PanelConfig& config,
                   QThreadPool* pool,
                   QObject* parent)
    : QObject(parent)
    , navigation_(state_, std::move(filesystem_factory))
    , coordinator_(std::make_unique<RefreshCoordinator>(state_, std::move(provider_factory), pool))
    , selection_(nullptr)
    , auto_refresh_timer_(new QTimer(this)) {
    navigation_.setShowHiddenFiles(config.show_hidden_files);

    auto_refresh_timer_->setSingleShot(true);
    auto_refresh_timer_->setInterval(kDeviceChangeDebounceMs);
    connect(auto_refresh_timer_, &QTimer::timeout, this, &MainArea::onAutoRefreshTimeout);

    connect(coordinator_.get(), &RefreshCoordinator::scanStarted, this, &MainArea::onBusy);
    connect(coordinator_.get(), &RefreshCoordinator::ejectStarted, this, &MainArea::onBusy);
    connect(coordinator_.get(), &RefreshCoordinator::refreshApplied, this, &MainArea::onRefreshApplied);
    connect(coordinator_.get(), &RefreshCoordinator::refreshFailed, this, &MainArea::onRefreshFailed);
    connect(coordinator_.get(), &RefreshCoordinator::ejectCompleted, this, &MainArea::onEjectCompleted);
    connect(coordinator_.get(), &RefreshCoordinator::ejectFailed, this, &MainArea::onEjectFailed);
}

// coordinator_ goes first so no completion can reach a dead state
MainArea::~MainArea() {
    coordinator_.reset();
}

void MainArea::setPageHost(PageHost* host) {
    state_.setPageHost(host);
}

void MainArea::setDeviceChangeWatcher(DeviceChangeWatcher* watcher) {
    if (watcher_) {
        disconnect(watcher_.data(), nullptr, this, nullptr);
    }
    watcher_ = watcher;
    if (watcher) {
        connect(watcher, &DeviceChangeWatcher::deviceChangeDetected, this, &MainArea::onDeviceChangeDetected);
    }
}

int MainArea::pendingTasks() const {
    return coordinator_->pendingTasks();
}

void MainArea::showOverview() {
    if (state_.isClosing()) {
        return;
    }
    navigation_.showOverview();
    publishView();
}

void MainArea::showDevice(const device::DeviceId& id) {
    if (state_.isClosing()) {
        return;
    }
    navigation_.showDevice(id);
    publishView();
}

void MainArea::requestRefresh() {
    coordinator_->requestRefresh();
}

void MainArea::requestDetails() {
    performOverviewAction(OverviewAction::Details);
}

void MainArea::requestEject() {
    performOverviewAction(OverviewAction::Eject);
}

void MainArea::performOverviewAction(OverviewAction action) {
    if (state_.isClosing()) {
        return;
    }

    bool had_selection = false;
    std::optional<device::StorageDeviceInfo> storage = selectedStorage(&had_selection);
    if (!had_selection) {
        return;
    }
    if (!storage) {
        qCInfo(lcMainArea) << "Overview action on a device that is gone";
        Q_EMIT refreshFailed(tr(kDeviceGoneMessage));
        return;
    }

    switch (action) {
    case OverviewAction::Details:
        Q_EMIT detailsRequested(*storage);
        break;
    case OverviewAction::Eject:
        coordinator_->requestEject(storage->id());
        break;
    }
}

void MainArea::requestPageRefresh(const device::DeviceId& id) {
    if (state_.isClosing()) {
        return;
    }
    page_refresh_target_ = id;
    // A refresh that is already running serves this request too
    coordinator_->requestRefresh();
}

void MainArea::beginClosing() {
    if (state_.isClosing()) {
        return;
    }
    qCInfo(lcMainArea) << "Window closing, pending tasks:" << coordinator_->pendingTasks();
    state_.markClosing();
    page_refresh_target_.reset();
    auto_refresh_timer_->stop();
}

void MainArea::onBusy() {
    publishState();
    Q_EMIT interactivityChanged(false);
}

void MainArea::onRefreshApplied(const std::vector<device::DeviceId>& evicted) {
    if (selection_) {
        selection_->clearDeviceSelection();
    }

    publishState();
    Q_EMIT interactivityChanged(true);

    if (!evicted.empty()) {
        // Eviction may have redirected a dangling device view
        publishView();
    }
    continuePageRefresh();
}

void MainArea::onRefreshFailed(const QString& message) {
    page_refresh_target_.reset();
    publishState();
    Q_EMIT interactivityChanged(true);
    Q_EMIT refreshFailed(message);
}

void MainArea::onEjectCompleted(const QString& message) {
    publishState();
    Q_EMIT interactivityChanged(true);
    Q_EMIT ejectCompleted(message);
}

void MainArea::onEjectFailed(const QString& message) {
    page_refresh_target_.reset();
    publishState();
    Q_EMIT interactivityChanged(true);
    Q_EMIT refreshFailed(message);
}

void MainArea::onDeviceChangeDetected() {
    if (state_.isClosing()) {
        return;
    }
    // Restarting collapses a burst into one refresh
    auto_refresh_timer_->start();
}

void MainArea::onAutoRefreshTimeout() {
    if (state_.isClosing()) {
        return;
    }
    if (!coordinator_->requestRefresh()) {
        qCDebug(lcMainArea) << "Device change refresh dropped, a task is running";
    }
}

void MainArea::continuePageRefresh() {
    std::optional<device::DeviceId> target = std::exchange(page_refresh_target_, std::nullopt);
    if (!target || !state_.currentView().isDevice(*target)) {
        return;
    }

    navigation_.showDevice(*target);
    FileBrowserPage* page = state_.pages().find(*target);
    if (!page) {
        navigation_.showOverview();
        publishView();
        return;
    }

    fs::FsResult result = page->reload();
    if (!result.success) {
        qCWarning(lcMainArea) << "Page directory unavailable:" << QString::fromStdString(result.message);
        navigation_.showOverview();
    }
    publishView();
}

void MainArea::publishState() {
    Q_EMIT stateChanged(state_.snapshot());
}

void MainArea::publishView() {
    Q_EMIT currentViewChanged(state_.currentView());
}

std::optional<device::StorageDeviceInfo> MainArea::selectedStorage(bool* had_selection) {
    *had_selection = false;
    if (!selection_) {
        return std::nullopt;
    }

    std::optional<device::DeviceId> id = selection_->selectedDevice();
    if (!id) {
        return std::nullopt;
    }
    *had_selection = true;

    // Resolved now, not when the selection was made
    if (const device::StorageDeviceInfo* storage = state_.findStorage(*id)) {
        return *storage;
    }
    return std::nullopt;
}

} // namespace usbdeck::core
