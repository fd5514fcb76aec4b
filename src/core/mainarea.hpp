#pragma once

#include "core_export.hpp"
#include "config.hpp"
#include "devicechangewatcher.hpp"
#include "mainareastate.hpp"
#include "navigation.hpp"
#include "viewinterfaces.hpp"
#include "device/enumerationprovider.hpp"
#include <QObject>
#include <QPointer>
#include <QString>
#include <memory>
#include <optional>
#include <vector>

QT_BEGIN_NAMESPACE
class QThreadPool;
class QTimer;
QT_END_NAMESPACE

namespace usbdeck::core {

class RefreshCoordinator;

// Quiet period after the last hot-plug notification before re-enumerating
constexpr int kDeviceChangeDebounceMs = 600;

enum class OverviewAction {
    Details,
    Eject
};

/**
 * @brief Entry point for every user intent of the main area
 *
 * Owns the state aggregate, the navigation state machine and the refresh
 * coordinator, and republishes their changes as signals for the passive
 * views. All slots must be called on the thread that owns the object.
 */
class USBDECK_CORE_EXPORT MainArea : public QObject {
    Q_OBJECT

public:
    MainArea(device::ProviderFactory provider_factory,
             Navigation::FileSystemFactory filesystem_factory,
             const PanelConfig& config = PanelConfig(),
             QThreadPool* pool = nullptr,
             QObject* parent = nullptr);
    ~MainArea() override;

    void setPageHost(PageHost* host);
    void setOverviewSelection(OverviewSelection* selection) { selection_ = selection; }

    /**
     * @brief Refresh automatically when the watcher reports a device change
     *
     * Notifications are debounced; the refresh they lead to is dropped like
     * any other when a task is already running. The watcher is not owned and
     * may be null to disconnect.
     */
    void setDeviceChangeWatcher(DeviceChangeWatcher* watcher);

    const MainAreaState& state() const { return state_; }
    MainAreaSnapshot snapshot() const { return state_.snapshot(); }
    const ViewTarget& currentView() const { return state_.currentView(); }
    FileBrowserPage* page(const device::DeviceId& id) const { return state_.pages().find(id); }
    int pendingTasks() const;

public Q_SLOTS:
    void showOverview();
    void showDevice(const usbdeck::device::DeviceId& id);
    void requestRefresh();
    void requestDetails();
    void requestEject();
    void performOverviewAction(usbdeck::core::OverviewAction action);

    /**
     * @brief Refresh all devices on behalf of a device page
     *
     * When the refresh has been applied and the page is still shown, its
     * root is revalidated and its listing reloaded.
     */
    void requestPageRefresh(const usbdeck::device::DeviceId& id);

    /**
     * @brief Mark the window as closing
     *
     * Results of tasks still in flight are dropped when they arrive.
     */
    void beginClosing();

Q_SIGNALS:
    void stateChanged(const usbdeck::core::MainAreaSnapshot& snapshot);
    void refreshFailed(const QString& message);
    void currentViewChanged(const usbdeck::core::ViewTarget& view);
    void interactivityChanged(bool enabled);
    void detailsRequested(const usbdeck::device::StorageDeviceInfo& storage);
    void ejectCompleted(const QString& message);

private:
    void onBusy();
    void onRefreshApplied(const std::vector<device::DeviceId>& evicted);
    void onRefreshFailed(const QString& message);
    void onEjectCompleted(const QString& message);
    void onEjectFailed(const QString& message);
    void onDeviceChangeDetected();
    void onAutoRefreshTimeout();
    void continuePageRefresh();
    void publishState();
    void publishView();

    // Resolves the overview selection against the current storages
    std::optional<device::StorageDeviceInfo> selectedStorage(bool* had_selection);

    MainAreaState state_;
    Navigation navigation_;
    std::unique_ptr<RefreshCoordinator> coordinator_;
    OverviewSelection* selection_;
    QPointer<DeviceChangeWatcher> watcher_;
    QTimer* auto_refresh_timer_;
    std::optional<device::DeviceId> page_refresh_target_;
};

} // namespace usbdeck::core

Q_DECLARE_METATYPE(usbdeck::core::OverviewAction)
