#pragma once

#include "core_export.hpp"
#include "pagecache.hpp"
#include "usbdeck/device/deviceinfo.hpp"
#include <QMetaType>
#include <cstdint>
#include <optional>
#include <vector>

namespace usbdeck::core {

/**
 * @brief Navigation cursor of the main area
 */
struct USBDECK_CORE_EXPORT ViewTarget {
    enum class Kind {
        Overview,
        Device
    };

    Kind kind = Kind::Overview;
    device::DeviceId deviceId;  // Only meaningful for Kind::Device

    static ViewTarget overview() { return ViewTarget(); }
    static ViewTarget device(const device::DeviceId& id) {
        ViewTarget target;
        target.kind = Kind::Device;
        target.deviceId = id;
        return target;
    }

    bool isOverview() const { return kind == Kind::Overview; }
    bool isDevice(const device::DeviceId& id) const { return kind == Kind::Device && deviceId == id; }

    bool operator==(const ViewTarget& other) const {
        return kind == other.kind && (kind == Kind::Overview || deviceId == other.deviceId);
    }
    bool operator!=(const ViewTarget& other) const { return !(*this == other); }
};

/**
 * @brief Immutable copy of the state published to views
 */
struct USBDECK_CORE_EXPORT MainAreaSnapshot {
    std::vector<device::DeviceEntry> devices;
    device::StorageMap storages;
    bool is_scanning = false;

    // Details and eject only apply to a selected storage device
    bool isStorageSelected(const std::optional<device::DeviceId>& selection) const {
        return selection && storages.count(*selection) != 0;
    }
};

/**
 * @brief Authoritative state of the main area
 *
 * Every mutation of the device lists, the page cache and the navigation
 * cursor goes through this class and happens on the control thread. Once
 * markClosing() has been called all mutators are no-ops.
 */
class USBDECK_CORE_EXPORT MainAreaState {
public:
    explicit MainAreaState(PageHost* host = nullptr);
    ~MainAreaState();

    MainAreaState(const MainAreaState&) = delete;
    MainAreaState& operator=(const MainAreaState&) = delete;

    bool isScanning() const { return scanning_; }
    bool isClosing() const { return closing_; }
    std::uint64_t generation() const { return generation_; }
    const std::vector<device::DeviceEntry>& devices() const { return devices_; }
    const device::StorageMap& storages() const { return storages_; }
    const ViewTarget& currentView() const { return current_view_; }

    const PageCache& pages() const { return pages_; }
    PageCache& pages() { return pages_; }

    const device::StorageDeviceInfo* findStorage(const device::DeviceId& id) const;
    MainAreaSnapshot snapshot() const;

    void setPageHost(PageHost* host) { pages_.setHost(host); }

    /**
     * @brief Enter the scanning state for a new refresh
     * @return The new generation, or nullopt if already scanning or closing
     */
    std::optional<std::uint64_t> beginRefresh();

    /**
     * @brief Enter the scanning state for an eject
     * @return false if already scanning or closing
     */
    bool beginEject();

    bool isCurrentGeneration(std::uint64_t generation) const { return generation == generation_; }

    /**
     * @brief Apply a completed enumeration
     *
     * Replaces devices and storages, evicts pages of vanished devices,
     * redirects a dangling device view to the overview and leaves the
     * scanning state.
     *
     * @return Ids of evicted pages
     */
    std::vector<device::DeviceId> applyEnumeration(device::EnumerationResult result);

    /**
     * @brief Leave the scanning state without touching the device lists
     */
    void finishScan();

    /**
     * @brief Move the navigation cursor
     *
     * A device target must name a known storage device.
     * @return false if the target was rejected
     */
    bool setCurrentView(const ViewTarget& target);

    void markClosing();

private:
    bool scanning_;
    bool closing_;
    std::uint64_t generation_;
    std::vector<device::DeviceEntry> devices_;
    device::StorageMap storages_;
    ViewTarget current_view_;
    PageCache pages_;
};

} // namespace usbdeck::core

Q_DECLARE_METATYPE(usbdeck::core::ViewTarget)
Q_DECLARE_METATYPE(usbdeck::core::MainAreaSnapshot)
