#include "mainareastate.hpp"
#include "logging.hpp"
#include <QString>
#include <set>

namespace usbdeck::core {

MainAreaState::MainAreaState(PageHost* host)
    : scanning_(false)
    , closing_(false)
    , generation_(0)
    , pages_(host) {}

MainAreaState::~MainAreaState() = default;

const device::StorageDeviceInfo* MainAreaState::findStorage(const device::DeviceId& id) const {
    auto it = storages_.find(id);
    return it != storages_.end() ? &it->second : nullptr;
}

MainAreaSnapshot MainAreaState::snapshot() const {
    MainAreaSnapshot snap;
    snap.devices = devices_;
    snap.storages = storages_;
    snap.is_scanning = scanning_;
    return snap;
}

std::optional<std::uint64_t> MainAreaState::beginRefresh() {
    if (closing_ || scanning_) {
        return std::nullopt;
    }
    scanning_ = true;
    return ++generation_;
}

bool MainAreaState::beginEject() {
    if (closing_ || scanning_) {
        return false;
    }
    scanning_ = true;
    return true;
}

std::vector<device::DeviceId> MainAreaState::applyEnumeration(device::EnumerationResult result) {
    if (closing_) {
        return {};
    }

    std::set<device::DeviceId> listed;
    for (const auto& entry : result.devices) {
        listed.insert(device::entryId(entry));
    }
    for (auto it = result.storages.begin(); it != result.storages.end();) {
        if (listed.count(it->first) == 0) {
            qCWarning(lcMainArea) << "Dropping storage without device entry:"
                                  << QString::fromStdString(it->first.instanceId);
            it = result.storages.erase(it);
        } else {
            ++it;
        }
    }

    devices_ = std::move(result.devices);
    storages_ = std::move(result.storages);

    std::vector<device::DeviceId> evicted = pages_.reconcile(storages_);

    if (current_view_.kind == ViewTarget::Kind::Device &&
        storages_.count(current_view_.deviceId) == 0) {
        qCInfo(lcMainArea) << "Current device vanished, returning to overview:"
                           << QString::fromStdString(current_view_.deviceId.instanceId);
        current_view_ = ViewTarget::overview();
    }

    scanning_ = false;
    return evicted;
}

void MainAreaState::finishScan() {
    if (closing_) {
        return;
    }
    scanning_ = false;
}

bool MainAreaState::setCurrentView(const ViewTarget& target) {
    if (closing_) {
        return false;
    }
    if (target.kind == ViewTarget::Kind::Device && storages_.count(target.deviceId) == 0) {
        return false;
    }
    current_view_ = target;
    return true;
}

void MainAreaState::markClosing() {
    closing_ = true;
}

} // namespace usbdeck::core
