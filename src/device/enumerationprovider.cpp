#include "enumerationprovider.hpp"
#include "core/logging.hpp"
#include <QString>
#include <algorithm>
#include <cctype>
#include <set>

namespace usbdeck::device {

namespace {

std::string foldCase(const std::string& value) {
    std::string folded(value);
    std::transform(folded.begin(), folded.end(), folded.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return folded;
}

} // namespace

DeviceNotFoundError::DeviceNotFoundError(const DeviceId& id)
    : std::runtime_error("Device not found: " + id.instanceId)
    , id_(id) {}

EnumerationResult enumerateDevices(DeviceEnumerationProvider& provider) {
    std::vector<DeviceId> baseIds = provider.listBaseDeviceIds();
    std::stable_sort(baseIds.begin(), baseIds.end(),
        [](const DeviceId& a, const DeviceId& b) {
            return foldCase(a.instanceId) < foldCase(b.instanceId);
        });

    std::set<DeviceId> storageIds;
    for (const DeviceId& id : provider.listStorageDeviceIds()) {
        storageIds.insert(id);
    }

    EnumerationResult result;
    result.devices.reserve(baseIds.size());

    std::set<DeviceId> seen;
    for (const DeviceId& id : baseIds) {
        // The same device node can be mounted at several places
        if (!seen.insert(id).second) {
            qCDebug(core::lcDevice) << "Skipping repeated device" << QString::fromStdString(id.instanceId);
            continue;
        }
        if (storageIds.count(id) != 0) {
            try {
                StorageDeviceInfo storage = provider.getStorageDeviceInfo(id);
                result.storages.emplace(id, storage);
                result.devices.emplace_back(std::move(storage));
                continue;
            } catch (const std::exception& e) {
                // Still shown, just without volumes
                qCDebug(core::lcDevice) << "Storage lookup failed for"
                                        << QString::fromStdString(id.instanceId) << ":" << e.what();
            }
        }
        result.devices.emplace_back(provider.getBaseDeviceInfo(id));
    }

    return result;
}

} // namespace usbdeck::device
