#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace usbdeck::device {

/**
 * @brief Identifier of an attached device
 *
 * Unique among currently attached devices. Not guaranteed to survive a
 * replug of the same hardware.
 */
struct DeviceId {
    std::string instanceId;

    bool operator==(const DeviceId& other) const { return instanceId == other.instanceId; }
    bool operator!=(const DeviceId& other) const { return !(*this == other); }
    bool operator<(const DeviceId& other) const { return instanceId < other.instanceId; }
};

struct BaseDeviceInfo {
    DeviceId id;
    std::optional<std::string> vendorId;       // 4 hex digits
    std::optional<std::string> productId;      // 4 hex digits
    std::optional<std::string> manufacturer;
    std::optional<std::string> product;
    std::optional<std::string> serialNumber;
    std::optional<int> busNumber;
    std::optional<int> portNumber;
    std::optional<std::string> usbVersion;     // "2.0", "3.2", ...
    std::optional<double> speedMbps;
    std::optional<std::string> description;
};

struct VolumeInfo {
    std::optional<std::string> driveLetter;    // "E:" on Windows hosts
    std::optional<std::filesystem::path> mountPath;
    std::optional<std::string> fileSystem;
    std::optional<std::string> volumeLabel;
    std::optional<std::uint64_t> totalBytes;
    std::optional<std::uint64_t> freeBytes;
};

struct StorageDeviceInfo {
    BaseDeviceInfo base;
    std::vector<VolumeInfo> volumes;

    const DeviceId& id() const { return base.id; }
};

// One row of the overview: storage-capable devices carry their volumes
using DeviceEntry = std::variant<BaseDeviceInfo, StorageDeviceInfo>;

using StorageMap = std::map<DeviceId, StorageDeviceInfo>;

struct EnumerationResult {
    std::vector<DeviceEntry> devices;
    StorageMap storages;
};

struct EjectResult {
    bool success = false;
    std::string message;
};

inline const BaseDeviceInfo& baseInfo(const DeviceEntry& entry) {
    if (const auto* storage = std::get_if<StorageDeviceInfo>(&entry)) {
        return storage->base;
    }
    return std::get<BaseDeviceInfo>(entry);
}

inline const DeviceId& entryId(const DeviceEntry& entry) {
    return baseInfo(entry).id;
}

inline const StorageDeviceInfo* asStorage(const DeviceEntry& entry) {
    return std::get_if<StorageDeviceInfo>(&entry);
}

} // namespace usbdeck::device
