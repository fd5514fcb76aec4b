#pragma once

#include "core_export.hpp"
#include "usbdeck/device/deviceinfo.hpp"
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace usbdeck::device {

/**
 * @brief Thrown when a provider is asked about an id it does not know
 */
class USBDECK_CORE_EXPORT DeviceNotFoundError : public std::runtime_error {
public:
    explicit DeviceNotFoundError(const DeviceId& id);

    const DeviceId& deviceId() const { return id_; }

private:
    DeviceId id_;
};

/**
 * @brief Source of attached-device information
 *
 * An instance is created, used and destroyed within a single worker task.
 * Implementations may therefore keep native handles for their own lifetime
 * but must not share them with other instances.
 */
class USBDECK_CORE_EXPORT DeviceEnumerationProvider {
public:
    virtual ~DeviceEnumerationProvider() = default;

    /**
     * @brief List all attached devices
     * @return Device ids in provider order
     */
    virtual std::vector<DeviceId> listBaseDeviceIds() = 0;

    /**
     * @brief Get descriptive information for a device
     * @throws DeviceNotFoundError if the device is gone
     */
    virtual BaseDeviceInfo getBaseDeviceInfo(const DeviceId& id) = 0;

    /**
     * @brief List the subset of devices that expose storage volumes
     */
    virtual std::vector<DeviceId> listStorageDeviceIds() = 0;

    /**
     * @brief Get base and volume information for a storage device
     * @throws DeviceNotFoundError or std::runtime_error on lookup failure
     */
    virtual StorageDeviceInfo getStorageDeviceInfo(const DeviceId& id) = 0;

    /**
     * @brief Request safe removal of a storage device
     * @return Outcome reported by the platform
     */
    virtual EjectResult ejectStorageDevice(const DeviceId& id) = 0;
};

// Invoked on the worker thread, once per task
using ProviderFactory = std::function<std::unique_ptr<DeviceEnumerationProvider>()>;

/**
 * @brief Run one full enumeration against a provider
 *
 * Devices are ordered by id, case-insensitively. A storage device whose
 * storage lookup fails is listed with its base information only. The
 * returned storages only contain ids that also appear in devices.
 *
 * @throws std::exception subclasses raised by the provider's listing calls
 */
USBDECK_CORE_EXPORT EnumerationResult enumerateDevices(DeviceEnumerationProvider& provider);

} // namespace usbdeck::device
