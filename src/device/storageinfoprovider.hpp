#pragma once

#include "core_export.hpp"
#include "enumerationprovider.hpp"
#include <QStorageInfo>
#include <QList>
#include <QStringList>
#include <functional>
#include <string>

namespace usbdeck::device {

/**
 * @brief Provider listing mounted removable volumes through QStorageInfo
 *
 * Each removable volume is reported as one storage device keyed by its
 * device node. The volume list is captured once at construction, so one
 * instance describes one point in time.
 */
class USBDECK_CORE_EXPORT StorageInfoProvider : public DeviceEnumerationProvider {
public:
    /**
     * @brief Runs one udisksctl command
     * @return false with error set when the command did not succeed
     */
    using CommandRunner = std::function<bool(const QStringList& arguments, std::string& error)>;

    StorageInfoProvider();
    explicit StorageInfoProvider(QList<QStorageInfo> volumes, CommandRunner runner = CommandRunner());

    std::vector<DeviceId> listBaseDeviceIds() override;
    BaseDeviceInfo getBaseDeviceInfo(const DeviceId& id) override;
    std::vector<DeviceId> listStorageDeviceIds() override;
    StorageDeviceInfo getStorageDeviceInfo(const DeviceId& id) override;

    /**
     * @brief Unmount the volume, then power off its drive, with udisksctl
     *
     * Fails only when the unmount fails. A drive that refuses to power off
     * is reported as unmounted rather than safe to remove.
     */
    EjectResult ejectStorageDevice(const DeviceId& id) override;

    static bool isRemovableMount(const QString& root_path);

private:
    const QStorageInfo* findVolume(const DeviceId& id) const;

    QList<QStorageInfo> volumes_;
    CommandRunner runner_;
};

} // namespace usbdeck::device
