#pragma once

#include "core_export.hpp"
#include "mainareastate.hpp"
#include "fs/filesystem.hpp"
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>

namespace usbdeck::core {

/**
 * @brief Decides which page of the main area is visible
 *
 * Only two states exist: the overview and one storage device's page.
 * Requests for devices that are not in the current storages degrade to the
 * overview.
 */
class USBDECK_CORE_EXPORT Navigation {
public:
    using FileSystemFactory =
        std::function<std::shared_ptr<fs::FileSystem>(const device::StorageDeviceInfo&)>;

    Navigation(MainAreaState& state, FileSystemFactory filesystem_factory);

    const ViewTarget& showOverview();

    /**
     * @brief Show the page of a storage device
     *
     * Creates the page on first visit. A cached page whose root no longer
     * matches the device's storage root is moved to the new root.
     *
     * @return The resulting view; the overview if id is unknown
     */
    const ViewTarget& showDevice(const device::DeviceId& id);

    void setShowHiddenFiles(bool show) { show_hidden_ = show; }
    bool showHiddenFiles() const { return show_hidden_; }

    /**
     * @brief Directory a device's page starts in
     *
     * The first volume's mount path, otherwise its drive letter root.
     */
    static std::optional<std::filesystem::path> storageRoot(const device::StorageDeviceInfo& storage);

private:
    FileBrowserPage& pageFor(const device::DeviceId& id, const device::StorageDeviceInfo& storage);

    MainAreaState& state_;
    FileSystemFactory filesystem_factory_;
    bool show_hidden_;
};

} // namespace usbdeck::core
