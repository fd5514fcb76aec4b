#include "navigation.hpp"
#include "logging.hpp"
#include <QString>
#include <stdexcept>

namespace usbdeck::core {

Navigation::Navigation(MainAreaState& state, FileSystemFactory filesystem_factory)
    : state_(state)
    , filesystem_factory_(std::move(filesystem_factory))
    , show_hidden_(false) {
    if (!filesystem_factory_) {
        throw std::invalid_argument("Navigation requires a filesystem factory");
    }
}

const ViewTarget& Navigation::showOverview() {
    state_.setCurrentView(ViewTarget::overview());
    return state_.currentView();
}

const ViewTarget& Navigation::showDevice(const device::DeviceId& id) {
    if (state_.isClosing()) {
        return state_.currentView();
    }

    const device::StorageDeviceInfo* storage = state_.findStorage(id);
    if (!storage) {
        qCDebug(lcNavigation) << "Unknown device, showing overview:"
                              << QString::fromStdString(id.instanceId);
        return showOverview();
    }

    FileBrowserPage& page = pageFor(id, *storage);

    std::filesystem::path current_root = storageRoot(*storage).value_or(std::filesystem::path());
    if (current_root != page.root()) {
        fs::FsResult result = page.resetRoot(current_root);
        if (!result.success) {
            qCWarning(lcNavigation) << "Cannot list new root of"
                                    << QString::fromStdString(id.instanceId) << ":"
                                    << QString::fromStdString(result.message);
        }
    }

    state_.setCurrentView(ViewTarget::device(id));
    return state_.currentView();
}

FileBrowserPage& Navigation::pageFor(const device::DeviceId& id, const device::StorageDeviceInfo& storage) {
    if (FileBrowserPage* cached = state_.pages().find(id)) {
        return *cached;
    }

    std::filesystem::path root = storageRoot(storage).value_or(std::filesystem::path());
    auto page = std::make_unique<FileBrowserPage>(filesystem_factory_(storage), root, show_hidden_);
    if (!root.empty()) {
        fs::FsResult result = page->reload();
        if (!result.success) {
            qCWarning(lcNavigation) << "Initial listing failed for"
                                    << QString::fromStdString(id.instanceId) << ":"
                                    << QString::fromStdString(result.message);
        }
    }
    return state_.pages().insert(id, std::move(page));
}

std::optional<std::filesystem::path> Navigation::storageRoot(const device::StorageDeviceInfo& storage) {
    if (storage.volumes.empty()) {
        return std::nullopt;
    }

    const device::VolumeInfo& first = storage.volumes.front();
    if (first.mountPath) {
        return *first.mountPath;
    }
    if (first.driveLetter && !first.driveLetter->empty()) {
        return std::filesystem::path(*first.driveLetter + "\\");
    }
    return std::nullopt;
}

} // namespace usbdeck::core
