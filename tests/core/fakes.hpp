#pragma once

#include "core/devicechangewatcher.hpp"
#include "core/filebrowserpage.hpp"
#include "core/viewinterfaces.hpp"
#include "device/enumerationprovider.hpp"
#include "fs/filesystem.hpp"
#include <QCoreApplication>
#include <QElapsedTimer>
#include <QEventLoop>
#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace usbdeck::testing {

inline device::BaseDeviceInfo makeDevice(const std::string& id, const std::string& product = "USB Device") {
    device::BaseDeviceInfo info;
    info.id = device::DeviceId{id};
    info.product = product;
    return info;
}

inline device::StorageDeviceInfo makeStorage(const std::string& id, const std::filesystem::path& mount) {
    device::StorageDeviceInfo storage;
    storage.base = makeDevice(id, "USB Stick");
    device::VolumeInfo volume;
    volume.mountPath = mount;
    volume.fileSystem = "vfat";
    volume.volumeLabel = "STICK";
    volume.totalBytes = 8ull * 1024 * 1024 * 1024;
    volume.freeBytes = 1024ull * 1024 * 1024;
    storage.volumes.push_back(volume);
    return storage;
}

inline device::EnumerationResult makeEnumeration(const std::vector<device::BaseDeviceInfo>& devices,
                                                 const std::vector<device::StorageDeviceInfo>& storages) {
    device::EnumerationResult result;
    for (const auto& info : devices) {
        result.devices.emplace_back(info);
    }
    for (const auto& storage : storages) {
        result.devices.emplace_back(storage);
        result.storages.emplace(storage.id(), storage);
    }
    return result;
}

// Pumps the event loop until pred holds or the timeout expires
inline bool waitFor(const std::function<bool()>& pred, int timeout_ms = 5000) {
    QElapsedTimer timer;
    timer.start();
    while (!pred()) {
        if (timer.elapsed() > timeout_ms) {
            return false;
        }
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
    }
    return true;
}

/**
 * @brief Device world shared by every FakeProvider a factory creates
 *
 * Workers block at the gate while it is closed, so tests can hold a task
 * in flight.
 */
class FakeBackend {
public:
    void closeGate() {
        std::lock_guard<std::mutex> lock(mutex_);
        gate_open_ = false;
    }

    void openGate() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            gate_open_ = true;
        }
        cv_.notify_all();
    }

    void waitAtGate() {
        std::unique_lock<std::mutex> lock(mutex_);
        ++waiting;
        cv_.wait(lock, [this]() { return gate_open_; });
        --waiting;
    }

    void setDevices(std::vector<device::BaseDeviceInfo> devices, std::vector<device::StorageDeviceInfo> storages) {
        std::lock_guard<std::mutex> lock(mutex_);
        devices_ = std::move(devices);
        storages_.clear();
        for (auto& storage : storages) {
            storages_.emplace(storage.id(), std::move(storage));
        }
    }

    void setEnumerationFailure(const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_ = message;
    }

    void clearEnumerationFailure() {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_.reset();
    }

    void setEjectResult(bool success, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        eject_result_.success = success;
        eject_result_.message = message;
    }

    void failStorageLookup(const device::DeviceId& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        broken_storage_ = id;
    }

    std::vector<device::DeviceId> listBaseDeviceIds() {
        waitAtGate();
        ++enumerations;
        std::lock_guard<std::mutex> lock(mutex_);
        if (failure_) {
            throw std::runtime_error(*failure_);
        }
        std::vector<device::DeviceId> ids;
        for (const auto& info : devices_) {
            ids.push_back(info.id);
        }
        for (const auto& kv : storages_) {
            ids.push_back(kv.first);
        }
        return ids;
    }

    std::vector<device::DeviceId> listStorageDeviceIds() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<device::DeviceId> ids;
        for (const auto& kv : storages_) {
            ids.push_back(kv.first);
        }
        return ids;
    }

    device::BaseDeviceInfo getBaseDeviceInfo(const device::DeviceId& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& info : devices_) {
            if (info.id == id) {
                return info;
            }
        }
        auto it = storages_.find(id);
        if (it == storages_.end()) {
            throw device::DeviceNotFoundError(id);
        }
        return it->second.base;
    }

    device::StorageDeviceInfo getStorageDeviceInfo(const device::DeviceId& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (broken_storage_ && *broken_storage_ == id) {
            throw std::runtime_error("volume query failed");
        }
        auto it = storages_.find(id);
        if (it == storages_.end()) {
            throw device::DeviceNotFoundError(id);
        }
        return it->second;
    }

    // A successful eject also detaches the device
    device::EjectResult eject(const device::DeviceId& id) {
        waitAtGate();
        ++ejects;
        std::lock_guard<std::mutex> lock(mutex_);
        if (eject_result_.success) {
            storages_.erase(id);
        }
        return eject_result_;
    }

    std::atomic<int> waiting{0};
    std::atomic<int> enumerations{0};
    std::atomic<int> ejects{0};
    std::atomic<int> providers_created{0};

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool gate_open_ = true;
    std::vector<device::BaseDeviceInfo> devices_;
    device::StorageMap storages_;
    std::optional<std::string> failure_;
    std::optional<device::DeviceId> broken_storage_;
    device::EjectResult eject_result_{true, "Device can be removed safely"};
};

class FakeProvider : public device::DeviceEnumerationProvider {
public:
    explicit FakeProvider(std::shared_ptr<FakeBackend> backend)
        : backend_(std::move(backend)) {
        ++backend_->providers_created;
    }

    std::vector<device::DeviceId> listBaseDeviceIds() override { return backend_->listBaseDeviceIds(); }
    device::BaseDeviceInfo getBaseDeviceInfo(const device::DeviceId& id) override { return backend_->getBaseDeviceInfo(id); }
    std::vector<device::DeviceId> listStorageDeviceIds() override { return backend_->listStorageDeviceIds(); }
    device::StorageDeviceInfo getStorageDeviceInfo(const device::DeviceId& id) override { return backend_->getStorageDeviceInfo(id); }
    device::EjectResult ejectStorageDevice(const device::DeviceId& id) override { return backend_->eject(id); }

private:
    std::shared_ptr<FakeBackend> backend_;
};

inline device::ProviderFactory providerFactory(const std::shared_ptr<FakeBackend>& backend) {
    return [backend]() -> std::unique_ptr<device::DeviceEnumerationProvider> {
        return std::make_unique<FakeProvider>(backend);
    };
}

/**
 * @brief In-memory directory tree
 */
struct FakeTree {
    std::map<std::filesystem::path, std::vector<fs::FileEntry>> directories;
    int listings = 0;
    int filesystems_destroyed = 0;

    void addDirectory(const std::filesystem::path& dir) {
        directories[dir];
        std::filesystem::path parent = dir.parent_path();
        if (parent != dir && directories.count(parent) != 0) {
            fs::FileEntry entry;
            entry.path = dir;
            entry.name = dir.filename().string();
            entry.is_directory = true;
            entry.hidden = !entry.name.empty() && entry.name.front() == '.';
            directories[parent].push_back(entry);
        }
    }

    void addFile(const std::filesystem::path& file, std::uintmax_t size = 0) {
        fs::FileEntry entry;
        entry.path = file;
        entry.name = file.filename().string();
        entry.is_regular_file = true;
        entry.size = size;
        entry.hidden = !entry.name.empty() && entry.name.front() == '.';
        directories[file.parent_path()].push_back(entry);
    }

    void removeDirectory(const std::filesystem::path& dir) {
        directories.erase(dir);
    }
};

class FakeFileSystem : public fs::FileSystem {
public:
    explicit FakeFileSystem(std::shared_ptr<FakeTree> tree)
        : tree_(std::move(tree)) {}

    ~FakeFileSystem() override {
        ++tree_->filesystems_destroyed;
    }

    fs::FsResult listDirectory(const std::filesystem::path& directory,
                               const fs::ListOptions& options,
                               std::vector<fs::FileEntry>& entries) const override {
        ++tree_->listings;
        entries.clear();

        fs::FsResult result;
        auto it = tree_->directories.find(directory);
        if (it == tree_->directories.end()) {
            result.error = std::make_error_code(std::errc::no_such_file_or_directory);
            result.message = "Directory does not exist: " + directory.string();
            return result;
        }
        for (const fs::FileEntry& entry : it->second) {
            if (entry.hidden && !options.include_hidden) {
                continue;
            }
            entries.push_back(entry);
        }
        result.success = true;
        return result;
    }

    bool exists(const std::filesystem::path& path) const override {
        return tree_->directories.count(path) != 0;
    }

private:
    std::shared_ptr<FakeTree> tree_;
};

// One filesystem instance per page, all backed by the same tree
inline std::function<std::shared_ptr<fs::FileSystem>(const device::StorageDeviceInfo&)>
filesystemFactory(const std::shared_ptr<FakeTree>& tree) {
    return [tree](const device::StorageDeviceInfo&) -> std::shared_ptr<fs::FileSystem> {
        return std::make_shared<FakeFileSystem>(tree);
    };
}

/**
 * @brief Records attach and detach calls
 */
class FakePageHost : public core::PageHost {
public:
    void attachPage(const device::DeviceId& id, core::FileBrowserPage& page) override {
        attached.push_back(id);
        pages[id] = &page;
    }

    void detachPage(const device::DeviceId& id) override {
        detached.push_back(id);
        auto it = pages.find(id);
        if (it != pages.end()) {
            if (it->second->isReleased()) {
                ++detached_after_release;
            }
            pages.erase(it);
        }
    }

    std::vector<device::DeviceId> attached;
    std::vector<device::DeviceId> detached;
    std::map<device::DeviceId, core::FileBrowserPage*> pages;
    int detached_after_release = 0;
};

class FakeSelection : public core::OverviewSelection {
public:
    std::optional<device::DeviceId> selectedDevice() const override { return selected; }

    void clearDeviceSelection() override {
        selected.reset();
        ++clears;
    }

    void select(const std::string& id) { selected = device::DeviceId{id}; }

    std::optional<device::DeviceId> selected;
    int clears = 0;
};

// Emits on demand; adds no signals of its own, so it needs no moc
class FakeWatcher : public core::DeviceChangeWatcher {
public:
    void start() override { ++starts; }
    void stop() override { ++stops; }

    void fire() { Q_EMIT deviceChangeDetected(); }

    int starts = 0;
    int stops = 0;
};

} // namespace usbdeck::testing
