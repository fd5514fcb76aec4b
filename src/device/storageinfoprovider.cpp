#include "storageinfoprovider.hpp"
#include "core/logging.hpp"
#include <QProcess>
#include <QStringList>

namespace usbdeck::device {

namespace {

constexpr int kEjectTimeoutMs = 30000;

DeviceId volumeId(const QStorageInfo& volume) {
    return DeviceId{QString::fromUtf8(volume.device()).toStdString()};
}

QList<QStorageInfo> removableVolumes() {
    QList<QStorageInfo> result;
    for (const QStorageInfo& volume : QStorageInfo::mountedVolumes()) {
        if (!volume.isValid() || !volume.isReady() || volume.isRoot()) {
            continue;
        }
        if (!StorageInfoProvider::isRemovableMount(volume.rootPath())) {
            continue;
        }
        result.append(volume);
    }
    return result;
}

bool runUdisksctl(const QStringList& arguments, std::string& error) {
    QProcess process;
    process.start(QStringLiteral("udisksctl"), arguments);
    if (!process.waitForStarted()) {
        error = "udisksctl is not available";
        return false;
    }
    if (!process.waitForFinished(kEjectTimeoutMs)) {
        process.kill();
        process.waitForFinished();
        error = "Timed out running udisksctl " + arguments.join(QLatin1Char(' ')).toStdString();
        return false;
    }
    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        error = QString::fromLocal8Bit(process.readAllStandardError()).trimmed().toStdString();
        return false;
    }
    return true;
}

} // namespace

StorageInfoProvider::StorageInfoProvider()
    : volumes_(removableVolumes())
    , runner_(runUdisksctl) {
    qCDebug(core::lcDevice) << "Found" << volumes_.size() << "removable volumes";
}

StorageInfoProvider::StorageInfoProvider(QList<QStorageInfo> volumes, CommandRunner runner)
    : volumes_(std::move(volumes))
    , runner_(runner ? std::move(runner) : CommandRunner(runUdisksctl)) {}

bool StorageInfoProvider::isRemovableMount(const QString& root_path) {
    static const QStringList prefixes = {
        QStringLiteral("/media/"),
        QStringLiteral("/run/media/"),
        QStringLiteral("/mnt/"),
        QStringLiteral("/Volumes/"),
    };
    for (const QString& prefix : prefixes) {
        if (root_path.startsWith(prefix)) {
            return true;
        }
    }
    return false;
}

std::vector<DeviceId> StorageInfoProvider::listBaseDeviceIds() {
    std::vector<DeviceId> ids;
    ids.reserve(static_cast<std::size_t>(volumes_.size()));
    for (const QStorageInfo& volume : volumes_) {
        ids.push_back(volumeId(volume));
    }
    return ids;
}

BaseDeviceInfo StorageInfoProvider::getBaseDeviceInfo(const DeviceId& id) {
    const QStorageInfo* volume = findVolume(id);
    if (!volume) {
        throw DeviceNotFoundError(id);
    }

    BaseDeviceInfo info;
    info.id = id;
    info.product = volume->displayName().toStdString();
    info.description = QString::fromUtf8(volume->device()).toStdString();
    return info;
}

std::vector<DeviceId> StorageInfoProvider::listStorageDeviceIds() {
    return listBaseDeviceIds();
}

StorageDeviceInfo StorageInfoProvider::getStorageDeviceInfo(const DeviceId& id) {
    const QStorageInfo* volume = findVolume(id);
    if (!volume) {
        throw DeviceNotFoundError(id);
    }

    VolumeInfo info;
    info.mountPath = std::filesystem::path(volume->rootPath().toStdString());
    info.fileSystem = QString::fromUtf8(volume->fileSystemType()).toStdString();
    if (!volume->name().isEmpty()) {
        info.volumeLabel = volume->name().toStdString();
    }
    if (volume->bytesTotal() >= 0) {
        info.totalBytes = static_cast<std::uint64_t>(volume->bytesTotal());
    }
    if (volume->bytesFree() >= 0) {
        info.freeBytes = static_cast<std::uint64_t>(volume->bytesFree());
    }

    StorageDeviceInfo storage;
    storage.base = getBaseDeviceInfo(id);
    storage.volumes.push_back(std::move(info));
    return storage;
}

EjectResult StorageInfoProvider::ejectStorageDevice(const DeviceId& id) {
    if (!findVolume(id)) {
        throw DeviceNotFoundError(id);
    }

    const QString node = QString::fromStdString(id.instanceId);
    EjectResult result;
    std::string error;
    if (!runner_({QStringLiteral("unmount"), QStringLiteral("-b"), node}, error)) {
        result.message = error.empty() ? "Unmount of " + id.instanceId + " failed" : error;
        return result;
    }

    result.success = true;
    if (!runner_({QStringLiteral("power-off"), QStringLiteral("-b"), node}, error)) {
        qCWarning(core::lcDevice) << "Power off failed for" << node << ":" << QString::fromStdString(error);
        result.message = id.instanceId + " was unmounted";
        return result;
    }
    result.message = id.instanceId + " can be removed safely";
    return result;
}

const QStorageInfo* StorageInfoProvider::findVolume(const DeviceId& id) const {
    for (const QStorageInfo& volume : volumes_) {
        if (volumeId(volume) == id) {
            return &volume;
        }
    }
    return nullptr;
}

} // namespace usbdeck::device
