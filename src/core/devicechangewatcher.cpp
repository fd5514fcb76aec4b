#include "devicechangewatcher.hpp"
#include "logging.hpp"
#include <QDir>
#include <QFileInfo>
#include <QFileSystemWatcher>
#include <utility>

namespace usbdeck::core {

MountDirectoryWatcher::MountDirectoryWatcher(QObject* parent)
    : MountDirectoryWatcher(defaultDirectories(), parent) {}

MountDirectoryWatcher::MountDirectoryWatcher(QStringList directories, QObject* parent)
    : DeviceChangeWatcher(parent)
    , directories_(std::move(directories))
    , watcher_(nullptr) {}

MountDirectoryWatcher::~MountDirectoryWatcher() = default;

QStringList MountDirectoryWatcher::defaultDirectories() {
    QStringList dirs{QStringLiteral("/media"), QStringLiteral("/mnt")};
    const QString user = qEnvironmentVariable("USER");
    if (!user.isEmpty()) {
        dirs << QStringLiteral("/media/") + user
             << QStringLiteral("/run/media/") + user;
    }
    return dirs;
}

void MountDirectoryWatcher::start() {
    if (watcher_) {
        return;
    }

    watcher_ = new QFileSystemWatcher(this);
    for (const QString& dir : directories_) {
        if (!QFileInfo(dir).isDir()) {
            continue;
        }
        if (!watcher_->addPath(dir)) {
            qCWarning(lcDevice) << "Cannot watch" << dir;
        }
    }
    qCDebug(lcDevice) << "Watching mount directories" << watcher_->directories();

    connect(watcher_, &QFileSystemWatcher::directoryChanged, this, [this](const QString& path) {
        qCDebug(lcDevice) << "Mount directory changed:" << path;
        Q_EMIT deviceChangeDetected();
    });
}

void MountDirectoryWatcher::stop() {
    delete watcher_;
    watcher_ = nullptr;
}

QStringList MountDirectoryWatcher::watchedDirectories() const {
    return watcher_ ? watcher_->directories() : QStringList();
}

} // namespace usbdeck::core
