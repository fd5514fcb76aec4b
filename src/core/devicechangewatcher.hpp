#pragma once

#include "core_export.hpp"
#include <QObject>
#include <QStringList>

QT_BEGIN_NAMESPACE
class QFileSystemWatcher;
QT_END_NAMESPACE

namespace usbdeck::core {

/**
 * @brief Source of "something was plugged or unplugged" notifications
 *
 * A notification carries no detail; listeners re-enumerate. Bursts are
 * expected and left to the listener to debounce.
 */
class USBDECK_CORE_EXPORT DeviceChangeWatcher : public QObject {
    Q_OBJECT

public:
    explicit DeviceChangeWatcher(QObject* parent = nullptr) : QObject(parent) {}
    ~DeviceChangeWatcher() override = default;

    virtual void start() = 0;
    virtual void stop() = 0;

Q_SIGNALS:
    void deviceChangeDetected();
};

/**
 * @brief Watches the directories removable volumes are mounted under
 *
 * A mount or unmount below /media, /media/<user>, /run/media/<user> or
 * /mnt changes the directory entries there.
 */
class USBDECK_CORE_EXPORT MountDirectoryWatcher : public DeviceChangeWatcher {
    Q_OBJECT

public:
    explicit MountDirectoryWatcher(QObject* parent = nullptr);
    explicit MountDirectoryWatcher(QStringList directories, QObject* parent = nullptr);
    ~MountDirectoryWatcher() override;

    void start() override;
    void stop() override;

    // Directories actually watched after start()
    QStringList watchedDirectories() const;

    static QStringList defaultDirectories();

private:
    QStringList directories_;
    QFileSystemWatcher* watcher_;
};

} // namespace usbdeck::core
