#pragma once

#include <QTreeView>
#include <QWidget>
#include <QStandardItemModel>
#include <QIcon>
#include <QString>
#include <memory>
#include <optional>
#include <vector>
#include "core/viewinterfaces.hpp"
#include "usbdeck/device/deviceinfo.hpp"

namespace usbdeck::gui {

/**
 * @brief Overview list of all attached devices
 *
 * Passive: rows are rebuilt from each snapshot, the selection is read by
 * the main area on demand.
 */
class DriveList : public QTreeView, public core::OverviewSelection {
    Q_OBJECT

public:
    // Column definitions
    enum Column {
        Name,
        Kind,
        MountPath,
        Size,
        FileSystem,
        ColumnCount
    };

    explicit DriveList(QWidget* parent = nullptr);
    ~DriveList();

    void setDevices(const std::vector<device::DeviceEntry>& devices);

    // core::OverviewSelection
    std::optional<device::DeviceId> selectedDevice() const override;
    void clearDeviceSelection() override;

signals:
    void deviceSelectionChanged(const QString& instance_id);
    void deviceActivated(const QString& instance_id);

private:
    void setupModel();
    void setupView();

    QList<QStandardItem*> createDeviceRow(const device::DeviceEntry& entry) const;
    void emitSelection();

    QString formatSize(std::uint64_t size) const;
    QIcon getDeviceIcon(const device::DeviceEntry& entry) const;

private:
    std::unique_ptr<QStandardItemModel> model_;
};

} // namespace usbdeck::gui
