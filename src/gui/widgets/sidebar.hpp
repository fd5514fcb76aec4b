#pragma once

#include <QListWidget>
#include <QString>
#include "usbdeck/device/deviceinfo.hpp"

namespace usbdeck::gui {

/**
 * @brief Navigation list: the overview entry followed by one entry per storage device
 */
class Sidebar : public QListWidget {
    Q_OBJECT

public:
    explicit Sidebar(QWidget* parent = nullptr);

    void setStorages(const device::StorageMap& storages);

    // Selection sync only; neither emits a request
    void selectOverview();
    void selectDevice(const QString& instance_id);

signals:
    void overviewRequested();
    void deviceRequested(const QString& instance_id);

private:
    void onCurrentRowChanged(int row);
    QString currentTarget() const;

    QString selected_;  // Empty for the overview
};

} // namespace usbdeck::gui
