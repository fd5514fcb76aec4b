#pragma once

#include <QMainWindow>
#include <QAction>
#include <QString>
#include <QCloseEvent>
#include <map>
#include <memory>
#include "core/mainarea.hpp"
#include "core/viewinterfaces.hpp"

class QStackedWidget;

namespace usbdeck::gui {

class DriveList;
class FilePage;
class Sidebar;

/**
 * @brief Top-level window hosting the sidebar, the overview and the device pages
 *
 * Purely a view: every user intent is forwarded to core::MainArea and every
 * change comes back through its signals.
 */
class MainWindow : public QMainWindow, public core::PageHost {
    Q_OBJECT

public:
    explicit MainWindow(std::unique_ptr<core::MainArea> main_area, QWidget* parent = nullptr);
    ~MainWindow() override;

    core::MainArea& mainArea() { return *main_area_; }

    // core::PageHost
    void attachPage(const device::DeviceId& id, core::FileBrowserPage& page) override;
    void detachPage(const device::DeviceId& id) override;

protected:
    void closeEvent(QCloseEvent* event) override;

private Q_SLOTS:
    void onStateChanged(const usbdeck::core::MainAreaSnapshot& snapshot);
    void onCurrentViewChanged(const usbdeck::core::ViewTarget& view);
    void onInteractivityChanged(bool enabled);
    void onDetailsRequested(const usbdeck::device::StorageDeviceInfo& storage);
    void onError(const QString& message);
    void onEjectCompleted(const QString& message);
    void onSelectionChanged(const QString& instance_id);

private:
    void setupUi();
    void setupMenusAndActions();
    void connectMainArea();
    void updateActions();

    QString formatSize(std::uint64_t size) const;

    std::unique_ptr<core::MainArea> main_area_;

    struct {
        QAction* refresh{nullptr};
        QAction* details{nullptr};
        QAction* eject{nullptr};
        QAction* quit{nullptr};
    } actions_;

    Sidebar* sidebar_{nullptr};
    QStackedWidget* stack_{nullptr};
    DriveList* drive_list_{nullptr};
    std::map<device::DeviceId, FilePage*> page_widgets_;

    core::MainAreaSnapshot snapshot_;
    bool interactive_{true};
};

} // namespace usbdeck::gui
