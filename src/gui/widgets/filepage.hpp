#pragma once

#include <QWidget>
#include <QString>
#include "core/filebrowserpage.hpp"

class QLabel;
class QListWidget;
class QListWidgetItem;
class QToolButton;

namespace usbdeck::gui {

/**
 * @brief Minimal view of one cached FileBrowserPage
 *
 * Borrows the page; MainWindow deletes this widget when the page is
 * detached.
 */
class FilePage : public QWidget {
    Q_OBJECT

public:
    FilePage(core::FileBrowserPage& page, QWidget* parent = nullptr);

public slots:
    void render();

signals:
    void refreshAllRequested();
    void errorOccurred(const QString& message);

private:
    void onItemActivated(QListWidgetItem* item);
    void onGoUp();
    void report(const fs::FsResult& result);

    core::FileBrowserPage& page_;
    QLabel* path_label_{nullptr};
    QListWidget* entries_{nullptr};
    QToolButton* up_button_{nullptr};
    QToolButton* refresh_button_{nullptr};
};

} // namespace usbdeck::gui
