#include "filepage.hpp"
#include <QHBoxLayout>
#include <QIcon>
#include <QLabel>
#include <QListWidget>
#include <QToolButton>
#include <QVBoxLayout>

namespace usbdeck::gui {

FilePage::FilePage(core::FileBrowserPage& page, QWidget* parent)
    : QWidget(parent)
    , page_(page) {
    path_label_ = new QLabel(this);
    path_label_->setTextInteractionFlags(Qt::TextSelectableByMouse);

    up_button_ = new QToolButton(this);
    up_button_->setIcon(QIcon::fromTheme(QStringLiteral("go-up")));
    up_button_->setToolTip(tr("Parent directory"));

    refresh_button_ = new QToolButton(this);
    refresh_button_->setIcon(QIcon::fromTheme(QStringLiteral("view-refresh")));
    refresh_button_->setToolTip(tr("Refresh devices and this directory"));

    entries_ = new QListWidget(this);

    auto* bar = new QHBoxLayout();
    bar->addWidget(up_button_);
    bar->addWidget(path_label_, 1);
    bar->addWidget(refresh_button_);

    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->addLayout(bar);
    layout->addWidget(entries_, 1);

    connect(up_button_, &QToolButton::clicked, this, &FilePage::onGoUp);
    connect(refresh_button_, &QToolButton::clicked, this, &FilePage::refreshAllRequested);
    connect(entries_, &QListWidget::itemActivated, this, &FilePage::onItemActivated);

    render();
}

void FilePage::render() {
    path_label_->setText(page_.currentDirectory().empty()
        ? tr("No mounted volume")
        : QString::fromStdString(page_.currentDirectory().string()));
    up_button_->setEnabled(page_.currentDirectory() != page_.root());

    entries_->clear();
    for (const fs::FileEntry& entry : page_.entries()) {
        auto* item = new QListWidgetItem(
            QIcon::fromTheme(entry.is_directory ? QStringLiteral("folder") : QStringLiteral("text-x-generic")),
            QString::fromStdString(entry.name), entries_);
        item->setData(Qt::UserRole, entry.is_directory);
    }
}

void FilePage::onItemActivated(QListWidgetItem* item) {
    if (!item || !item->data(Qt::UserRole).toBool()) {
        return;
    }
    report(page_.enter(item->text().toStdString()));
    render();
}

void FilePage::onGoUp() {
    report(page_.goUp());
    render();
}

void FilePage::report(const fs::FsResult& result) {
    if (!result.success) {
        emit errorOccurred(QString::fromStdString(result.message));
    }
}

} // namespace usbdeck::gui
