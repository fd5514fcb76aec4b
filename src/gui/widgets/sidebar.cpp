#include "sidebar.hpp"
#include <QIcon>
#include <QSignalBlocker>

namespace usbdeck::gui {

Sidebar::Sidebar(QWidget* parent)
    : QListWidget(parent) {
    setSelectionMode(QAbstractItemView::SingleSelection);
    setMaximumWidth(240);

    auto* overview = new QListWidgetItem(QIcon::fromTheme(QStringLiteral("computer")), tr("Overview"), this);
    overview->setData(Qt::UserRole, QString());
    setCurrentRow(0);

    connect(this, &QListWidget::currentRowChanged, this, &Sidebar::onCurrentRowChanged);
}

void Sidebar::setStorages(const device::StorageMap& storages) {
    QSignalBlocker blocker(this);

    while (count() > 1) {
        delete takeItem(count() - 1);
    }

    for (const auto& kv : storages) {
        const device::StorageDeviceInfo& storage = kv.second;
        QString label = QString::fromStdString(kv.first.instanceId);
        if (!storage.volumes.empty() && storage.volumes.front().volumeLabel) {
            label = QString::fromStdString(*storage.volumes.front().volumeLabel);
        } else if (storage.base.product) {
            label = QString::fromStdString(*storage.base.product);
        }

        auto* item = new QListWidgetItem(QIcon::fromTheme(QStringLiteral("drive-removable-media")), label, this);
        item->setData(Qt::UserRole, QString::fromStdString(kv.first.instanceId));
        item->setToolTip(QString::fromStdString(kv.first.instanceId));
    }

    // Keep the highlighted row; the main area decides where we really are
    if (selected_.isEmpty()) {
        setCurrentRow(0);
    } else {
        selectDevice(selected_);
    }
}

void Sidebar::selectOverview() {
    QSignalBlocker blocker(this);
    selected_.clear();
    setCurrentRow(0);
}

void Sidebar::selectDevice(const QString& instance_id) {
    QSignalBlocker blocker(this);
    for (int row = 1; row < count(); ++row) {
        if (item(row)->data(Qt::UserRole).toString() == instance_id) {
            selected_ = instance_id;
            setCurrentRow(row);
            return;
        }
    }
    selected_.clear();
    setCurrentRow(0);
}

void Sidebar::onCurrentRowChanged(int row) {
    if (row < 0) {
        return;
    }
    QString target = currentTarget();
    if (target.isEmpty()) {
        emit overviewRequested();
    } else {
        emit deviceRequested(target);
    }
}

QString Sidebar::currentTarget() const {
    QListWidgetItem* current = currentItem();
    return current ? current->data(Qt::UserRole).toString() : QString();
}

} // namespace usbdeck::gui
