#include "drivelist.hpp"
#include <QHeaderView>
#include <QItemSelectionModel>
#include <QSignalBlocker>

namespace usbdeck::gui {

namespace {

QString toQString(const std::optional<std::string>& value, const QString& fallback = QString()) {
    return value ? QString::fromStdString(*value) : fallback;
}

} // namespace

DriveList::DriveList(QWidget* parent)
    : QTreeView(parent)
    , model_(std::make_unique<QStandardItemModel>()) {
    setupModel();
    setupView();
}

DriveList::~DriveList() = default;

void DriveList::setupModel() {
    QStringList headers;
    headers << tr("Name") << tr("Kind") << tr("Mounted At") << tr("Size") << tr("File System");
    model_->setHorizontalHeaderLabels(headers);
    setModel(model_.get());

    connect(selectionModel(), &QItemSelectionModel::selectionChanged,
            this, [this]() { emitSelection(); });
    connect(this, &QTreeView::doubleClicked, this, [this](const QModelIndex& index) {
        QString id = model_->data(model_->index(index.row(), Name), Qt::UserRole).toString();
        if (!id.isEmpty()) {
            emit deviceActivated(id);
        }
    });
}

void DriveList::setupView() {
    setSelectionMode(QAbstractItemView::SingleSelection);
    setSelectionBehavior(QAbstractItemView::SelectRows);
    setEditTriggers(QAbstractItemView::NoEditTriggers);
    setAlternatingRowColors(true);
    setRootIsDecorated(false);
    setUniformRowHeights(true);

    header()->setStretchLastSection(false);
    header()->setSectionResizeMode(Name, QHeaderView::Stretch);
    header()->setSectionResizeMode(Kind, QHeaderView::ResizeToContents);
    header()->setSectionResizeMode(MountPath, QHeaderView::ResizeToContents);
    header()->setSectionResizeMode(Size, QHeaderView::ResizeToContents);
    header()->setSectionResizeMode(FileSystem, QHeaderView::ResizeToContents);
    header()->setDefaultAlignment(Qt::AlignLeft | Qt::AlignVCenter);
}

void DriveList::setDevices(const std::vector<device::DeviceEntry>& devices) {
    {
        QSignalBlocker blocker(selectionModel());
        model_->removeRows(0, model_->rowCount());
        for (const device::DeviceEntry& entry : devices) {
            model_->appendRow(createDeviceRow(entry));
        }
    }
    emitSelection();
}

std::optional<device::DeviceId> DriveList::selectedDevice() const {
    QModelIndexList selection = selectionModel()->selectedRows(Name);
    if (selection.isEmpty()) {
        return std::nullopt;
    }
    QString id = model_->data(selection.first(), Qt::UserRole).toString();
    if (id.isEmpty()) {
        return std::nullopt;
    }
    return device::DeviceId{id.toStdString()};
}

void DriveList::clearDeviceSelection() {
    clearSelection();
}

void DriveList::emitSelection() {
    std::optional<device::DeviceId> id = selectedDevice();
    emit deviceSelectionChanged(id ? QString::fromStdString(id->instanceId) : QString());
}

QList<QStandardItem*> DriveList::createDeviceRow(const device::DeviceEntry& entry) const {
    const device::BaseDeviceInfo& base = device::baseInfo(entry);
    const device::StorageDeviceInfo* storage = device::asStorage(entry);

    QString name = toQString(base.product, toQString(base.description, QString::fromStdString(base.id.instanceId)));
    if (base.manufacturer) {
        name = QString::fromStdString(*base.manufacturer) + QLatin1Char(' ') + name;
    }

    QString mount;
    QString size;
    QString fileSystem;
    if (storage && !storage->volumes.empty()) {
        const device::VolumeInfo& volume = storage->volumes.front();
        if (volume.mountPath) {
            mount = QString::fromStdString(volume.mountPath->string());
        } else {
            mount = toQString(volume.driveLetter);
        }
        if (volume.totalBytes) {
            size = formatSize(*volume.totalBytes);
        }
        fileSystem = toQString(volume.fileSystem);
    }

    auto* nameItem = new QStandardItem(getDeviceIcon(entry), name);
    nameItem->setData(QString::fromStdString(base.id.instanceId), Qt::UserRole);
    nameItem->setToolTip(QString::fromStdString(base.id.instanceId));

    QList<QStandardItem*> row;
    row << nameItem
        << new QStandardItem(storage ? tr("Storage") : tr("USB Device"))
        << new QStandardItem(mount)
        << new QStandardItem(size)
        << new QStandardItem(fileSystem);
    return row;
}

QString DriveList::formatSize(std::uint64_t size) const {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = KB * 1024;
    constexpr std::uint64_t GB = MB * 1024;
    constexpr std::uint64_t TB = GB * 1024;

    if (size >= TB) return QString("%1 TB").arg(size / TB);
    if (size >= GB) return QString("%1 GB").arg(size / GB);
    if (size >= MB) return QString("%1 MB").arg(size / MB);
    if (size >= KB) return QString("%1 KB").arg(size / KB);
    return QString("%1 B").arg(size);
}

QIcon DriveList::getDeviceIcon(const device::DeviceEntry& entry) const {
    if (device::asStorage(entry)) {
        return QIcon::fromTheme(QStringLiteral("drive-removable-media"));
    }
    return QIcon::fromTheme(QStringLiteral("drive-harddisk-usb"),
                            QIcon::fromTheme(QStringLiteral("computer")));
}

} // namespace usbdeck::gui
