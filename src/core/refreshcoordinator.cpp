#include "refreshcoordinator.hpp"
#include "logging.hpp"
#include <QException>
#include <QFutureWatcher>
#include <QThreadPool>
#include <QtConcurrent/QtConcurrentRun>
#include <exception>
#include <stdexcept>

namespace usbdeck::core {

namespace {

std::unique_ptr<device::DeviceEnumerationProvider> createProvider(const device::ProviderFactory& factory) {
    std::unique_ptr<device::DeviceEnumerationProvider> provider = factory();
    if (!provider) {
        throw std::runtime_error("Device provider could not be created");
    }
    return provider;
}

} // namespace

RefreshCoordinator::RefreshCoordinator(MainAreaState& state,
                                       device::ProviderFactory factory,
                                       QThreadPool* pool,
                                       QObject* parent)
    : QObject(parent)
    , state_(state)
    , factory_(std::move(factory))
    , pool_(pool ? pool : QThreadPool::globalInstance())
    , eject_generation_(0)
    , pending_tasks_(0) {
    if (!factory_) {
        throw std::invalid_argument("RefreshCoordinator requires a provider factory");
    }
}

// Watchers are children and die with us; running tasks finish unobserved
RefreshCoordinator::~RefreshCoordinator() = default;

bool RefreshCoordinator::requestRefresh() {
    std::optional<std::uint64_t> generation = state_.beginRefresh();
    if (!generation) {
        qCDebug(lcRefresh) << "Refresh request dropped, scanning:" << state_.isScanning()
                           << "closing:" << state_.isClosing();
        return false;
    }

    const std::uint64_t tag = *generation;
    qCInfo(lcRefresh) << "Starting device enumeration, generation" << tag;

    auto* watcher = new QFutureWatcher<EnumerationOutcome>(this);
    connect(watcher, &QFutureWatcherBase::finished, this, [this, watcher, tag]() {
        EnumerationOutcome outcome;
        try {
            outcome = watcher->result();
        } catch (const QException& e) {
            outcome.generation = tag;
            outcome.error = e.what();
        }
        watcher->deleteLater();
        onEnumerationFinished(outcome);
    });

    ++pending_tasks_;
    Q_EMIT scanStarted(tag);

    device::ProviderFactory factory = factory_;
    watcher->setFuture(QtConcurrent::run(pool_, [factory, tag]() {
        EnumerationOutcome outcome;
        outcome.generation = tag;
        try {
            auto provider = createProvider(factory);
            outcome.result = device::enumerateDevices(*provider);
        } catch (const std::exception& e) {
            outcome.error = e.what();
        }
        return outcome;
    }));
    return true;
}

bool RefreshCoordinator::requestEject(const device::DeviceId& id) {
    if (!state_.beginEject()) {
        qCDebug(lcRefresh) << "Eject request dropped for" << QString::fromStdString(id.instanceId);
        return false;
    }

    const std::uint64_t tag = ++eject_generation_;
    qCInfo(lcRefresh) << "Ejecting" << QString::fromStdString(id.instanceId);

    auto* watcher = new QFutureWatcher<EjectOutcome>(this);
    connect(watcher, &QFutureWatcherBase::finished, this, [this, watcher, tag, id]() {
        EjectOutcome outcome;
        try {
            outcome = watcher->result();
        } catch (const QException& e) {
            outcome.generation = tag;
            outcome.device_id = id;
            outcome.error = e.what();
        }
        watcher->deleteLater();
        onEjectFinished(outcome);
    });

    ++pending_tasks_;
    Q_EMIT ejectStarted(QString::fromStdString(id.instanceId));

    device::ProviderFactory factory = factory_;
    watcher->setFuture(QtConcurrent::run(pool_, [factory, tag, id]() {
        EjectOutcome outcome;
        outcome.generation = tag;
        outcome.device_id = id;
        try {
            auto provider = createProvider(factory);
            outcome.result = provider->ejectStorageDevice(id);
        } catch (const std::exception& e) {
            outcome.error = e.what();
        }
        return outcome;
    }));
    return true;
}

void RefreshCoordinator::onEnumerationFinished(const EnumerationOutcome& outcome) {
    --pending_tasks_;

    if (state_.isClosing()) {
        qCDebug(lcRefresh) << "Discarding enumeration result, window is closing";
        return;
    }
    if (!state_.isCurrentGeneration(outcome.generation)) {
        qCDebug(lcRefresh) << "Discarding stale enumeration, generation" << outcome.generation
                           << "current" << state_.generation();
        return;
    }

    if (!outcome.result) {
        qCWarning(lcRefresh) << "Device enumeration failed:" << QString::fromStdString(outcome.error);
        state_.finishScan();
        Q_EMIT refreshFailed(QString::fromStdString(outcome.error));
        return;
    }

    std::vector<device::DeviceId> evicted = state_.applyEnumeration(*outcome.result);
    qCInfo(lcRefresh) << "Enumeration applied:" << state_.devices().size() << "devices,"
                      << state_.storages().size() << "storage," << evicted.size() << "pages evicted";
    Q_EMIT refreshApplied(evicted);
}

void RefreshCoordinator::onEjectFinished(const EjectOutcome& outcome) {
    --pending_tasks_;

    if (state_.isClosing()) {
        return;
    }
    if (outcome.generation != eject_generation_) {
        return;
    }

    state_.finishScan();

    if (!outcome.result) {
        qCWarning(lcRefresh) << "Eject failed:" << QString::fromStdString(outcome.error);
        Q_EMIT ejectFailed(QString::fromStdString(outcome.error));
        return;
    }
    if (!outcome.result->success) {
        qCWarning(lcRefresh) << "Eject refused:" << QString::fromStdString(outcome.result->message);
        Q_EMIT ejectFailed(QString::fromStdString(outcome.result->message));
        return;
    }

    Q_EMIT ejectCompleted(QString::fromStdString(outcome.result->message));
    requestRefresh();
}

} // namespace usbdeck::core
