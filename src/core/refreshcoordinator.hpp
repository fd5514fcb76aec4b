#pragma once

#include "core_export.hpp"
#include "mainareastate.hpp"
#include "device/enumerationprovider.hpp"
#include <QObject>
#include <QString>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

QT_BEGIN_NAMESPACE
class QThreadPool;
QT_END_NAMESPACE

namespace usbdeck::core {

/**
 * @brief Value produced by one enumeration task
 */
struct USBDECK_CORE_EXPORT EnumerationOutcome {
    std::uint64_t generation = 0;
    std::optional<device::EnumerationResult> result;
    std::string error;  // Set when result is empty
};

/**
 * @brief Value produced by one eject task
 */
struct USBDECK_CORE_EXPORT EjectOutcome {
    std::uint64_t generation = 0;
    device::DeviceId device_id;
    std::optional<device::EjectResult> result;
    std::string error;
};

/**
 * @brief Runs device enumeration and eject off the control thread
 *
 * At most one task is in flight, gated by MainAreaState's scanning flag.
 * Requests made while a task runs are dropped, not queued. Completions are
 * delivered on the thread that owns the coordinator and are discarded when
 * the state is closing or the task's generation has been superseded.
 */
class USBDECK_CORE_EXPORT RefreshCoordinator : public QObject {
    Q_OBJECT

public:
    /**
     * @brief Constructor
     * @param state State mutated by completions
     * @param factory Creates a provider on the worker, once per task
     * @param pool Worker pool; the global pool if null
     */
    RefreshCoordinator(MainAreaState& state,
                       device::ProviderFactory factory,
                       QThreadPool* pool = nullptr,
                       QObject* parent = nullptr);
    ~RefreshCoordinator() override;

    /**
     * @brief Start an enumeration
     * @return false if one is already running or the state is closing
     */
    bool requestRefresh();

    /**
     * @brief Start an eject of a storage device
     * @return false if a task is already running or the state is closing
     */
    bool requestEject(const device::DeviceId& id);

    // Tasks whose completion has not been delivered yet
    int pendingTasks() const { return pending_tasks_; }

Q_SIGNALS:
    void scanStarted(quint64 generation);
    void refreshApplied(const std::vector<usbdeck::device::DeviceId>& evicted);
    void refreshFailed(const QString& message);
    void ejectStarted(const QString& device_id);
    void ejectCompleted(const QString& message);
    void ejectFailed(const QString& message);

private:
    void onEnumerationFinished(const EnumerationOutcome& outcome);
    void onEjectFinished(const EjectOutcome& outcome);

    MainAreaState& state_;
    device::ProviderFactory factory_;
    QThreadPool* pool_;
    std::uint64_t eject_generation_;
    int pending_tasks_;
};

} // namespace usbdeck::core
