#include "pagecache.hpp"
#include "logging.hpp"
#include "viewinterfaces.hpp"
#include <QString>
#include <stdexcept>

namespace usbdeck::core {

PageCache::PageCache(PageHost* host)
    : host_(host) {}

// Teardown releases pages without notifying the host, which may already be gone
PageCache::~PageCache() = default;

FileBrowserPage* PageCache::find(const device::DeviceId& id) const {
    auto it = pages_.find(id);
    return it != pages_.end() ? it->second.get() : nullptr;
}

std::vector<device::DeviceId> PageCache::keys() const {
    std::vector<device::DeviceId> result;
    result.reserve(pages_.size());
    for (const auto& kv : pages_) {
        result.push_back(kv.first);
    }
    return result;
}

FileBrowserPage& PageCache::insert(const device::DeviceId& id, std::unique_ptr<FileBrowserPage> page) {
    if (!page) {
        throw std::invalid_argument("PageCache::insert: null page");
    }
    if (pages_.count(id) != 0) {
        throw std::logic_error("PageCache::insert: page already cached for " + id.instanceId);
    }

    FileBrowserPage& ref = *page;
    pages_.emplace(id, std::move(page));
    qCDebug(lcPages) << "Cached page for" << QString::fromStdString(id.instanceId);

    if (host_) {
        host_->attachPage(id, ref);
    }
    return ref;
}

std::vector<device::DeviceId> PageCache::reconcile(const device::StorageMap& storages) {
    std::vector<device::DeviceId> stale;
    for (const auto& kv : pages_) {
        if (storages.count(kv.first) == 0) {
            stale.push_back(kv.first);
        }
    }

    for (const device::DeviceId& id : stale) {
        evict(id);
    }
    return stale;
}

bool PageCache::evict(const device::DeviceId& id) {
    auto it = pages_.find(id);
    if (it == pages_.end()) {
        return false;
    }

    // The host must let go before the page is destroyed
    if (host_) {
        host_->detachPage(id);
    }
    it->second->release();
    pages_.erase(it);

    qCInfo(lcPages) << "Evicted page for" << QString::fromStdString(id.instanceId);
    return true;
}

} // namespace usbdeck::core
