#pragma once

#include "core_export.hpp"
#include "filebrowserpage.hpp"
#include "usbdeck/device/deviceinfo.hpp"
#include <map>
#include <memory>
#include <vector>

namespace usbdeck::core {

class PageHost;

/**
 * @brief Per-device cache of file-browser pages
 *
 * Owns every page it holds. Pages are created by the navigation layer on
 * first visit and leave the cache only through eviction or destruction.
 */
class USBDECK_CORE_EXPORT PageCache {
public:
    explicit PageCache(PageHost* host = nullptr);
    ~PageCache();

    PageCache(const PageCache&) = delete;
    PageCache& operator=(const PageCache&) = delete;

    void setHost(PageHost* host) { host_ = host; }

    FileBrowserPage* find(const device::DeviceId& id) const;
    bool contains(const device::DeviceId& id) const { return pages_.count(id) != 0; }
    std::size_t size() const { return pages_.size(); }
    std::vector<device::DeviceId> keys() const;

    /**
     * @brief Insert a page and hand it to the host
     * @return Reference to the cached page
     */
    FileBrowserPage& insert(const device::DeviceId& id, std::unique_ptr<FileBrowserPage> page);

    /**
     * @brief Evict every page whose device is missing from storages
     * @return Ids that were evicted
     */
    std::vector<device::DeviceId> reconcile(const device::StorageMap& storages);

    /**
     * @brief Detach, release and remove one page
     * @return false if no page was cached for id
     */
    bool evict(const device::DeviceId& id);

private:
    PageHost* host_;
    std::map<device::DeviceId, std::unique_ptr<FileBrowserPage>> pages_;
};

} // namespace usbdeck::core
