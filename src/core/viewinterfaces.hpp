#pragma once

#include "usbdeck/device/deviceinfo.hpp"
#include <optional>

namespace usbdeck::core {

class FileBrowserPage;

/**
 * @brief View stack that displays cached file-browser pages
 *
 * The host only borrows pages. detachPage() is always called before the
 * cache destroys a page, after which the host must drop every reference
 * to it.
 */
class PageHost {
public:
    virtual ~PageHost() = default;

    virtual void attachPage(const device::DeviceId& id, FileBrowserPage& page) = 0;
    virtual void detachPage(const device::DeviceId& id) = 0;
};

/**
 * @brief Selection held by the overview display
 */
class OverviewSelection {
public:
    virtual ~OverviewSelection() = default;

    virtual std::optional<device::DeviceId> selectedDevice() const = 0;
    virtual void clearDeviceSelection() = 0;
};

} // namespace usbdeck::core
