#include "logging.hpp"

namespace usbdeck::core {

Q_LOGGING_CATEGORY(lcMainArea, "usbdeck.mainarea")
Q_LOGGING_CATEGORY(lcRefresh, "usbdeck.refresh")
Q_LOGGING_CATEGORY(lcPages, "usbdeck.pages")
Q_LOGGING_CATEGORY(lcNavigation, "usbdeck.navigation")
Q_LOGGING_CATEGORY(lcDevice, "usbdeck.device")
Q_LOGGING_CATEGORY(lcConfig, "usbdeck.config")

} // namespace usbdeck::core
