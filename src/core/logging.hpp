#pragma once

#include <QLoggingCategory>

namespace usbdeck::core {

Q_DECLARE_LOGGING_CATEGORY(lcMainArea)
Q_DECLARE_LOGGING_CATEGORY(lcRefresh)
Q_DECLARE_LOGGING_CATEGORY(lcPages)
Q_DECLARE_LOGGING_CATEGORY(lcNavigation)
Q_DECLARE_LOGGING_CATEGORY(lcDevice)
Q_DECLARE_LOGGING_CATEGORY(lcConfig)

} // namespace usbdeck::core
