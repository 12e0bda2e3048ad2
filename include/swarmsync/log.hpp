#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace swarmsync {

// Levels for the logging callback
enum class LogLevel { debug = 0, info, warning, error, critical };

/// Returns a short name for the log level ("debug", "info", ...).
std::string_view to_string(LogLevel lvl);

/// Logging callback carried by the long-lived components (config objects, the config store, the
/// pollers and the poller manager).  A component without a logger drops its messages.
using Logger = std::function<void(LogLevel lvl, std::string msg)>;

}  // namespace swarmsync
