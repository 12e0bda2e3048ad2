#include "swarmsync/log.hpp"

namespace swarmsync {

std::string_view to_string(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::debug: return "debug";
        case LogLevel::info: return "info";
        case LogLevel::warning: return "warning";
        case LogLevel::error: return "error";
        case LogLevel::critical: return "critical";
    }
    return "unknown";
}

}  // namespace swarmsync
