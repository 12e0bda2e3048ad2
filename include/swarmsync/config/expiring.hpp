#pragma once

#include <cstdint>

namespace swarmsync::config {

/// Disappearing message mode of a conversation.
enum class expiration_mode : int8_t { none = 0, after_send = 1, after_read = 2 };

}  // namespace swarmsync::config
