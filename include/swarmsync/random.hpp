#pragma once

#include <cstdint>

#include "types.hpp"

namespace swarmsync::random {

/// `size` bytes from libsodium's CSPRNG.
ustring random(size_t size);

/// Uniform in [0, upper_bound); 0 when upper_bound is 0.  Used to pick swarm nodes.
uint32_t uniform(uint32_t upper_bound);

}  // namespace swarmsync::random
