#include "swarmsync/random.hpp"

#include <sodium/randombytes.h>

namespace swarmsync::random {

ustring random(size_t size) {
    ustring bytes(size, 0);
    randombytes_buf(bytes.data(), bytes.size());
    return bytes;
}

uint32_t uniform(uint32_t upper_bound) {
    return upper_bound ? randombytes_uniform(upper_bound) : 0;
}

}  // namespace swarmsync::random
