#include <sodium/utils.h>

#include <swarmsync/util.hpp>

namespace swarmsync {

void sodium_zero_buffer(void* ptr, size_t size) {
    if (ptr)
        sodium_memzero(ptr, size);
}

std::string utf8_truncate(std::string val, size_t n) {
    if (val.size() <= n)
        return val;
    // Back up until we are not in the middle of a multi-byte sequence (continuation bytes are
    // 0b10xxxxxx).
    while (n > 0 && (static_cast<unsigned char>(val[n]) & 0xc0) == 0x80)
        n--;
    val.resize(n);
    return val;
}

}  // namespace swarmsync
