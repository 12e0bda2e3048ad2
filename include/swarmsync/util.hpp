#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>
#include <vector>

#include "types.hpp"

namespace swarmsync {

// Byte/char reinterpretation helpers for handing std::string data to libsodium and back.
inline const unsigned char* to_unsigned(const char* x) {
    return reinterpret_cast<const unsigned char*>(x);
}
inline unsigned char* to_unsigned(char* x) {
    return reinterpret_cast<unsigned char*>(x);
}
inline ustring_view to_unsigned_sv(std::string_view v) {
    return {to_unsigned(v.data()), v.size()};
}
inline ustring_view to_unsigned_sv(ustring_view v) {
    return v;
}
inline std::string_view from_unsigned_sv(ustring_view v) {
    return {reinterpret_cast<const char*>(v.data()), v.size()};
}
template <size_t N>
std::string_view from_unsigned_sv(const std::array<unsigned char, N>& v) {
    return from_unsigned_sv(ustring_view{v.data(), N});
}
template <typename Char, size_t N>
inline std::basic_string_view<Char> to_sv(const std::array<Char, N>& v) {
    return {v.data(), N};
}

/// Milliseconds since the unix epoch, from the system clock.
inline int64_t get_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
}

/// ASCII case-insensitive equality.
inline bool string_iequal(std::string_view s1, std::string_view s2) {
    return std::equal(s1.begin(), s1.end(), s2.begin(), s2.end(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
    });
}

inline constexpr bool starts_with(std::string_view str, std::string_view prefix) {
    return str.substr(0, prefix.size()) == prefix;
}

/// Returns an (ascii) lowercased copy of the given string.
inline std::string to_lower(std::string_view s) {
    std::string out{s};
    for (auto& c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

/// Truncates a UTF-8 string to at most `n` bytes without splitting a multi-byte character.
std::string utf8_truncate(std::string val, size_t n);

// sodium_memzero, tolerating nullptr.
void sodium_zero_buffer(void* ptr, size_t size);

// Holds key material and wipes it with sodium_memzero when destroyed.  T must be trivially
// destructible (typically a std::array).
template <typename T, typename = std::enable_if_t<std::is_trivially_destructible_v<T>>>
struct sodium_cleared : T {
    using T::T;

    ~sodium_cleared() { sodium_zero_buffer(this, sizeof(*this)); }
};

}  // namespace swarmsync
