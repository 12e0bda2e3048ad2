#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include "../types.hpp"

namespace swarmsync::config {

/// Location and decryption key of an uploaded profile picture.  Records store it in the "p"
/// (url) and "q" (key) fields.
struct profile_pic {
    static constexpr size_t MAX_URL_LENGTH = 223;
    static constexpr size_t KEY_SIZE = 32;

    std::string url;
    ustring key;

    profile_pic() = default;

    /// Throws std::invalid_argument for an over-long url or a key that is neither empty nor
    /// KEY_SIZE bytes.
    profile_pic(std::string_view url, ustring_view key) : url{url}, key{key} {
        check_url(this->url);
        check_key(this->key);
    }

    static void check_url(std::string_view url) {
        if (url.size() > MAX_URL_LENGTH)
            throw std::invalid_argument{
                    "Invalid profile pic url: longer than " + std::to_string(MAX_URL_LENGTH)};
    }

    static void check_key(ustring_view key) {
        if (!key.empty() && key.size() != KEY_SIZE)
            throw std::invalid_argument{"Invalid profile pic key: expected 32 bytes"};
    }

    /// A picture is only usable with both a url and a full key.
    bool empty() const { return url.empty() || key.size() != KEY_SIZE; }
    explicit operator bool() const { return !empty(); }

    void clear() {
        url.clear();
        key.clear();
    }

    void set_key(ustring new_key) {
        check_key(new_key);
        key = std::move(new_key);
    }

    bool operator==(const profile_pic& o) const { return url == o.url && key == o.key; }
    bool operator!=(const profile_pic& o) const { return !(*this == o); }
};

}  // namespace swarmsync::config
