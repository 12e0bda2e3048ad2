#pragma once

#include <string>
#include <string_view>

#include "../types.hpp"

namespace swarmsync::config {

/// A room on a community server, identified by server url, room token and server pubkey.  The
/// url and room are kept canonical: lower-cased, default port and trailing slash removed.
struct community {

    // "https://" + longest DNS name (253) + ":65535"
    static constexpr size_t BASE_URL_MAX_LENGTH = 267;
    static constexpr size_t ROOM_MAX_LENGTH = 64;

    community() = default;

    // Throws std::invalid_argument for an unusable url, room or pubkey.  The pubkey is 32 raw
    // bytes or their hex or base64 encoding.
    community(std::string_view base_url, std::string_view room);
    community(std::string_view base_url, std::string_view room, ustring_view pubkey);
    community(std::string_view base_url, std::string_view room, std::string_view pubkey_encoded);

    void set_base_url(std::string_view new_url);
    void set_room(std::string_view room);
    void set_pubkey(ustring_view pubkey);
    void set_pubkey(std::string_view pubkey);

    const std::string& base_url() const { return base_url_; }
    const std::string& room() const { return room_; }
    const ustring& pubkey() const { return pubkey_; }
    std::string pubkey_hex() const;

    // "<base_url>/<room>": the room's key in config records and in the community pollers.
    std::string id() const;

    /// API: community/community::canonical_url
    ///
    /// Normalizes "HTTP://Example.org:80/" to "http://example.org".  Only an http or https
    /// scheme, a dotted hostname and an optional port are accepted; anything else throws
    /// std::invalid_argument.
    static std::string canonical_url(std::string_view url);

    /// API: community/community::canonical_room
    ///
    /// Lower-cased room token.  Tokens are 1 to 64 characters of [a-z0-9_-]; anything else
    /// throws std::invalid_argument.
    static std::string canonical_room(std::string_view room);

  protected:
    std::string base_url_;
    std::string room_;
    ustring pubkey_;
};

}  // namespace swarmsync::config
