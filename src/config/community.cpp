#include "swarmsync/config/community.hpp"

#include <oxenc/hex.h>

#include <cctype>
#include <charconv>
#include <stdexcept>

#include "internal.hpp"
#include "swarmsync/util.hpp"

namespace swarmsync::config {

namespace {

    struct server_url {
        std::string scheme;  // "http://" or "https://"
        std::string host;    // lower-case
        uint16_t port = 0;   // 0 for the scheme's default port
    };

    [[noreturn]] void bad_url(std::string_view why) {
        throw std::invalid_argument{"Invalid community URL: " + std::string{why}};
    }

    bool is_host_char(char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || c == '-';
    }

    void take_scheme(std::string_view& url, server_url& out) {
        auto sep = url.find("://");
        if (sep == std::string_view::npos)
            bad_url("invalid/missing protocol://");
        auto scheme = url.substr(0, sep);
        if (string_iequal(scheme, "https"))
            out.scheme = "https://";
        else if (string_iequal(scheme, "http"))
            out.scheme = "http://";
        else
            bad_url("invalid/missing protocol://");
        url.remove_prefix(sep + 3);
    }

    // Hostname labels separated by single dots, at least one dot, no trailing dot.
    void take_host(std::string_view& url, server_url& out) {
        size_t dots = 0;
        size_t i = 0;
        for (; i < url.size(); ++i) {
            char c = static_cast<char>(std::tolower(static_cast<unsigned char>(url[i])));
            if (c == '.') {
                if (out.host.empty() || out.host.back() == '.')
                    break;
                ++dots;
            } else if (!is_host_char(c)) {
                break;
            }
            out.host += c;
        }
        url.remove_prefix(i);
        if (out.host.size() < 4 || dots == 0 || out.host.back() == '.')
            bad_url("invalid hostname");
    }

    void take_port(std::string_view& url, server_url& out) {
        if (url.empty() || url.front() != ':')
            return;
        url.remove_prefix(1);
        auto [end, ec] = std::from_chars(url.data(), url.data() + url.size(), out.port);
        if (ec != std::errc{})
            bad_url("invalid port");
        url.remove_prefix(end - url.data());
        const uint16_t default_port = out.scheme == "https://" ? 443 : 80;
        if (out.port == default_port)
            out.port = 0;
    }

    server_url parse_server_url(std::string_view url) {
        server_url result;
        take_scheme(url, result);
        take_host(url, result);
        take_port(url, result);
        if (starts_with(url, "/"))
            url.remove_prefix(1);
        if (!url.empty())
            bad_url("found unexpected trailing value");
        return result;
    }

}  // namespace

community::community(std::string_view base_url, std::string_view room) :
        base_url_{canonical_url(base_url)}, room_{canonical_room(room)} {}

community::community(std::string_view base_url, std::string_view room, ustring_view pubkey) :
        community{base_url, room} {
    set_pubkey(pubkey);
}

community::community(
        std::string_view base_url, std::string_view room, std::string_view pubkey_encoded) :
        community{base_url, room} {
    set_pubkey(pubkey_encoded);
}

void community::set_base_url(std::string_view new_url) {
    base_url_ = canonical_url(new_url);
}

void community::set_room(std::string_view room) {
    room_ = canonical_room(room);
}

void community::set_pubkey(ustring_view pubkey) {
    if (pubkey.size() != 32)
        throw std::invalid_argument{"Invalid community pubkey: expected 32 bytes"};
    pubkey_.assign(pubkey.begin(), pubkey.end());
}

void community::set_pubkey(std::string_view pubkey) {
    pubkey_ = decode_pubkey(pubkey);
}

std::string community::pubkey_hex() const {
    return oxenc::to_hex(pubkey_.begin(), pubkey_.end());
}

std::string community::id() const {
    std::string out;
    out.reserve(base_url_.size() + 1 + room_.size());
    out += base_url_;
    out += '/';
    out += room_;
    return out;
}

std::string community::canonical_url(std::string_view url) {
    auto parsed = parse_server_url(url);
    std::string canonical = parsed.scheme + parsed.host;
    if (parsed.port)
        canonical += ":" + std::to_string(parsed.port);
    if (canonical.size() > BASE_URL_MAX_LENGTH)
        bad_url("base URL is too long");
    return canonical;
}

std::string community::canonical_room(std::string_view room) {
    if (room.empty())
        throw std::invalid_argument{"Invalid community room: room token cannot be empty"};
    if (room.size() > ROOM_MAX_LENGTH)
        throw std::invalid_argument{"Invalid community room: room token is too long"};
    auto lc = to_lower(room);
    for (char c : lc)
        if (!is_host_char(c) && c != '_')
            throw std::invalid_argument{
                    "Invalid community room: room token contains invalid characters"};
    return lc;
}

}  // namespace swarmsync::config
