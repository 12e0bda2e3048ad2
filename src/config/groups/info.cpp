#include "swarmsync/config/groups/info.hpp"

#include <oxenc/hex.h>

#include "../internal.hpp"

namespace swarmsync::config::groups {

Info::Info(
        ustring_view ed25519_pubkey,
        std::optional<ustring_view> ed25519_secretkey,
        std::optional<ustring_view> dumped) :
        ConfigBase{dumped, ed25519_pubkey, ed25519_secretkey},
        id{"03" + oxenc::to_hex(ed25519_pubkey.begin(), ed25519_pubkey.end())} {}

std::optional<std::string> Info::get_name() const {
    if (auto s = _data.get_string("", "n"); s && !s->empty())
        return s;
    return std::nullopt;
}

void Info::set_name(std::string_view new_name) {
    set_nonempty_str("", "n", utf8_truncate(std::string{new_name}, NAME_MAX_LENGTH));
}

std::optional<std::string> Info::get_description() const {
    if (auto s = _data.get_string("", "o"); s && !s->empty())
        return s;
    return std::nullopt;
}

void Info::set_description(std::string_view new_desc) {
    set_nonempty_str("", "o", utf8_truncate(std::string{new_desc}, DESCRIPTION_MAX_LENGTH));
}

profile_pic Info::get_profile_pic() const {
    return read_profile_pic(_data, "");
}

void Info::set_profile_pic(std::string_view url, ustring_view key) {
    profile_pic::check_url(url);
    set_pair_if(!url.empty() && key.size() == 32, "", "p", url, "q", from_unsigned_sv(key));
}

void Info::set_profile_pic(profile_pic pic) {
    set_profile_pic(pic.url, pic.key);
}

void Info::set_expiry_timer(std::chrono::seconds expiration_timer) {
    set_positive_int("", "E", expiration_timer.count());
}

std::optional<std::chrono::seconds> Info::get_expiry_timer() const {
    if (auto exp = _data.get_int("", "E"); exp && *exp > 0)
        return std::chrono::seconds{*exp};
    return std::nullopt;
}

void Info::set_created(int64_t timestamp) {
    set_positive_int("", "c", timestamp);
}

std::optional<int64_t> Info::get_created() const {
    if (auto ts = _data.get_int("", "c"); ts && *ts > 0)
        return ts;
    return std::nullopt;
}

void Info::set_delete_before(int64_t timestamp) {
    set_positive_int("", "d", timestamp);
}

std::optional<int64_t> Info::get_delete_before() const {
    if (auto ts = _data.get_int("", "d"); ts && *ts > 0)
        return ts;
    return std::nullopt;
}

void Info::set_delete_attach_before(int64_t timestamp) {
    set_positive_int("", "D", timestamp);
}

std::optional<int64_t> Info::get_delete_attach_before() const {
    if (auto ts = _data.get_int("", "D"); ts && *ts > 0)
        return ts;
    return std::nullopt;
}

void Info::destroy_group() {
    set_flag("", "!", true);
}

bool Info::is_destroyed() const {
    return _data.get_int("", "!").value_or(0) > 0;
}

std::string Info::event_key(std::string_view, std::string_view field) const {
    std::string key{"group."};
    key += id;
    key += '.';
    if (field == "!")
        key += "destroyed";
    else if (field == "c")
        key += "created";
    else if (field == "d")
        key += "delete_before";
    else if (field == "D")
        key += "delete_attach_before";
    else if (field == "E")
        key += "expiry_timer";
    else if (field == "n")
        key += "name";
    else if (field == "o")
        key += "description";
    else if (field == "p")
        key += "pic_url";
    else if (field == "q")
        key += "pic_key";
    else
        key += field;
    return key;
}

}  // namespace swarmsync::config::groups
