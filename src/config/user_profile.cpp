#include "swarmsync/config/user_profile.hpp"

#include "internal.hpp"

namespace swarmsync::config {

UserProfile::UserProfile(ustring_view ed25519_secretkey, std::optional<ustring_view> dumped) :
        ConfigBase{dumped} {
    load_key(ed25519_secretkey);
}

std::optional<std::string> UserProfile::get_name() const {
    if (auto s = _data.get_string("", "n"); s && !s->empty())
        return s;
    return std::nullopt;
}

void UserProfile::set_name(std::string_view new_name) {
    if (new_name.size() > MAX_NAME_LENGTH)
        throw std::invalid_argument{"Invalid profile name: exceeds maximum length"};
    set_nonempty_str("", "n", new_name);
}

void UserProfile::set_name_truncated(std::string new_name) {
    set_name(utf8_truncate(std::move(new_name), MAX_NAME_LENGTH));
}

profile_pic UserProfile::get_profile_pic() const {
    return read_profile_pic(_data, "");
}

void UserProfile::set_profile_pic(std::string_view url, ustring_view key) {
    profile_pic::check_url(url);
    set_pair_if(!url.empty() && key.size() == 32, "", "p", url, "q", from_unsigned_sv(key));
}

void UserProfile::set_profile_pic(profile_pic pic) {
    set_profile_pic(pic.url, pic.key);
}

void UserProfile::set_nts_priority(int priority) {
    set_nonzero_int("", "+", priority);
}

int UserProfile::get_nts_priority() const {
    return static_cast<int>(_data.get_int("", "+").value_or(0));
}

void UserProfile::set_nts_expiry(std::chrono::seconds expiry) {
    set_positive_int("", "e", expiry.count());
}

std::optional<std::chrono::seconds> UserProfile::get_nts_expiry() const {
    if (auto e = _data.get_int("", "e"); e && *e > 0)
        return std::chrono::seconds{*e};
    return std::nullopt;
}

void UserProfile::set_blinded_msgreqs(std::optional<bool> value) {
    if (!value)
        set_field("", "M", std::nullopt);
    else
        set_field("", "M", int64_t{*value});
}

std::optional<bool> UserProfile::get_blinded_msgreqs() const {
    if (auto M = _data.get_int("", "M"))
        return static_cast<bool>(*M);
    return std::nullopt;
}

std::string UserProfile::event_key(std::string_view, std::string_view field) const {
    if (field == "n")
        return "profile.name";
    if (field == "p")
        return "profile.pic_url";
    if (field == "q")
        return "profile.pic_key";
    if (field == "+")
        return "profile.nts_priority";
    if (field == "e")
        return "profile.nts_expiry";
    if (field == "M")
        return "profile.blinded_msgreqs";
    return "profile." + std::string{field};
}

}  // namespace swarmsync::config
