#include "swarmsync/config/groups/members.hpp"

#include <oxenc/hex.h>

#include "../internal.hpp"

namespace swarmsync::config::groups {

namespace {

    constexpr auto MEMBER_PREFIX = "m/"sv;
    constexpr auto ADMINS_SET = "admins"sv;

    std::string member_record(std::string_view session_id) {
        check_session_id(session_id);
        std::string rec{MEMBER_PREFIX};
        rec += session_id;
        make_lc(rec);
        return rec;
    }

}  // namespace

member::member(std::string sid) : session_id{std::move(sid)} {
    check_session_id(session_id);
    make_lc(session_id);
}

void member::set_name(std::string n) {
    if (n.size() > MAX_NAME_LENGTH)
        throw std::invalid_argument{"Invalid member name: exceeds maximum length"};
    name = std::move(n);
}

void member::load(const ConfigData& data, std::string_view rec) {
    name = data.get_string(rec, "n").value_or("");
    profile_picture = read_profile_pic(data, rec);

    admin = data.set_contains(ADMINS_SET, session_id);
    invite_status = admin ? 0 : static_cast<int>(data.get_int(rec, "I").value_or(0));
    promotion_status = admin ? 0 : static_cast<int>(data.get_int(rec, "P").value_or(0));
    removed_status = static_cast<int>(data.get_int(rec, "R").value_or(0));
    supplement = invite_pending() && !promoted() ? data.get_int(rec, "s").value_or(0) : 0;
}

Members::Members(
        ustring_view ed25519_pubkey,
        std::optional<ustring_view> ed25519_secretkey,
        std::optional<ustring_view> dumped) :
        ConfigBase{dumped, ed25519_pubkey, ed25519_secretkey},
        id{"03" + oxenc::to_hex(ed25519_pubkey.begin(), ed25519_pubkey.end())} {}

std::optional<member> Members::get(std::string_view pubkey_hex) const {
    auto rec = member_record(pubkey_hex);
    if (!_data.has_record(rec))
        return std::nullopt;

    auto result = std::make_optional<member>(std::string{pubkey_hex});
    result->load(_data, rec);
    return result;
}

member Members::get_or_construct(std::string_view pubkey_hex) const {
    if (auto maybe = get(pubkey_hex))
        return *std::move(maybe);

    return member{std::string{pubkey_hex}};
}

void Members::set(const member& mem) {
    auto rec = member_record(mem.session_id);

    // Always set the name, even if empty, to keep the record alive if there are no other fields.
    set_field(rec, "n", mem.name.substr(0, member::MAX_NAME_LENGTH));

    set_pair_if(
            static_cast<bool>(mem.profile_picture),
            rec,
            "p",
            mem.profile_picture.url,
            "q",
            from_unsigned_sv(mem.profile_picture.key));

    if (mem.admin)
        set_insert(ADMINS_SET, mem.session_id);
    else
        set_erase(ADMINS_SET, mem.session_id);

    set_positive_int(rec, "P", mem.admin ? 0 : mem.promotion_status);
    set_positive_int(rec, "I", mem.admin ? 0 : mem.invite_status);
    set_flag(rec, "s", mem.supplement);
    set_positive_int(rec, "R", mem.removed_status);
}

bool Members::erase(std::string_view session_id) {
    auto rec = member_record(session_id);
    bool was_admin = set_erase(ADMINS_SET, rec.substr(MEMBER_PREFIX.size()));
    return erase_record(rec) || was_admin;
}

size_t Members::size() const {
    return _data.records(MEMBER_PREFIX).size();
}

std::vector<member> Members::all() const {
    std::vector<member> result;
    for (auto& rec : _data.records(MEMBER_PREFIX)) {
        auto& m = result.emplace_back(
                std::string{std::string_view{rec}.substr(MEMBER_PREFIX.size())});
        m.load(_data, rec);
    }
    return result;
}

std::vector<std::string> Members::admins() const {
    return _data.set_elements(ADMINS_SET);
}

bool Members::is_admin(std::string_view session_id) const {
    return _data.set_contains(ADMINS_SET, to_lower(session_id));
}

std::string Members::event_key(std::string_view rec, std::string_view field) const {
    std::string key{"group."};
    key += id;
    key += ".member.";
    if (rec == ADMINS_SET) {
        // For set changes `field` is the element, i.e. the admin's session id
        key += field;
        key += ".admin";
        return key;
    }
    key += rec.substr(MEMBER_PREFIX.size());
    key += '.';
    if (field == "n")
        key += "name";
    else if (field == "p")
        key += "pic_url";
    else if (field == "q")
        key += "pic_key";
    else if (field == "I")
        key += "invite";
    else if (field == "s")
        key += "supplement";
    else if (field == "P")
        key += "promotion";
    else if (field == "R")
        key += "removed";
    else
        key += field;
    return key;
}

}  // namespace swarmsync::config::groups
