#include "swarmsync/config/user_groups.hpp"

#include <oxenc/hex.h>
#include <sodium/crypto_sign.h>

#include <array>
#include <iterator>

#include "internal.hpp"

using namespace std::literals;

namespace swarmsync::config {

namespace {

    constexpr auto GROUP_PREFIX = "g/"sv;
    constexpr auto COMMUNITY_PREFIX = "o/"sv;

    std::string group_record(std::string_view group_id) {
        check_session_id(group_id, "03");
        std::string rec{GROUP_PREFIX};
        rec += group_id;
        make_lc(rec);
        return rec;
    }

    std::string community_record(const community& c) {
        std::string rec{COMMUNITY_PREFIX};
        rec += c.id();
        return rec;
    }

}  // namespace

void base_group_info::load(const ConfigData& data, std::string_view rec) {
    priority = static_cast<int>(data.get_int(rec, "+").value_or(0));
    joined_at = std::max<int64_t>(0, data.get_int(rec, "j").value_or(0));
}

group_info::group_info(std::string gid) : id{std::move(gid)} {
    check_session_id(id, "03");
    make_lc(id);
}

void group_info::load(const ConfigData& data, std::string_view rec) {
    base_group_info::load(data, rec);

    name = data.get_string(rec, "n").value_or("");
    invited = data.get_int(rec, "i").value_or(0);

    if (auto seed = data.get_string(rec, "K"); seed && seed->size() == 32) {
        std::array<unsigned char, 33> pk;
        pk[0] = 0x03;
        secretkey.resize(64);
        crypto_sign_seed_keypair(pk.data() + 1, secretkey.data(), to_unsigned(seed->data()));
        if (id != oxenc::to_hex(pk.begin(), pk.end()))
            secretkey.clear();
    }
    if (auto auth = data.get_string(rec, "s"); auth && !auth->empty())
        auth_data = to_unsigned_sv(*auth);
}

void community_info::load(const ConfigData& data, std::string_view rec) {
    base_group_info::load(data, rec);

    if (auto pk = data.get_string(rec, "k"); pk && pk->size() == 32)
        set_pubkey(to_unsigned_sv(*pk));
    display_name = data.get_string(rec, "n").value_or(room());
}

UserGroups::UserGroups(ustring_view ed25519_secretkey, std::optional<ustring_view> dumped) :
        ConfigBase{dumped} {
    load_key(ed25519_secretkey);
}

std::optional<community_info> UserGroups::get_community(
        std::string_view base_url, std::string_view room) const {
    community_info og{base_url, room};
    auto rec = community_record(og);
    if (!_data.has_record(rec))
        return std::nullopt;

    og.load(_data, rec);
    return og;
}

community_info UserGroups::get_or_construct_community(
        std::string_view base_url, std::string_view room, std::string_view pubkey_encoded) const {
    return get_or_construct_community(base_url, room, decode_pubkey(pubkey_encoded));
}

community_info UserGroups::get_or_construct_community(
        std::string_view base_url, std::string_view room, ustring_view pubkey) const {
    if (auto maybe = get_community(base_url, room)) {
        maybe->set_pubkey(pubkey);
        return *std::move(maybe);
    }

    community_info result{base_url, room, pubkey};
    result.display_name = std::string{room};
    return result;
}

std::optional<group_info> UserGroups::get_group(std::string_view pubkey_hex) const {
    auto rec = group_record(pubkey_hex);
    if (!_data.has_record(rec))
        return std::nullopt;

    auto result = std::make_optional<group_info>(std::string{pubkey_hex});
    result->load(_data, rec);
    return result;
}

group_info UserGroups::get_or_construct_group(std::string_view pubkey_hex) const {
    if (auto maybe = get_group(pubkey_hex))
        return *std::move(maybe);

    return group_info{std::string{pubkey_hex}};
}

group_info UserGroups::create_group() const {
    std::array<unsigned char, 32> pk;
    ustring sk;
    sk.resize(64);
    crypto_sign_keypair(pk.data(), sk.data());
    std::string pk_hex;
    pk_hex.reserve(66);
    pk_hex += "03";
    oxenc::to_hex(pk.begin(), pk.end(), std::back_inserter(pk_hex));

    group_info gr{std::move(pk_hex)};
    gr.secretkey = std::move(sk);
    return gr;
}

void UserGroups::set(const community_info& c) {
    auto rec = community_record(c);
    if (c.pubkey().size() != 32)
        throw std::invalid_argument{"Invalid community: a 32-byte server pubkey is required"};
    set_field(rec, "k", std::string{from_unsigned_sv(c.pubkey())});
    set_nonempty_str(rec, "n", c.display_name);
    set_nonzero_int(rec, "+", c.priority);
    set_positive_int(rec, "j", c.joined_at);
}

void UserGroups::set(const group_info& g) {
    auto rec = group_record(g.id);
    auto pk_bytes = session_id_pk(g.id, "03");

    set_nonempty_str(rec, "n", g.name.substr(0, base_group_info::NAME_MAX_LENGTH));
    set_nonzero_int(rec, "+", g.priority);
    set_positive_int(rec, "j", g.joined_at);
    set_flag(rec, "i", g.invited);

    if (g.secretkey.size() == 64 &&
        // Make sure the secretkey's embedded pubkey matches the group id:
        ustring_view{g.secretkey.data() + 32, 32} == ustring_view{pk_bytes.data(), 32}) {
        set_field(rec, "K", std::string{from_unsigned_sv(ustring_view{g.secretkey.data(), 32})});
        set_field(rec, "s", std::nullopt);
    } else {
        set_field(rec, "K", ""s);
        set_nonempty_str(rec, "s", from_unsigned_sv(g.auth_data));
    }
}

void UserGroups::set(const any_group_info& info) {
    std::visit([this](const auto& g) { set(g); }, info);
}

bool UserGroups::erase_community(std::string_view base_url, std::string_view room) {
    return erase_record(community_record(community{base_url, room}));
}

bool UserGroups::erase_group(std::string_view id) {
    return erase_record(group_record(id));
}

bool UserGroups::erase(const any_group_info& info) {
    struct eraser {
        UserGroups& conf;
        bool operator()(const group_info& g) { return conf.erase_group(g.id); }
        bool operator()(const community_info& c) {
            return conf.erase_community(c.base_url(), c.room());
        }
    };
    return std::visit(eraser{*this}, info);
}

size_t UserGroups::size_communities() const {
    return _data.records(COMMUNITY_PREFIX).size();
}

size_t UserGroups::size_groups() const {
    return _data.records(GROUP_PREFIX).size();
}

size_t UserGroups::size() const {
    return size_communities() + size_groups();
}

std::vector<group_info> UserGroups::groups() const {
    std::vector<group_info> result;
    for (auto& rec : _data.records(GROUP_PREFIX)) {
        auto& g = result.emplace_back(
                std::string{std::string_view{rec}.substr(GROUP_PREFIX.size())});
        g.load(_data, rec);
    }
    return result;
}

std::vector<community_info> UserGroups::communities() const {
    std::vector<community_info> result;
    for (auto& rec : _data.records(COMMUNITY_PREFIX)) {
        auto id = std::string_view{rec}.substr(COMMUNITY_PREFIX.size());
        auto slash = id.rfind('/');
        if (slash == std::string_view::npos)
            continue;
        auto& c = result.emplace_back(id.substr(0, slash), id.substr(slash + 1));
        c.load(_data, rec);
    }
    return result;
}

std::string UserGroups::event_key(std::string_view rec, std::string_view field) const {
    bool is_group = starts_with(rec, GROUP_PREFIX);
    if (is_group && (field == "K" || field == "s"))
        return "";

    std::string key{is_group ? "groups." : "communities."};
    key += rec.substr(2);
    key += '.';
    if (field == "n")
        key += "name";
    else if (field == "+")
        key += "priority";
    else if (field == "i")
        key += "invited";
    else if (field == "j")
        key += "joined_at";
    else if (field == "k")
        key += "pubkey";
    else
        key += field;
    return key;
}

}  // namespace swarmsync::config
