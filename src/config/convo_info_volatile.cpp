#include "swarmsync/config/convo_info_volatile.hpp"

#include "internal.hpp"

namespace swarmsync::config {

namespace {

    constexpr auto ONE_TO_ONE_PREFIX = "1/"sv;
    constexpr auto COMMUNITY_PREFIX = "o/"sv;
    constexpr auto GROUP_PREFIX = "g/"sv;

    std::string one_to_one_record(std::string_view session_id) {
        check_session_id(session_id);
        std::string rec{ONE_TO_ONE_PREFIX};
        rec += session_id;
        make_lc(rec);
        return rec;
    }

    std::string community_record(const config::community& c) {
        std::string rec{COMMUNITY_PREFIX};
        rec += c.id();
        return rec;
    }

    std::string group_record(std::string_view group_id) {
        check_session_id(group_id, "03");
        std::string rec{GROUP_PREFIX};
        rec += group_id;
        make_lc(rec);
        return rec;
    }

    int64_t now_minus(std::chrono::milliseconds age) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                       (std::chrono::system_clock::now() - age).time_since_epoch())
                .count();
    }

}  // namespace

namespace convo {

    one_to_one::one_to_one(std::string_view sid) : session_id{sid} {
        check_session_id(session_id);
        make_lc(session_id);
    }

    group::group(std::string_view gid) : id{gid} {
        check_session_id(id, "03");
        make_lc(id);
    }

    void base::load(const ConfigData& data, std::string_view rec) {
        last_read = data.get_int(rec, "r").value_or(0);
        unread = data.get_int(rec, "u").value_or(0);
    }

}  // namespace convo

ConvoInfoVolatile::ConvoInfoVolatile(
        ustring_view ed25519_secretkey, std::optional<ustring_view> dumped) :
        ConfigBase{dumped} {
    load_key(ed25519_secretkey);
}

std::optional<convo::one_to_one> ConvoInfoVolatile::get_1to1(std::string_view pubkey_hex) const {
    auto rec = one_to_one_record(pubkey_hex);
    if (!_data.has_record(rec))
        return std::nullopt;

    auto result = std::make_optional<convo::one_to_one>(pubkey_hex);
    result->load(_data, rec);
    return result;
}

convo::one_to_one ConvoInfoVolatile::get_or_construct_1to1(std::string_view pubkey_hex) const {
    if (auto maybe = get_1to1(pubkey_hex))
        return *std::move(maybe);

    return convo::one_to_one{pubkey_hex};
}

std::optional<convo::community> ConvoInfoVolatile::get_community(
        std::string_view base_url, std::string_view room) const {
    convo::community og{base_url, room};
    auto rec = community_record(og);
    if (!_data.has_record(rec))
        return std::nullopt;

    og.load(_data, rec);
    return og;
}

convo::community ConvoInfoVolatile::get_or_construct_community(
        std::string_view base_url, std::string_view room) const {
    if (auto maybe = get_community(base_url, room))
        return *std::move(maybe);

    return convo::community{base_url, room};
}

std::optional<convo::group> ConvoInfoVolatile::get_group(std::string_view group_id) const {
    auto rec = group_record(group_id);
    if (!_data.has_record(rec))
        return std::nullopt;

    auto result = std::make_optional<convo::group>(group_id);
    result->load(_data, rec);
    return result;
}

convo::group ConvoInfoVolatile::get_or_construct_group(std::string_view group_id) const {
    if (auto maybe = get_group(group_id))
        return *std::move(maybe);

    return convo::group{group_id};
}

void ConvoInfoVolatile::set(const convo::one_to_one& c) {
    set_base(c, one_to_one_record(c.session_id));
}

void ConvoInfoVolatile::set(const convo::community& c) {
    set_base(c, community_record(c));
}

void ConvoInfoVolatile::set(const convo::group& c) {
    set_base(c, group_record(c.id));
}

void ConvoInfoVolatile::set(const convo::any& c) {
    std::visit([this](const auto& convo) { set(convo); }, c);
}

void ConvoInfoVolatile::set_base(const convo::base& c, std::string_view rec) {
    auto current = _data.get_int(rec, "r");

    // If we're making the last_read value *older* for some reason then ignore the prune cutoff
    // (because we might be intentionally resetting the value after a deletion, for instance).
    if (current && c.last_read < *current)
        set_field(rec, "r", c.last_read);
    else if (c.last_read > now_minus(PRUNE_LOW))
        set_field(rec, "r", c.last_read);

    set_flag(rec, "u", c.unread);
}

size_t ConvoInfoVolatile::prune_stale(std::chrono::milliseconds prune) {
    const int64_t cutoff = now_minus(prune);

    std::vector<std::string> stale;
    for (auto& rec : _data.records()) {
        if (_data.get_int(rec, "u").value_or(0))
            continue;
        if (_data.get_int(rec, "r").value_or(0) < cutoff)
            stale.push_back(rec);
    }
    for (auto& rec : stale)
        erase_record(rec);

    return stale.size();
}

std::tuple<seqno_t, ustring, std::vector<std::string>> ConvoInfoVolatile::push() {
    // Prune off any conversations with last_read timestamps more than PRUNE_HIGH ago (unless they
    // also have a `unread` flag set, in which case we keep them indefinitely).
    if (!is_readonly())
        prune_stale();

    return ConfigBase::push();
}

bool ConvoInfoVolatile::erase_1to1(std::string_view session_id) {
    return erase_record(one_to_one_record(session_id));
}

bool ConvoInfoVolatile::erase_community(std::string_view base_url, std::string_view room) {
    return erase_record(community_record(config::community{base_url, room}));
}

bool ConvoInfoVolatile::erase_group(std::string_view group_id) {
    return erase_record(group_record(group_id));
}

bool ConvoInfoVolatile::erase(const convo::any& c) {
    struct eraser {
        ConvoInfoVolatile& conf;
        bool operator()(const convo::one_to_one& c) { return conf.erase_1to1(c.session_id); }
        bool operator()(const convo::community& c) {
            return conf.erase_community(c.base_url(), c.room());
        }
        bool operator()(const convo::group& c) { return conf.erase_group(c.id); }
    };
    return std::visit(eraser{*this}, c);
}

size_t ConvoInfoVolatile::size_1to1() const {
    return _data.records(ONE_TO_ONE_PREFIX).size();
}

size_t ConvoInfoVolatile::size_communities() const {
    return _data.records(COMMUNITY_PREFIX).size();
}

size_t ConvoInfoVolatile::size_groups() const {
    return _data.records(GROUP_PREFIX).size();
}

size_t ConvoInfoVolatile::size() const {
    return size_1to1() + size_communities() + size_groups();
}

std::vector<convo::one_to_one> ConvoInfoVolatile::all_1to1() const {
    std::vector<convo::one_to_one> result;
    for (auto& rec : _data.records(ONE_TO_ONE_PREFIX)) {
        auto& c = result.emplace_back(std::string_view{rec}.substr(ONE_TO_ONE_PREFIX.size()));
        c.load(_data, rec);
    }
    return result;
}

std::vector<convo::community> ConvoInfoVolatile::all_communities() const {
    std::vector<convo::community> result;
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

std::vector<convo::group> ConvoInfoVolatile::all_groups() const {
    std::vector<convo::group> result;
    for (auto& rec : _data.records(GROUP_PREFIX)) {
        auto& c = result.emplace_back(std::string_view{rec}.substr(GROUP_PREFIX.size()));
        c.load(_data, rec);
    }
    return result;
}

std::string ConvoInfoVolatile::event_key(std::string_view rec, std::string_view field) const {
    std::string key{"convo."};
    key += rec.substr(2);
    key += '.';
    if (field == "r")
        key += "last_read";
    else if (field == "u")
        key += "unread";
    else
        key += field;
    return key;
}

}  // namespace swarmsync::config
