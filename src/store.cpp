#include "swarmsync/store.hpp"

#include <oxenc/base64.h>
#include <oxenc/hex.h>
#include <sodium/core.h>
#include <sodium/crypto_sign_ed25519.h>

#include <algorithm>
#include <cstring>
#include <iterator>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "config/internal.hpp"
#include "local_state.hpp"
#include "swarmsync/ed25519.hpp"
#include "swarmsync/sync_job.hpp"
#include "swarmsync/util.hpp"

using namespace std::literals;

namespace swarmsync {

using config::ConfigBase;
using config::ConfigVariant;

namespace {

    bool is_group_identity(std::string_view identity) {
        return starts_with(identity, "03");
    }

    std::string describe(ConfigVariant variant, std::string_view identity) {
        return std::string{config::variant_name(variant)} + " (" + std::string{identity} + ")";
    }

}  // namespace

std::vector<std::string> PendingPushes::obsolete_hashes() const {
    std::vector<std::string> result;
    std::set<std::string_view> seen;
    for (auto& push : pushes)
        for (auto& hash : push.obsolete_hashes)
            if (seen.insert(hash).second)
                result.push_back(hash);
    return result;
}

ConfigStore::ConfigStore(ustring_view ed25519_secretkey, Storage& storage, StoreOptions options) :
        _storage{storage}, _options{std::move(options)} {
    if (sodium_init() == -1)
        throw std::runtime_error{"libsodium initialization failed!"};
    if (ed25519_secretkey.size() != 64)
        throw std::invalid_argument{"Invalid ed25519_secretkey: expected 64 bytes"};

    // Setup the keys
    std::array<unsigned char, 32> user_x_pk;
    std::memcpy(_user_sk.data(), ed25519_secretkey.data(), ed25519_secretkey.size());
    crypto_sign_ed25519_sk_to_pk(_user_pk.data(), _user_sk.data());

    if (0 != crypto_sign_ed25519_pk_to_curve25519(user_x_pk.data(), _user_pk.data()))
        throw std::runtime_error{"Ed25519 pubkey to x25519 pubkey conversion failed"};

    _user_id.reserve(66);
    _user_id += "05";
    oxenc::to_hex(user_x_pk.begin(), user_x_pk.end(), std::back_inserter(_user_id));

    std::vector<ConfigDump> dumps;
    _storage.read([&](const Transaction& tx) { dumps = tx.dumps(); });

    std::stable_sort(dumps.begin(), dumps.end(), [](const auto& a, const auto& b) {
        return config::variant_load_order(a.variant) < config::variant_load_order(b.variant);
    });

    // Group objects are constructed as a unit, so collect their dumps first
    std::map<std::string, std::map<ConfigVariant, ustring_view>> group_dumps;
    for (auto& dump : dumps) {
        if (config::is_group_variant(dump.variant)) {
            group_dumps[dump.identity][dump.variant] = dump.data;
            continue;
        }
        if (dump.identity != _user_id) {
            log(LogLevel::warning,
                "Ignoring " + describe(dump.variant, dump.identity) + " dump of another user");
            continue;
        }
        try {
            init_user_config(dump.variant, dump.data);
        } catch (const config_error& e) {
            log(LogLevel::error,
                "Failed to load " + describe(dump.variant, dump.identity) + " dump: " + e.what());
        }
    }

    // Initialise empty config states for any missing required config types
    for (auto variant : config::USER_VARIANTS)
        if (!_user[variant].config)
            init_user_config(variant, std::nullopt);

    for (auto& [gid, d] : group_dumps) {
        auto get = [&d = d](ConfigVariant v) -> std::optional<ustring_view> {
            if (auto it = d.find(v); it != d.end())
                return it->second;
            return std::nullopt;
        };
        auto sk = group_secret_key(gid);
        try {
            ensure_group(
                    gid,
                    sk ? std::make_optional<ustring_view>(*sk) : std::nullopt,
                    get(ConfigVariant::GroupInfo),
                    get(ConfigVariant::GroupMembers),
                    get(ConfigVariant::GroupKeys));
        } catch (const config_error& e) {
            log(LogLevel::error, "Failed to load config dumps of group " + gid + ": " + e.what());
        }
    }

    // If we have a group in UserGroups that isn't in the 'invited' state but didn't have a dump
    // for it then most likely the group has been approved but we haven't completed the initial
    // poll; create its configs so that polling can merge into them.
    sync_groups_with_user_groups(false);
}

ConfigStore::~ConfigStore() {
    std::lock_guard lock{_sync_mutex};
    if (_scheduler)
        for (auto& [id, task] : _sync_scheduled)
            _scheduler->cancel(task);
}

void ConfigStore::setup_child(ConfigBase& config) {
    config.logger = [this](LogLevel lvl, std::string msg) { log(lvl, std::move(msg)); };
    config.set_compression_enabled(_options.enable_compression);
    config.set_max_merged_hashes(_options.max_merged_hashes);
}

void ConfigStore::init_user_config(ConfigVariant variant, std::optional<ustring_view> dump) {
    ustring_view sk{_user_sk.data(), _user_sk.size()};
    std::unique_ptr<ConfigBase> config;
    switch (variant) {
        case ConfigVariant::UserProfile:
            config = std::make_unique<config::UserProfile>(sk, dump);
            break;
        case ConfigVariant::Contacts: config = std::make_unique<config::Contacts>(sk, dump); break;
        case ConfigVariant::ConvoInfoVolatile:
            config = std::make_unique<config::ConvoInfoVolatile>(sk, dump);
            break;
        case ConfigVariant::UserGroups:
            config = std::make_unique<config::UserGroups>(sk, dump);
            break;
        case ConfigVariant::Local: config = std::make_unique<config::Local>(dump); break;
        default:
            throw std::invalid_argument{
                    "init_user_config: " + std::string{config::variant_name(variant)} +
                    " is not a user config"};
    }
    setup_child(*config);
    _user[variant].config = std::move(config);
}

void ConfigStore::attach_sync(Scheduler& scheduler, SwarmClient& client) {
    std::lock_guard lock{_sync_mutex};
    _scheduler = &scheduler;
    _client = &client;
}

const ConfigStore::UserSlot& ConfigStore::user_slot(ConfigVariant variant) const {
    return _user.at(variant);
}

std::shared_ptr<ConfigStore::GroupSlot> ConfigStore::group_slot(std::string_view group_id) const {
    std::lock_guard lock{_groups_mutex};
    if (auto it = _groups.find(group_id); it != _groups.end())
        return it->second;
    return nullptr;
}

std::shared_ptr<ConfigStore::GroupSlot> ConfigStore::ensure_group(
        std::string_view group_id,
        std::optional<ustring_view> secret_key,
        std::optional<ustring_view> info_dump,
        std::optional<ustring_view> members_dump,
        std::optional<ustring_view> keys_dump) {
    std::lock_guard lock{_groups_mutex};
    if (auto it = _groups.find(group_id); it != _groups.end())
        return it->second;

    auto pk = config::session_id_pk(group_id, "03");
    auto slot = std::make_shared<GroupSlot>();
    slot->configs = std::make_unique<config::groups::GroupConfigs>(
            ustring_view{_user_sk.data(), _user_sk.size()},
            ustring_view{pk.data(), pk.size()},
            secret_key,
            info_dump,
            members_dump,
            keys_dump);
    for (auto variant : config::GROUP_VARIANTS)
        setup_child(slot->configs->get(variant));

    log(LogLevel::debug, "Created configs for group " + std::string{group_id});
    _groups.emplace(group_id, slot);
    return slot;
}

std::optional<ustring> ConfigStore::group_secret_key(std::string_view group_id) const {
    auto& slot = user_slot(ConfigVariant::UserGroups);
    std::lock_guard lock{slot.mutex};
    auto& groups = static_cast<const config::UserGroups&>(*slot.config);
    if (auto g = groups.get_group(group_id); g && g->is_admin())
        return std::move(g->secretkey);
    return std::nullopt;
}

bool ConfigStore::has_config(ConfigVariant variant, std::string_view identity) const {
    if (config::is_group_variant(variant))
        return group_slot(identity) != nullptr;
    return identity == _user_id;
}

void ConfigStore::locked(
        ConfigVariant variant,
        std::string_view identity,
        const std::function<void(ConfigBase&)>& fn) const {
    if (config::is_group_variant(variant)) {
        auto slot = group_slot(identity);
        if (!slot) {
            log(LogLevel::critical,
                "Attempted to access " + describe(variant, identity) + " which is not loaded");
            throw config_not_loaded{"Config " + describe(variant, identity) + " is not loaded"};
        }
        std::lock_guard lock{slot->mutex};
        if (slot->erased) {
            log(LogLevel::warning,
                "Attempted to access " + describe(variant, identity) + " after it was erased");
            throw config_not_loaded{"Config " + describe(variant, identity) + " was erased"};
        }
        fn(slot->configs->get(variant));
        return;
    }

    if (identity != _user_id) {
        log(LogLevel::critical,
            "Attempted to access " + describe(variant, identity) + " which is not loaded");
        throw config_not_loaded{"Config " + describe(variant, identity) + " is not loaded"};
    }
    auto& slot = user_slot(variant);
    std::lock_guard lock{slot.mutex};
    fn(*slot.config);
}

void ConfigStore::with_config(
        ConfigVariant variant,
        std::string_view identity,
        const std::function<void(const ConfigBase&)>& fn) const {
    locked(variant, identity, [&](ConfigBase& config) { fn(config); });
}

void ConfigStore::perform_and_push_change(
        ConfigVariant variant,
        std::string_view identity,
        const std::function<void(ConfigBase&)>& mutate,
        const ChangeOptions& options) {
    std::string id{identity};

    if (config::is_group_variant(variant)) {
        bool granted = options.grant && options.grant->group_id() == id;
        if (!granted && !group_secret_key(id)) {
            log(LogLevel::critical,
                "Unable to change " + describe(variant, id) + ": no admin key loaded");
            throw admin_violation{Error::NO_ADMIN_KEY};
        }
    }

    locked(variant, id, [&](ConfigBase& config) {
        try {
            mutate(config);
        } catch (const std::exception& e) {
            config.discard_events();
            log(LogLevel::warning, "Change of " + describe(variant, id) + " failed: " + e.what());
            throw;
        }

        auto events = config.take_events();
        std::optional<ustring> dump;
        if (config.needs_dump())
            dump = config.make_dump();
        bool sync = !options.skip_automatic_sync && config.needs_push();

        _storage.write([&](Transaction& tx) {
            if (dump)
                tx.upsert_dump({variant, id, *dump, get_timestamp_ms()});
            tx.add_events(events);
            if (sync)
                tx.after_commit([this, id] { schedule_sync(id); });
        });

        if (dump)
            config.confirm_dumped();
    });
}

std::map<ConfigVariant, int64_t> ConfigStore::merge_config_messages(
        std::string_view identity, const std::vector<ConfigMessage>& messages) {
    return merge_messages(identity, messages, false);
}

std::map<ConfigVariant, int64_t> ConfigStore::handle_config_messages(
        std::string_view identity, const std::vector<ConfigMessage>& messages) {
    return merge_messages(identity, messages, true);
}

std::map<ConfigVariant, int64_t> ConfigStore::merge_messages(
        std::string_view identity, const std::vector<ConfigMessage>& messages, bool apply) {
    std::string id{identity};
    bool group = is_group_identity(id);

    std::map<ConfigVariant, std::vector<const ConfigMessage*>> grouped;
    for (auto& m : messages) {
        auto variant = config::variant_for_namespace(m.ns);
        if (!variant || config::is_group_variant(*variant) != group) {
            log(LogLevel::warning,
                "Skipping message " + m.hash + " in namespace " + namespace_name(m.ns) +
                        ": not a config namespace of " + id);
            continue;
        }
        grouped[*variant].push_back(&m);
    }

    // Merge in a fixed order: later variants may refer to things defined by earlier ones
    std::vector<ConfigVariant> order;
    for (auto& [variant, msgs] : grouped)
        order.push_back(variant);
    std::stable_sort(order.begin(), order.end(), [](auto a, auto b) {
        return config::variant_processing_order(a) < config::variant_processing_order(b);
    });

    std::map<ConfigVariant, int64_t> latest;
    bool user_groups_changed = false;

    for (auto variant : order) {
        auto& msgs = grouped[variant];
        std::vector<std::pair<std::string, ustring_view>> batch;
        batch.reserve(msgs.size());
        for (auto* m : msgs)
            batch.emplace_back(m->hash, m->data);

        try {
            locked(variant, id, [&](ConfigBase& config) {
                auto merged = config.merge(batch);
                if (merged.empty())
                    return;

                int64_t timestamp = 0;
                for (auto* m : msgs)
                    if (std::find(merged.begin(), merged.end(), m->hash) != merged.end())
                        timestamp = std::max(timestamp, m->timestamp_ms);

                auto events = config.take_events();
                std::optional<ustring> dump;
                if (config.needs_dump())
                    dump = config.make_dump();
                bool sync = config.needs_push() && !config.is_readonly();

                _storage.write([&](Transaction& tx) {
                    if (apply) {
                        switch (variant) {
                            case ConfigVariant::UserProfile:
                                apply_user_profile(
                                        tx,
                                        static_cast<const config::UserProfile&>(config),
                                        _user_id);
                                break;
                            case ConfigVariant::Contacts:
                                apply_contacts(
                                        tx, static_cast<const config::Contacts&>(config), _user_id);
                                break;
                            case ConfigVariant::ConvoInfoVolatile:
                                apply_convo_info_volatile(
                                        tx, static_cast<const config::ConvoInfoVolatile&>(config));
                                break;
                            case ConfigVariant::UserGroups:
                                for (auto& gid : apply_user_groups(
                                             tx, static_cast<const config::UserGroups&>(config)))
                                    log(LogLevel::info, "Removed group " + gid);
                                break;
                            case ConfigVariant::GroupInfo:
                                apply_group_info(
                                        tx, static_cast<const config::groups::Info&>(config));
                                break;
                            case ConfigVariant::GroupMembers:
                                apply_group_members(
                                        tx, static_cast<const config::groups::Members&>(config));
                                break;
                            default: break;
                        }
                    }
                    if (dump)
                        tx.upsert_dump({variant, id, *dump, timestamp});
                    else
                        tx.update_dump_timestamp(variant, id, timestamp);
                    tx.add_events(events);
                    if (sync && apply)
                        tx.after_commit([this, id] { schedule_sync(id); });
                });

                if (dump)
                    config.confirm_dumped();

                log(LogLevel::debug,
                    "Merged " + std::to_string(merged.size()) + " message(s) into " +
                            describe(variant, id));
                latest[variant] = timestamp;
                if (variant == ConfigVariant::UserGroups)
                    user_groups_changed = true;
            });
        } catch (const contract_violation&) {
            throw;
        } catch (const config_error& e) {
            log(LogLevel::error, "Failed to merge " + describe(variant, id) + ": " + e.what());
        } catch (const std::logic_error& e) {
            log(LogLevel::error, "Failed to merge " + describe(variant, id) + ": " + e.what());
        }
    }

    if (apply && user_groups_changed)
        sync_groups_with_user_groups(true);

    return latest;
}

void ConfigStore::sync_groups_with_user_groups(bool drop_unlisted) {
    std::vector<config::group_info> groups;
    {
        auto& slot = user_slot(ConfigVariant::UserGroups);
        std::lock_guard lock{slot.mutex};
        groups = static_cast<const config::UserGroups&>(*slot.config).groups();
    }

    std::set<std::string, std::less<>> listed;
    for (auto& g : groups) {
        listed.insert(g.id);
        if (g.invited)
            continue;

        std::optional<ustring_view> sk;
        if (g.is_admin())
            sk = g.secretkey;

        try {
            auto slot = ensure_group(g.id, sk);
            if (sk) {
                std::lock_guard lock{slot->mutex};
                if (!slot->configs->admin())
                    slot->configs->load_admin_key(*sk);
            }
        } catch (const std::invalid_argument& e) {
            log(LogLevel::error, "Unable to set up configs of group " + g.id + ": " + e.what());
        }
    }

    if (!drop_unlisted)
        return;

    std::vector<std::shared_ptr<GroupSlot>> freed;
    {
        std::lock_guard lock{_groups_mutex};
        for (auto it = _groups.begin(); it != _groups.end();) {
            if (listed.count(it->first)) {
                ++it;
                continue;
            }
            log(LogLevel::info,
                "Freeing configs of group " + it->first + ": no longer in UserGroups");
            freed.push_back(std::move(it->second));
            it = _groups.erase(it);
        }
    }
    for (auto& slot : freed) {
        std::lock_guard lock{slot->mutex};
        slot->erased = true;
    }
}

std::vector<std::string> ConfigStore::current_hashes(std::string_view identity) const {
    std::vector<std::string> result;
    auto add = [&](const ConfigBase& config) {
        for (auto& h : config.current_hashes())
            result.push_back(std::move(h));
    };

    if (is_group_identity(identity)) {
        auto slot = group_slot(identity);
        if (!slot)
            return result;
        std::lock_guard lock{slot->mutex};
        for (auto variant : config::GROUP_VARIANTS)
            add(slot->configs->get(variant));
    } else {
        for (auto variant : config::USER_VARIANTS)
            if (variant != ConfigVariant::Local)
                with_config(variant, identity, add);
    }
    return result;
}

bool ConfigStore::needs_push(std::string_view identity) const {
    bool needs = false;
    if (is_group_identity(identity)) {
        auto slot = group_slot(identity);
        if (!slot)
            return false;
        std::lock_guard lock{slot->mutex};
        if (!slot->configs->admin())
            return false;
        for (auto variant : config::GROUP_VARIANTS)
            needs = needs || slot->configs->get(variant).needs_push();
    } else {
        for (auto variant : config::USER_VARIANTS)
            with_config(variant, identity, [&](const ConfigBase& c) {
                needs = needs || c.needs_push();
            });
    }
    return needs;
}

PendingPushes ConfigStore::pending_pushes(std::string_view identity) {
    PendingPushes result;
    result.identity = identity;

    auto collect = [&](ConfigBase& config) {
        if (!config.needs_push())
            return;
        log(LogLevel::debug,
            "pending_pushes: generate push for " + describe(config.variant(), identity));
        auto [seqno, data, obsolete] = config.push();
        result.pushes.push_back({config.variant(), seqno, std::move(data), std::move(obsolete)});
    };

    if (is_group_identity(identity)) {
        auto slot = group_slot(identity);
        if (!slot) {
            log(LogLevel::critical,
                "pending_pushes: configs of group " + result.identity + " are not loaded");
            throw config_not_loaded{"Group " + result.identity + " is not loaded"};
        }
        // Only admins push group configs
        if (!group_secret_key(identity))
            return result;
        std::lock_guard lock{slot->mutex};
        if (!slot->configs->admin())
            return result;
        for (auto variant : config::GROUP_VARIANTS)
            collect(slot->configs->get(variant));
    } else {
        for (auto variant : config::USER_VARIANTS)
            if (variant != ConfigVariant::Local)
                locked(variant, identity, collect);
    }

    std::stable_sort(result.pushes.begin(), result.pushes.end(), [](const auto& a, const auto& b) {
        return config::variant_send_order(a.variant) < config::variant_send_order(b.variant);
    });
    return result;
}

PreparedPush ConfigStore::prepare_push(
        const PendingPushes& pending, std::chrono::milliseconds timestamp) const {
    bool is_group = is_group_identity(pending.identity);

    // Prepare for signing
    std::optional<ustring> group_sk;
    ustring_view seckey{_user_sk.data(), _user_sk.size()};
    if (is_group) {
        group_sk = group_secret_key(pending.identity);
        if (!group_sk) {
            log(LogLevel::critical,
                "prepare_push: Only group admins can push config changes of " + pending.identity);
            throw admin_violation{Error::NO_ADMIN_KEY};
        }
        seckey = *group_sk;
    }
    auto user_pk_hex = oxenc::to_hex(_user_pk.begin(), _user_pk.end());

    PreparedPush result;
    auto requests = nlohmann::json::array();

    for (auto& push : pending.pushes) {
        auto ns = config::variant_namespace(push.variant);
        if (!ns)
            throw std::invalid_argument{
                    "prepare_push: " + std::string{config::variant_name(push.variant)} +
                    " is never pushed"};

        // Ed25519 signature of `("store" || namespace || timestamp)`, where namespace and
        // `timestamp` are the base10 expression of the namespace and `timestamp` values
        ustring verification{to_unsigned_sv("store"sv)};
        verification += to_unsigned_sv(verification_string(*ns));
        verification += to_unsigned_sv(std::to_string(timestamp.count()));
        auto sig = ed25519::sign(seckey, verification);

        nlohmann::json params{
                {"namespace", static_cast<int>(*ns)},
                {"pubkey", pending.identity},
                {"ttl", _options.default_ttl.count()},
                {"timestamp", timestamp.count()},
                {"data", oxenc::to_base64(push.data.begin(), push.data.end())},
                {"signature", oxenc::to_base64(sig.begin(), sig.end())},
        };

        // For user config storage we also need to add `pubkey_ed25519`
        if (!is_group)
            params["pubkey_ed25519"] = user_pk_hex;

        requests.push_back({{"method", "store"}, {"params", std::move(params)}});
        result.info.push_back({true, push.variant, push.seqno});
    }

    // Also delete obsolete hashes
    if (auto obsolete = pending.obsolete_hashes(); !obsolete.empty()) {
        // Ed25519 signature of `("delete" || messages...)`
        ustring verification{to_unsigned_sv("delete"sv)};
        for (auto& hash : obsolete)
            verification += to_unsigned_sv(hash);
        auto sig = ed25519::sign(seckey, verification);

        nlohmann::json params{
                {"messages", obsolete},
                {"pubkey", pending.identity},
                {"signature", oxenc::to_base64(sig.begin(), sig.end())},
        };
        if (!is_group)
            params["pubkey_ed25519"] = user_pk_hex;

        requests.push_back({{"method", "delete"}, {"params", std::move(params)}});
        result.info.push_back({false, ConfigVariant::UserProfile, 0});
    }

    nlohmann::json payload{{"method", "sequence"}, {"params", {{"requests", std::move(requests)}}}};
    result.payload = payload.dump();
    return result;
}

std::vector<PushResult> ConfigStore::handle_push_response(
        std::string_view identity,
        const PreparedPush& push,
        const SwarmResponse& response,
        int64_t timestamp_ms) {
    // If the request failed then just error
    if (auto error = extract_error(response.status_code, response.body)) {
        log(error->kind() == RequestErrorKind::clock_out_of_sync ? LogLevel::error
                                                                  : LogLevel::warning,
            "handle_push_response: push for " + std::string{identity} + " failed: " +
                    error->what());
        throw *error;
    }

    nlohmann::json response_json;
    try {
        response_json = nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw request_error{
                RequestErrorKind::invalid_response,
                "handle_push_response: Invalid response - "s + e.what(),
                response.status_code};
    }

    if (!response_json.is_object() || !response_json.contains("results") ||
        !response_json["results"].is_array())
        throw request_error{
                RequestErrorKind::invalid_response,
                "handle_push_response: Invalid response - expected to contain 'results' array",
                response.status_code};
    auto& results = response_json["results"];
    if (results.size() < push.info.size())
        throw request_error{
                RequestErrorKind::invalid_response,
                "handle_push_response: Invalid response - Number of responses smaller than the "
                "number of requests",
                response.status_code};

    std::vector<PushResult> confirmed;
    for (size_t i = 0; i < push.info.size(); ++i) {
        auto& info = push.info[i];
        if (!info.is_config_push)
            continue;

        auto& result = results[i];
        int code = result.is_object() ? result.value("code", 0) : 0;
        if (code < 200 || code > 299 || !result.contains("body") ||
            !result["body"].is_object() || !result["body"].contains("hash")) {
            log(LogLevel::warning,
                "handle_push_response: " + describe(info.variant, identity) +
                        " was not stored (status " + std::to_string(code) + ")");
            continue;
        }

        confirmed.push_back(
                {info.variant,
                 info.seqno,
                 result["body"]["hash"].get<std::string>(),
                 timestamp_ms});
    }

    create_dump_marking_as_pushed(identity, confirmed);
    log(LogLevel::debug, "handle_push_response: Completed");
    return confirmed;
}

void ConfigStore::create_dump_marking_as_pushed(
        std::string_view identity, const std::vector<PushResult>& results) {
    std::string id{identity};
    for (auto& r : results) {
        locked(r.variant, id, [&](ConfigBase& config) {
            config.confirm_pushed(r.seqno, r.hash);
            if (!config.needs_dump())
                return;
            auto dump = config.make_dump();
            _storage.write([&](Transaction& tx) {
                tx.upsert_dump({r.variant, id, std::move(dump), r.timestamp_ms});
            });
            config.confirm_dumped();
        });
    }
}

GroupCreation ConfigStore::create_group(
        std::string_view name,
        std::optional<std::string_view> description,
        const std::vector<config::groups::member>& members) {
    auto [ed_pk, ed_sk] = ed25519::ed25519_key_pair();
    auto group_id = "03" + oxenc::to_hex(ed_pk.begin(), ed_pk.end());
    ustring secret_key{ed_sk.data(), ed_sk.size()};
    sodium_zero_buffer(ed_sk.data(), ed_sk.size());

    // Sanity check to avoid group collision
    if (group_slot(group_id))
        throw std::runtime_error{"create_group: Tried to create group matching an existing group"};
    ensure_group(group_id, ustring_view{secret_key});

    GroupCreationGrant grant{group_id};
    ChangeOptions creating{true, &grant};

    std::string user_name;
    config::profile_pic user_pic;
    read<config::UserProfile>(_user_id, [&](const config::UserProfile& profile) {
        user_name = profile.get_name().value_or("");
        user_pic = profile.get_profile_pic();
    });
    auto now = get_timestamp_ms();

    change<config::groups::Info>(
            group_id,
            [&](config::groups::Info& info) {
                info.set_name(name);
                info.set_created(now / 1000);
                if (description)
                    info.set_description(*description);
            },
            creating);

    change<config::groups::Members>(
            group_id,
            [&](config::groups::Members& m) {
                // Insert the current user as a group admin
                config::groups::member admin{_user_id};
                admin.admin = true;
                admin.name = user_name;
                admin.profile_picture = user_pic;
                m.set(admin);

                // Add other members (ignore the current user if they happen to be included)
                for (auto& member : members)
                    if (member.session_id != _user_id)
                        m.set(member);
            },
            creating);

    // Issue the keys to everyone now that the members are in; Info and Members get re-encrypted
    // with them
    change<config::groups::Keys>(
            group_id, [](config::groups::Keys& keys) { keys.rekey(); }, creating);

    change<config::UserGroups>(_user_id, [&](config::UserGroups& groups) {
        auto g = groups.get_or_construct_group(group_id);
        g.name = std::string{name};
        g.joined_at = now / 1000;
        g.secretkey = secret_key;
        groups.set(g);
    });

    // Local records of the new group; config locks are never taken inside a storage write
    std::vector<GroupMemberRecord> member_records;
    read<config::groups::Members>(group_id, [&](const config::groups::Members& m) {
        for (auto& member : m.all()) {
            auto& rec = member_records.emplace_back();
            rec.group_id = group_id;
            rec.session_id = member.session_id;
            rec.name = member.name;
            rec.admin = member.admin;
            rec.invite_pending = member.invite_pending();
        }
    });
    _storage.write([&](Transaction& tx) {
        GroupRecord rec{group_id};
        rec.name = std::string{name};
        rec.description = std::string{description.value_or(""sv)};
        rec.admin = true;
        rec.joined_at = now / 1000;
        tx.upsert_group(std::move(rec));
        tx.upsert_thread({group_id, ThreadKind::group});
        tx.replace_group_members(group_id, std::move(member_records));
    });

    log(LogLevel::info, "Created group " + group_id);
    schedule_sync(group_id);

    return GroupCreation{group_id, std::move(secret_key), grant};
}

void ConfigStore::load_group_admin_key(std::string_view group_id, ustring_view secret) {
    if (secret.size() == 64)
        secret.remove_suffix(32);
    else if (secret.size() != 32)
        throw std::invalid_argument{
                "Failed to load admin key: invalid secret key (expected 32 or 64 bytes)"};

    std::array<unsigned char, 32> pk;
    sodium_cleared<std::array<unsigned char, 64>> sk;
    crypto_sign_ed25519_seed_keypair(pk.data(), sk.data(), secret.data());

    auto slot = group_slot(group_id);
    if (!slot) {
        log(LogLevel::critical,
            "load_group_admin_key: configs of group " + std::string{group_id} + " are not loaded");
        throw config_not_loaded{"Group " + std::string{group_id} + " is not loaded"};
    }

    // Load the secret key into the group's configs; throws if it belongs to another group
    {
        std::lock_guard lock{slot->mutex};
        slot->configs->load_admin_key(to_sv(sk));
    }

    // Register the admin key in UserGroups (which makes the group changeable by us)
    change<config::UserGroups>(_user_id, [&](config::UserGroups& groups) {
        auto g = groups.get_or_construct_group(group_id);
        g.secretkey = {sk.data(), sk.size()};
        groups.set(g);
    });

    // Update the group member record to flag the current user as an admin
    change<config::groups::Members>(group_id, [&](config::groups::Members& members) {
        auto member = members.get_or_construct(_user_id);
        member.admin = true;
        member.invite_status = 0;
        member.promotion_status = 0;
        members.set(member);
    });
}

void ConfigStore::approve_group(std::string_view group_id) {
    config::check_session_id(group_id, "03");

    // Update the UserGroups config to have the group marked as approved
    change<config::UserGroups>(_user_id, [&](config::UserGroups& groups) {
        auto g = groups.get_or_construct_group(group_id);
        g.invited = false;
        groups.set(g);
    });

    // If we don't already have GroupConfigs then create them
    auto sk = group_secret_key(group_id);
    ensure_group(group_id, sk ? std::make_optional<ustring_view>(*sk) : std::nullopt);
}

void ConfigStore::erase_group(std::string_view group_id, bool remove_user_record) {
    std::shared_ptr<GroupSlot> slot;
    {
        std::lock_guard lock{_groups_mutex};
        if (auto it = _groups.find(group_id); it != _groups.end()) {
            slot = std::move(it->second);
            _groups.erase(it);
        }
    }

    auto delete_dumps = [&] {
        _storage.write([&](Transaction& tx) { tx.delete_dumps(group_id); });
    };
    if (slot) {
        // Holding the slot lock orders the deletion after the write of a change in progress
        std::lock_guard lock{slot->mutex};
        slot->erased = true;
        delete_dumps();
    } else {
        delete_dumps();
    }

    // If we don't want to remove the user record then stop here
    if (!remove_user_record)
        return;

    change<config::UserGroups>(_user_id, [&](config::UserGroups& groups) {
        groups.erase_group(group_id);
    });
}

std::vector<std::string> ConfigStore::group_ids() const {
    std::lock_guard lock{_groups_mutex};
    std::vector<std::string> ids;
    ids.reserve(_groups.size());
    for (auto& [id, slot] : _groups)
        ids.push_back(id);
    return ids;
}

bool ConfigStore::is_group_admin(std::string_view group_id) const {
    if (!group_secret_key(group_id))
        return false;
    auto slot = group_slot(group_id);
    if (!slot)
        return false;
    std::lock_guard lock{slot->mutex};
    return slot->configs->admin();
}

void ConfigStore::schedule_sync(std::string_view identity, int64_t delay_ms, int attempt) {
    std::lock_guard lock{_sync_mutex};
    if (!_scheduler || !_client)
        return;
    if (_sync_scheduled.count(identity))
        return;

    std::string id{identity};
    auto task = _scheduler->schedule(std::chrono::milliseconds{delay_ms}, [this, id, attempt] {
        ConfigSyncJob job{*this, *_client, id};
        if (job.run() || attempt + 1 >= ConfigSyncJob::MAX_ATTEMPTS)
            return;
        auto delay = std::chrono::milliseconds{ConfigSyncJob::RETRY_BASE} * (1 << attempt);
        log(LogLevel::info,
            "Retrying config sync of " + id + " in " + std::to_string(delay.count()) + "ms");
        schedule_sync(id, delay.count(), attempt + 1);
    });
    _sync_scheduled.emplace(std::move(id), task);
}

void ConfigStore::sync_started(std::string_view identity) {
    std::lock_guard lock{_sync_mutex};
    if (auto it = _sync_scheduled.find(identity); it != _sync_scheduled.end())
        _sync_scheduled.erase(it);
}

}  // namespace swarmsync
