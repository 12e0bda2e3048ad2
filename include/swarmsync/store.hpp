#pragma once

#include <array>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "config/base.hpp"
#include "config/contacts.hpp"
#include "config/convo_info_volatile.hpp"
#include "config/groups/group_configs.hpp"
#include "config/local.hpp"
#include "config/user_groups.hpp"
#include "config/user_profile.hpp"
#include "config/variant.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "namespaces.hpp"
#include "network.hpp"
#include "scheduler.hpp"
#include "storage.hpp"
#include "types.hpp"

namespace swarmsync {

struct StoreOptions {
    // Compress pushed config messages with zstd.
    bool enable_compression = true;

    // TTL of stored config messages.
    std::chrono::milliseconds default_ttl = std::chrono::hours{30 * 24};

    // Number of merged message hashes each config object remembers for dedup.
    size_t max_merged_hashes = 1000;
};

/// Capability handed out by `ConfigStore::create_group`: changes made with it bypass the group
/// admin check for that one group while the group is not yet registered as ours.
class GroupCreationGrant {
  public:
    const std::string& group_id() const { return _group_id; }

  private:
    friend class ConfigStore;
    explicit GroupCreationGrant(std::string group_id) : _group_id{std::move(group_id)} {}

    std::string _group_id;
};

struct GroupCreation {
    std::string group_id;
    ustring secret_key;
    GroupCreationGrant grant;
};

struct ChangeOptions {
    // Don't schedule a sync job for this change; the caller pushes (or batches) it itself.
    bool skip_automatic_sync = false;

    // Bypasses the group admin check for the grant's group.
    const GroupCreationGrant* grant = nullptr;
};

/// A config message received from a swarm.
struct ConfigMessage {
    Namespace ns;
    std::string hash;
    ustring data;
    int64_t timestamp_ms = 0;
};

/// The data of one config push.
struct PushData {
    config::ConfigVariant variant;
    config::seqno_t seqno = 0;
    ustring data;
    std::vector<std::string> obsolete_hashes;
};

/// Everything an identity needs pushed, in send order.
struct PendingPushes {
    std::string identity;
    std::vector<PushData> pushes;

    bool empty() const { return pushes.empty(); }

    /// Obsolete hashes of all the pushes, deduplicated.
    std::vector<std::string> obsolete_hashes() const;
};

/// A push request ready to be sent, plus what is needed to handle its response.
struct PreparedPush {
    struct Info {
        bool is_config_push;
        config::ConfigVariant variant;
        config::seqno_t seqno;
    };

    std::string payload;
    std::vector<Info> info;
};

/// A confirmed push.
struct PushResult {
    config::ConfigVariant variant;
    config::seqno_t seqno = 0;
    std::string hash;
    int64_t timestamp_ms = 0;
};

/// Owns the live config objects of the user (one per user variant) and of each group the user
/// belongs to (an Info/Members/Keys triple), and is the only way to reach them.
///
/// Each user variant and each group triple has its own mutex: all access to a config object
/// happens under its lock, so changes and merges of one object are serialized while different
/// objects proceed concurrently.  No lock of the store is held while network calls are made.
///
/// Every change and merge is persisted through the Storage collaborator: the new dump, the
/// changes to local entities and the resulting events are written in one transaction, so the
/// events are published if and only if the change is committed.
class ConfigStore {
  public:
    /// API: store/ConfigStore::ConfigStore
    ///
    /// Constructs the store for the user with the given Ed25519 secret key, loading the config
    /// dumps found in `storage` (in load order) and creating empty objects for any user variant
    /// without a dump and for every approved group listed in UserGroups.
    ///
    /// Throws std::invalid_argument if the key is not a 64-byte Ed25519 secret key.
    ConfigStore(ustring_view ed25519_secretkey, Storage& storage, StoreOptions options = {});

    ~ConfigStore();

    ConfigStore(const ConfigStore&) = delete;
    ConfigStore& operator=(const ConfigStore&) = delete;
    ConfigStore(ConfigStore&&) = delete;
    ConfigStore& operator=(ConfigStore&&) = delete;

    // If set then we log things by calling this callback; config objects owned by the store log
    // through it too.
    Logger logger;

    // Invokes the `logger` callback if set, does nothing if there is no logger.
    void log(LogLevel lvl, std::string msg) const {
        if (logger)
            logger(lvl, std::move(msg));
    }

    /// The user's session id ("05" + hex X25519 pubkey).
    const std::string& user_id() const { return _user_id; }

    const std::array<unsigned char, 32>& user_ed25519_pubkey() const { return _user_pk; }

    /// API: store/ConfigStore::attach_sync
    ///
    /// Enables background sync jobs: after a change or a merge that leaves something to push, a
    /// `ConfigSyncJob` is scheduled on `scheduler` to push it through `client`.  Both must outlive
    /// the store.
    void attach_sync(Scheduler& scheduler, SwarmClient& client);

    /// True if the config object exists (user variants always exist; group variants exist for
    /// groups we have configs for).
    bool has_config(config::ConfigVariant variant, std::string_view identity) const;

    /// API: store/ConfigStore::with_config
    ///
    /// Calls `fn` with the config object under its lock.  Throws `config_not_loaded` (logged at
    /// critical level) if there is no such object.
    void with_config(
            config::ConfigVariant variant,
            std::string_view identity,
            const std::function<void(const config::ConfigBase&)>& fn) const;

    /// Typed read access: `store.read<config::Contacts>(store.user_id(), [](auto& c) { ... })`.
    template <typename Config, typename F>
    auto read(std::string_view identity, F&& fn) const {
        using R = std::invoke_result_t<F, const Config&>;
        if constexpr (std::is_void_v<R>) {
            with_config(variant_of<Config>(), identity, [&](const config::ConfigBase& c) {
                fn(static_cast<const Config&>(c));
            });
        } else {
            std::optional<R> result;
            with_config(variant_of<Config>(), identity, [&](const config::ConfigBase& c) {
                result.emplace(fn(static_cast<const Config&>(c)));
            });
            return std::move(*result);
        }
    }

    /// API: store/ConfigStore::perform_and_push_change
    ///
    /// The only way to modify a config object.  Under the object's lock:
    /// - checks that we may modify it: changing a group config requires the group admin key to be
    ///   registered for the group in UserGroups, or a creation grant for the group; otherwise an
    ///   `admin_violation` is logged at critical level and thrown;
    /// - calls `mutate` with the object;
    /// - collects the events the change produced;
    /// - persists the new dump (if the object needs one) and the events in one transaction;
    /// - schedules a sync job once committed (unless `skip_automatic_sync`).
    ///
    /// If `mutate` or the storage write throws, the events are discarded and the exception is
    /// rethrown.
    void perform_and_push_change(
            config::ConfigVariant variant,
            std::string_view identity,
            const std::function<void(config::ConfigBase&)>& mutate,
            const ChangeOptions& options = {});

    /// Typed change: `store.change<config::Contacts>(store.user_id(), [](auto& c) { ... })`.
    template <typename Config, typename F>
    void change(std::string_view identity, F&& fn, const ChangeOptions& options = {}) {
        perform_and_push_change(
                variant_of<Config>(),
                identity,
                [&](config::ConfigBase& c) { fn(static_cast<Config&>(c)); },
                options);
    }

    /// API: store/ConfigStore::merge_config_messages
    ///
    /// Merges config messages received from `identity`'s swarm, grouped per variant and merged in
    /// processing order, and persists the merged dumps and their events.  Messages of
    /// non-config namespaces are logged and skipped; a failure merging one variant is logged and
    /// only skips that variant.  Local entities are not touched.
    ///
    /// Outputs:
    /// - the timestamp of the newest merged message, per variant that merged anything.
    std::map<config::ConfigVariant, int64_t> merge_config_messages(
            std::string_view identity, const std::vector<ConfigMessage>& messages);

    /// API: store/ConfigStore::handle_config_messages
    ///
    /// Like `merge_config_messages`, but also applies what changed to the local entities
    /// (contacts, threads, groups, group members, profile) in the same transaction as the dump and
    /// events, creates configs for newly joined groups, and schedules a sync job if anything still
    /// needs pushing.
    std::map<config::ConfigVariant, int64_t> handle_config_messages(
            std::string_view identity, const std::vector<ConfigMessage>& messages);

    /// The current config message hashes of an identity (to extend their expiry while polling).
    std::vector<std::string> current_hashes(std::string_view identity) const;

    /// True if any config of the identity needs pushing.
    bool needs_push(std::string_view identity) const;

    /// API: store/ConfigStore::pending_pushes
    ///
    /// Collects the push data of every config of the identity that needs a push, in send order.
    /// Configs of a group we are not admin of are never pushed (the result is empty).  Pushed
    /// configs move to the waiting state until `create_dump_marking_as_pushed` confirms them.
    PendingPushes pending_pushes(std::string_view identity);

    /// API: store/ConfigStore::prepare_push
    ///
    /// Builds the signed `sequence` request storing each push (and deleting the obsolete hashes)
    /// in the identity's swarm.
    PreparedPush prepare_push(
            const PendingPushes& pending, std::chrono::milliseconds timestamp) const;

    /// API: store/ConfigStore::handle_push_response
    ///
    /// Parses the response to a prepared push.  Throws `request_error` if the request failed
    /// (see `extract_error`); otherwise confirms each stored config via
    /// `create_dump_marking_as_pushed` and returns the confirmed pushes.
    std::vector<PushResult> handle_push_response(
            std::string_view identity,
            const PreparedPush& push,
            const SwarmResponse& response,
            int64_t timestamp_ms);

    /// API: store/ConfigStore::create_dump_marking_as_pushed
    ///
    /// Confirms pushes (advancing the objects to the clean state) and persists a dump of each
    /// object that needs one.
    void create_dump_marking_as_pushed(
            std::string_view identity, const std::vector<PushResult>& results);

    /// API: store/ConfigStore::create_group
    ///
    /// Creates a new group: generates its keypair, sets up its Info (name, description, creation
    /// time) and Members (us as admin, plus `members`) and its first key generation, then
    /// registers the group, with its admin key, in UserGroups.
    GroupCreation create_group(
            std::string_view name,
            std::optional<std::string_view> description,
            const std::vector<config::groups::member>& members);

    /// API: store/ConfigStore::load_group_admin_key
    ///
    /// Loads the admin key (64-byte secret key or 32-byte seed) of a group we are a member of,
    /// flags us as admin in its Members and stores the key in UserGroups.  Throws
    /// std::invalid_argument if the key does not belong to the group.
    void load_group_admin_key(std::string_view group_id, ustring_view secret);

    /// API: store/ConfigStore::approve_group
    ///
    /// Accepts a group invitation: clears its invited flag in UserGroups and creates its configs.
    void approve_group(std::string_view group_id);

    /// API: store/ConfigStore::erase_group
    ///
    /// Frees the group's configs (all three together) and deletes their dumps; removes the group
    /// from UserGroups too if `remove_user_record` is set.  Waits for a change or merge of the
    /// group that is in progress; any later access throws config_not_loaded.
    void erase_group(std::string_view group_id, bool remove_user_record = true);

    /// Ids of the groups we have configs for.
    std::vector<std::string> group_ids() const;

    /// True if the admin key of the group is registered in UserGroups and loaded in its configs.
    bool is_group_admin(std::string_view group_id) const;

    /// Schedules a sync job for the identity, if sync is attached; does nothing if one is already
    /// scheduled.
    void schedule_sync(std::string_view identity) { schedule_sync(identity, 0, 0); }

    /// Maps a config class to its variant.
    template <typename Config>
    static constexpr config::ConfigVariant variant_of();

  private:
    struct UserSlot {
        mutable std::mutex mutex;
        std::unique_ptr<config::ConfigBase> config;
    };

    struct GroupSlot {
        mutable std::mutex mutex;
        std::unique_ptr<config::groups::GroupConfigs> configs;
        // Set under `mutex` once the group is erased or freed; callers that fetched the slot
        // before that must not touch it or write its dumps.
        bool erased = false;
    };

    Storage& _storage;
    StoreOptions _options;

    std::array<unsigned char, 32> _user_pk;
    sodium_cleared<std::array<unsigned char, 64>> _user_sk;
    std::string _user_id;

    std::map<config::ConfigVariant, UserSlot> _user;

    mutable std::mutex _groups_mutex;
    std::map<std::string, std::shared_ptr<GroupSlot>, std::less<>> _groups;

    Scheduler* _scheduler = nullptr;
    SwarmClient* _client = nullptr;
    std::mutex _sync_mutex;
    std::map<std::string, Scheduler::task_id, std::less<>> _sync_scheduled;

    friend class ConfigSyncJob;
    void sync_started(std::string_view identity);
    void schedule_sync(std::string_view identity, int64_t delay_ms, int attempt);

    void setup_child(config::ConfigBase& config);
    void init_user_config(config::ConfigVariant variant, std::optional<ustring_view> dump);
    std::shared_ptr<GroupSlot> group_slot(std::string_view group_id) const;
    std::shared_ptr<GroupSlot> ensure_group(
            std::string_view group_id,
            std::optional<ustring_view> secret_key,
            std::optional<ustring_view> info_dump = std::nullopt,
            std::optional<ustring_view> members_dump = std::nullopt,
            std::optional<ustring_view> keys_dump = std::nullopt);
    const UserSlot& user_slot(config::ConfigVariant variant) const;

    // The admin key of a group as registered in UserGroups, if any.
    std::optional<ustring> group_secret_key(std::string_view group_id) const;

    // Calls `fn` with the config object locked; throws config_not_loaded if missing.
    void locked(
            config::ConfigVariant variant,
            std::string_view identity,
            const std::function<void(config::ConfigBase&)>& fn) const;

    std::map<config::ConfigVariant, int64_t> merge_messages(
            std::string_view identity,
            const std::vector<ConfigMessage>& messages,
            bool apply_to_local_state);

    // Creates configs for approved groups in UserGroups that we don't have configs for, loads
    // newly registered admin keys, and (if `drop_unlisted`) frees the configs of groups no longer
    // listed.
    void sync_groups_with_user_groups(bool drop_unlisted);
};

template <typename Config>
constexpr config::ConfigVariant ConfigStore::variant_of() {
    using config::ConfigVariant;
    if constexpr (std::is_same_v<Config, config::UserProfile>)
        return ConfigVariant::UserProfile;
    else if constexpr (std::is_same_v<Config, config::Contacts>)
        return ConfigVariant::Contacts;
    else if constexpr (std::is_same_v<Config, config::ConvoInfoVolatile>)
        return ConfigVariant::ConvoInfoVolatile;
    else if constexpr (std::is_same_v<Config, config::UserGroups>)
        return ConfigVariant::UserGroups;
    else if constexpr (std::is_same_v<Config, config::Local>)
        return ConfigVariant::Local;
    else if constexpr (std::is_same_v<Config, config::groups::Info>)
        return ConfigVariant::GroupInfo;
    else if constexpr (std::is_same_v<Config, config::groups::Members>)
        return ConfigVariant::GroupMembers;
    else {
        static_assert(std::is_same_v<Config, config::groups::Keys>, "not a config type");
        return ConfigVariant::GroupKeys;
    }
}

}  // namespace swarmsync
