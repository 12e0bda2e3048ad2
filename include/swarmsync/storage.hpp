#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "config/variant.hpp"
#include "events.hpp"
#include "types.hpp"

namespace swarmsync {

/// A serialized config object: the durable recovery format of the config engine.
struct ConfigDump {
    config::ConfigVariant variant;
    std::string identity;
    ustring data;
    int64_t timestamp_ms = 0;
};

/// A contact as known locally.  `nickname` is local-only: syncing contacts never changes it.
struct ContactRecord {
    std::string session_id;
    std::string name;
    std::string nickname;
    std::string pic_url;
    ustring pic_key;
    bool approved = false;
    bool approved_me = false;
    bool blocked = false;
    bool hidden = false;
    int64_t created = 0;

    bool operator==(const ContactRecord& o) const {
        return std::tie(
                       session_id,
                       name,
                       nickname,
                       pic_url,
                       pic_key,
                       approved,
                       approved_me,
                       blocked,
                       hidden,
                       created) ==
               std::tie(
                       o.session_id,
                       o.name,
                       o.nickname,
                       o.pic_url,
                       o.pic_key,
                       o.approved,
                       o.approved_me,
                       o.blocked,
                       o.hidden,
                       o.created);
    }
    bool operator!=(const ContactRecord& o) const { return !(*this == o); }
};

enum class ThreadKind { contact, note_to_self, group, community };

/// A conversation thread shown in the conversation list.
struct ThreadRecord {
    std::string id;
    ThreadKind kind = ThreadKind::contact;
    int priority = 0;
    int64_t last_read = 0;
    bool unread = false;
};

/// A group the user belongs to (or has been invited to).
struct GroupRecord {
    std::string group_id;
    std::string name;
    std::string description;
    bool invited = false;
    bool admin = false;
    bool destroyed = false;
    int64_t joined_at = 0;
};

struct GroupMemberRecord {
    std::string group_id;
    std::string session_id;
    std::string name;
    bool admin = false;
    bool invite_pending = false;
    bool promotion_pending = false;
    bool removed = false;
};

/// The user's own profile.
struct ProfileRecord {
    std::string session_id;
    std::string name;
    std::string pic_url;
    ustring pic_key;
};

/// A storage transaction.  Everything written through a transaction becomes visible (and its
/// events get published, and its `after_commit` hooks run) only once the transaction commits; if
/// the function running the transaction throws, nothing is committed.
class Transaction {
  public:
    virtual ~Transaction() = default;

    // Config dumps
    virtual std::optional<ConfigDump> dump(
            config::ConfigVariant variant, std::string_view identity) const = 0;
    virtual std::vector<ConfigDump> dumps() const = 0;
    virtual void upsert_dump(ConfigDump dump) = 0;
    /// Updates the timestamp of an existing dump; does nothing if there is no such dump.
    virtual void update_dump_timestamp(
            config::ConfigVariant variant, std::string_view identity, int64_t timestamp_ms) = 0;
    /// Removes every dump of an identity; returns the number removed.
    virtual size_t delete_dumps(std::string_view identity) = 0;

    // Event outbox
    virtual void add_event(ObservedEvent event) = 0;
    void add_events(EventList events) {
        for (auto& e : events)
            add_event(std::move(e));
    }

    /// Registers a function to be called after the transaction has been committed.
    virtual void after_commit(std::function<void()> hook) = 0;

    // Local entities
    virtual std::optional<ContactRecord> contact(std::string_view session_id) const = 0;
    virtual std::vector<ContactRecord> contacts() const = 0;
    virtual void upsert_contact(ContactRecord contact) = 0;
    virtual bool delete_contact(std::string_view session_id) = 0;

    virtual std::optional<ThreadRecord> thread(std::string_view id) const = 0;
    virtual std::vector<ThreadRecord> threads() const = 0;
    virtual void upsert_thread(ThreadRecord thread) = 0;
    virtual bool delete_thread(std::string_view id) = 0;

    virtual std::optional<GroupRecord> group(std::string_view group_id) const = 0;
    virtual std::vector<GroupRecord> groups() const = 0;
    virtual void upsert_group(GroupRecord group) = 0;
    virtual bool delete_group(std::string_view group_id) = 0;

    virtual std::vector<GroupMemberRecord> group_members(std::string_view group_id) const = 0;
    virtual void replace_group_members(
            std::string_view group_id, std::vector<GroupMemberRecord> members) = 0;

    virtual std::optional<ProfileRecord> profile(std::string_view session_id) const = 0;
    virtual void upsert_profile(ProfileRecord profile) = 0;
};

/// Persistence collaborator.
class Storage {
  public:
    using EventSubscriber = std::function<void(const EventList& events)>;

    virtual ~Storage() = default;

    /// Runs `fn` in a write transaction, committing if it returns and rolling back if it throws
    /// (the exception propagates).  Writes are serialized.
    virtual void write(const std::function<void(Transaction&)>& fn) = 0;

    /// Runs `fn` against a read-only view of the committed state.
    virtual void read(const std::function<void(const Transaction&)>& fn) const = 0;

    /// Registers a subscriber that receives the events of each committed transaction.
    virtual void subscribe(EventSubscriber subscriber) = 0;
};

/// In-memory Storage: each write works on a copy of the committed tables, which replaces the
/// committed tables only if the write function returns normally.
class MemoryStorage : public Storage {
  public:
    MemoryStorage();
    ~MemoryStorage() override;

    void write(const std::function<void(Transaction&)>& fn) override;
    void read(const std::function<void(const Transaction&)>& fn) const override;
    void subscribe(EventSubscriber subscriber) override;

    /// Every event published so far, in commit order.
    EventList published_events() const;

    /// Number of committed write transactions.
    size_t commit_count() const;

    struct Tables;

  private:
    mutable std::mutex _mutex;
    std::unique_ptr<Tables> _tables;
    std::vector<EventSubscriber> _subscribers;
    EventList _published;
    size_t _commits = 0;
};

}  // namespace swarmsync
