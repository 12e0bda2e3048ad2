#include "swarmsync/storage.hpp"

#include <stdexcept>
#include <utility>

namespace swarmsync {

struct MemoryStorage::Tables {
    std::map<std::pair<config::ConfigVariant, std::string>, ConfigDump> dumps;
    std::map<std::string, ContactRecord, std::less<>> contacts;
    std::map<std::string, ThreadRecord, std::less<>> threads;
    std::map<std::string, GroupRecord, std::less<>> groups;
    std::map<std::string, std::vector<GroupMemberRecord>, std::less<>> members;
    std::map<std::string, ProfileRecord, std::less<>> profiles;
};

namespace {

    template <typename Map>
    auto find_opt(const Map& m, std::string_view key)
            -> std::optional<typename Map::mapped_type> {
        if (auto it = m.find(key); it != m.end())
            return it->second;
        return std::nullopt;
    }

    template <typename Map>
    auto values(const Map& m) {
        std::vector<typename Map::mapped_type> result;
        result.reserve(m.size());
        for (auto& [k, v] : m)
            result.push_back(v);
        return result;
    }

    template <typename Map>
    bool erase_key(Map& m, std::string_view key) {
        auto it = m.find(key);
        if (it == m.end())
            return false;
        m.erase(it);
        return true;
    }

    class MemoryTransaction final : public Transaction {
      public:
        // `tables` is the working copy; `writable` is false for read-only views of the committed
        // tables.
        MemoryTransaction(MemoryStorage::Tables& tables, bool writable) :
                _t{tables}, _writable{writable} {}

        EventList events;
        std::vector<std::function<void()>> hooks;

        std::optional<ConfigDump> dump(
                config::ConfigVariant variant, std::string_view identity) const override {
            if (auto it = _t.dumps.find({variant, std::string{identity}}); it != _t.dumps.end())
                return it->second;
            return std::nullopt;
        }
        std::vector<ConfigDump> dumps() const override { return values(_t.dumps); }
        void upsert_dump(ConfigDump d) override {
            check_writable();
            auto key = std::make_pair(d.variant, d.identity);
            _t.dumps[std::move(key)] = std::move(d);
        }
        void update_dump_timestamp(
                config::ConfigVariant variant,
                std::string_view identity,
                int64_t timestamp_ms) override {
            check_writable();
            if (auto it = _t.dumps.find({variant, std::string{identity}}); it != _t.dumps.end())
                it->second.timestamp_ms = timestamp_ms;
        }
        size_t delete_dumps(std::string_view identity) override {
            check_writable();
            size_t removed = 0;
            for (auto it = _t.dumps.begin(); it != _t.dumps.end();) {
                if (it->first.second == identity) {
                    it = _t.dumps.erase(it);
                    removed++;
                } else {
                    ++it;
                }
            }
            return removed;
        }

        void add_event(ObservedEvent event) override {
            check_writable();
            events.push_back(std::move(event));
        }
        void after_commit(std::function<void()> hook) override {
            check_writable();
            hooks.push_back(std::move(hook));
        }

        std::optional<ContactRecord> contact(std::string_view session_id) const override {
            return find_opt(_t.contacts, session_id);
        }
        std::vector<ContactRecord> contacts() const override { return values(_t.contacts); }
        void upsert_contact(ContactRecord c) override {
            check_writable();
            auto id = c.session_id;
            _t.contacts[std::move(id)] = std::move(c);
        }
        bool delete_contact(std::string_view session_id) override {
            check_writable();
            return erase_key(_t.contacts, session_id);
        }

        std::optional<ThreadRecord> thread(std::string_view id) const override {
            return find_opt(_t.threads, id);
        }
        std::vector<ThreadRecord> threads() const override { return values(_t.threads); }
        void upsert_thread(ThreadRecord th) override {
            check_writable();
            auto id = th.id;
            _t.threads[std::move(id)] = std::move(th);
        }
        bool delete_thread(std::string_view id) override {
            check_writable();
            return erase_key(_t.threads, id);
        }

        std::optional<GroupRecord> group(std::string_view group_id) const override {
            return find_opt(_t.groups, group_id);
        }
        std::vector<GroupRecord> groups() const override { return values(_t.groups); }
        void upsert_group(GroupRecord g) override {
            check_writable();
            auto id = g.group_id;
            _t.groups[std::move(id)] = std::move(g);
        }
        bool delete_group(std::string_view group_id) override {
            check_writable();
            erase_key(_t.members, group_id);
            return erase_key(_t.groups, group_id);
        }

        std::vector<GroupMemberRecord> group_members(std::string_view group_id) const override {
            return find_opt(_t.members, group_id).value_or(std::vector<GroupMemberRecord>{});
        }
        void replace_group_members(
                std::string_view group_id, std::vector<GroupMemberRecord> members) override {
            check_writable();
            if (members.empty())
                erase_key(_t.members, group_id);
            else
                _t.members[std::string{group_id}] = std::move(members);
        }

        std::optional<ProfileRecord> profile(std::string_view session_id) const override {
            return find_opt(_t.profiles, session_id);
        }
        void upsert_profile(ProfileRecord p) override {
            check_writable();
            auto id = p.session_id;
            _t.profiles[std::move(id)] = std::move(p);
        }

      private:
        MemoryStorage::Tables& _t;
        bool _writable;

        void check_writable() const {
            if (!_writable)
                throw std::logic_error{"Cannot write through a read-only storage view"};
        }
    };

}  // namespace

MemoryStorage::MemoryStorage() : _tables{std::make_unique<Tables>()} {}

MemoryStorage::~MemoryStorage() = default;

void MemoryStorage::write(const std::function<void(Transaction&)>& fn) {
    EventList events;
    std::vector<std::function<void()>> hooks;
    std::vector<EventSubscriber> subscribers;
    {
        std::lock_guard lock{_mutex};
        auto working = std::make_unique<Tables>(*_tables);
        MemoryTransaction txn{*working, true};
        fn(txn);  // A throw here leaves `_tables` untouched.

        _tables = std::move(working);
        _commits++;
        events = std::move(txn.events);
        hooks = std::move(txn.hooks);
        _published.insert(_published.end(), events.begin(), events.end());
        subscribers = _subscribers;
    }

    // Subscribers and hooks run outside the lock so that they can start new transactions.
    if (!events.empty())
        for (auto& sub : subscribers)
            sub(events);
    for (auto& hook : hooks)
        hook();
}

void MemoryStorage::read(const std::function<void(const Transaction&)>& fn) const {
    std::lock_guard lock{_mutex};
    MemoryTransaction txn{*_tables, false};
    fn(txn);
}

void MemoryStorage::subscribe(EventSubscriber subscriber) {
    std::lock_guard lock{_mutex};
    _subscribers.push_back(std::move(subscriber));
}

EventList MemoryStorage::published_events() const {
    std::lock_guard lock{_mutex};
    return _published;
}

size_t MemoryStorage::commit_count() const {
    std::lock_guard lock{_mutex};
    return _commits;
}

}  // namespace swarmsync
