#include "local_state.hpp"

#include <algorithm>
#include <set>

#include "swarmsync/util.hpp"

namespace swarmsync {

namespace {

    // Creates or updates a thread, keeping its read state.
    void upsert_thread(Transaction& tx, std::string_view id, ThreadKind kind, int priority) {
        auto existing = tx.thread(id);
        if (existing && existing->kind == kind && existing->priority == priority)
            return;
        auto thread = existing.value_or(ThreadRecord{std::string{id}, kind});
        thread.kind = kind;
        thread.priority = priority;
        tx.upsert_thread(std::move(thread));
    }

    void update_read_state(Transaction& tx, std::string_view id, const config::convo::base& c) {
        auto thread = tx.thread(id);
        if (!thread)
            return;
        auto last_read = std::max(thread->last_read, c.last_read);
        if (last_read == thread->last_read && c.unread == thread->unread)
            return;
        thread->last_read = last_read;
        thread->unread = c.unread;
        tx.upsert_thread(std::move(*thread));
    }

}  // namespace

void apply_contacts(Transaction& tx, const config::Contacts& contacts, std::string_view user_id) {
    std::set<std::string, std::less<>> synced;

    for (auto& c : contacts.all()) {
        // Our own profile lives in UserProfile
        if (c.session_id == user_id)
            continue;
        synced.insert(c.session_id);

        auto existing = tx.contact(c.session_id);
        auto rec = existing.value_or(ContactRecord{c.session_id});
        rec.name = c.name;
        rec.pic_url = c.profile_picture.url;
        rec.pic_key = c.profile_picture.key;
        if (c.approved)
            rec.approved = true;
        if (c.approved_me)
            rec.approved_me = true;
        rec.blocked = c.blocked;
        rec.hidden = c.hidden();
        if (c.created)
            rec.created = c.created;
        if (!existing || *existing != rec)
            tx.upsert_contact(std::move(rec));

        if (c.hidden())
            tx.delete_thread(c.session_id);
        else
            upsert_thread(tx, c.session_id, ThreadKind::contact, c.priority);
    }

    for (auto& rec : tx.contacts()) {
        if (rec.session_id == user_id || synced.count(rec.session_id))
            continue;
        tx.delete_contact(rec.session_id);
        tx.delete_thread(rec.session_id);
    }
}

void apply_convo_info_volatile(Transaction& tx, const config::ConvoInfoVolatile& convos) {
    for (auto& c : convos.all_1to1())
        update_read_state(tx, c.session_id, c);
    for (auto& c : convos.all_communities())
        update_read_state(tx, c.id(), c);
    for (auto& c : convos.all_groups())
        update_read_state(tx, c.id, c);
}

void apply_user_profile(
        Transaction& tx, const config::UserProfile& profile, std::string_view user_id) {
    auto existing = tx.profile(user_id);
    auto rec = existing.value_or(ProfileRecord{std::string{user_id}});
    auto name = profile.get_name().value_or("");
    auto pic = profile.get_profile_pic();
    if (!existing || rec.name != name || rec.pic_url != pic.url || rec.pic_key != pic.key) {
        rec.name = std::move(name);
        rec.pic_url = std::move(pic.url);
        rec.pic_key = std::move(pic.key);
        tx.upsert_profile(std::move(rec));
    }

    upsert_thread(tx, user_id, ThreadKind::note_to_self, profile.get_nts_priority());
}

std::vector<std::string> apply_user_groups(Transaction& tx, const config::UserGroups& groups) {
    std::set<std::string, std::less<>> group_ids, community_ids;

    for (auto& g : groups.groups()) {
        group_ids.insert(g.id);

        auto existing = tx.group(g.id);
        auto rec = existing.value_or(GroupRecord{g.id});
        // The name in the group's own info takes precedence once we have it
        if (rec.name.empty())
            rec.name = g.name;
        rec.invited = g.invited;
        rec.admin = g.is_admin();
        rec.joined_at = g.joined_at;
        if (!existing || existing->name != rec.name || existing->invited != rec.invited ||
            existing->admin != rec.admin || existing->joined_at != rec.joined_at)
            tx.upsert_group(std::move(rec));

        upsert_thread(tx, g.id, ThreadKind::group, g.priority);
    }

    for (auto& c : groups.communities()) {
        auto id = c.id();
        community_ids.insert(id);
        upsert_thread(tx, id, ThreadKind::community, c.priority);
    }

    std::vector<std::string> removed;
    for (auto& rec : tx.groups()) {
        if (group_ids.count(rec.group_id))
            continue;
        tx.delete_group(rec.group_id);
        tx.delete_thread(rec.group_id);
        tx.delete_dumps(rec.group_id);
        removed.push_back(rec.group_id);
    }

    for (auto& thread : tx.threads())
        if (thread.kind == ThreadKind::community && !community_ids.count(thread.id))
            tx.delete_thread(thread.id);

    return removed;
}

void apply_group_info(Transaction& tx, const config::groups::Info& info) {
    auto existing = tx.group(info.id);
    auto rec = existing.value_or(GroupRecord{info.id});
    if (auto name = info.get_name())
        rec.name = *name;
    rec.description = info.get_description().value_or("");
    rec.destroyed = info.is_destroyed();
    if (!existing || existing->name != rec.name || existing->description != rec.description ||
        existing->destroyed != rec.destroyed)
        tx.upsert_group(std::move(rec));
}

void apply_group_members(Transaction& tx, const config::groups::Members& members) {
    std::vector<GroupMemberRecord> records;
    for (auto& m : members.all()) {
        auto& rec = records.emplace_back();
        rec.group_id = members.id;
        rec.session_id = m.session_id;
        rec.name = m.name;
        rec.admin = m.admin;
        rec.invite_pending = m.invite_pending();
        rec.promotion_pending = m.promotion_pending();
        rec.removed = m.is_removed();
    }
    tx.replace_group_members(members.id, std::move(records));
}

}  // namespace swarmsync
