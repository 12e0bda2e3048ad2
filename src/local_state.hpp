#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "swarmsync/config/contacts.hpp"
#include "swarmsync/config/convo_info_volatile.hpp"
#include "swarmsync/config/groups/info.hpp"
#include "swarmsync/config/groups/members.hpp"
#include "swarmsync/config/user_groups.hpp"
#include "swarmsync/config/user_profile.hpp"
#include "swarmsync/storage.hpp"

namespace swarmsync {

// Brings the local contacts and one-to-one threads in line with the Contacts config.  Names and
// pictures follow the config, approvals are only ever granted (never revoked) and nicknames are
// never touched.  A hidden contact loses its thread; contacts missing from the config are removed
// together with their thread, while threads without a contact record (drafts) are kept.
void apply_contacts(Transaction& tx, const config::Contacts& contacts, std::string_view user_id);

// Updates read state of threads that exist locally; entries for unknown threads are dropped.
void apply_convo_info_volatile(Transaction& tx, const config::ConvoInfoVolatile& convos);

void apply_user_profile(
        Transaction& tx, const config::UserProfile& profile, std::string_view user_id);

// Syncs local group and community records/threads with UserGroups.  Returns the ids of the groups
// that were removed locally (their dumps are deleted in `tx` too).
std::vector<std::string> apply_user_groups(Transaction& tx, const config::UserGroups& groups);

void apply_group_info(Transaction& tx, const config::groups::Info& info);

void apply_group_members(Transaction& tx, const config::groups::Members& members);

}  // namespace swarmsync
