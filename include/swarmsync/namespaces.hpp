#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace swarmsync {

enum class Namespace : std::int16_t {
    // Regular one-to-one messages (and sync messages sent to our own swarm)
    Default = 0,

    UserProfile = 2,
    Contacts = 3,
    ConvoInfoVolatile = 4,
    UserGroups = 5,

    // Messages sent to a closed group:
    GroupMessages = 11,
    // Groups config namespaces (i.e. for shared config of the group itself, not one user's group
    // settings)
    GroupKeys = 12,
    GroupInfo = 13,
    GroupMembers = 14,

    // Messages sent to a legacy closed group; these are stored without any authentication
    LegacyClosedGroup = -10,

    // Messages sent to an updated group which should be able to be retrieved by revoked members are
    // stored in this namespace
    RevokedRetrievableGroupMessages = -11,
};

inline std::string namespace_name(Namespace n) {
    switch (n) {
        case Namespace::Default: return "DEFAULT";
        case Namespace::UserProfile: return "USER_PROFILE";
        case Namespace::Contacts: return "CONTACTS";
        case Namespace::ConvoInfoVolatile: return "CONVO_INFO_VOLATILE";
        case Namespace::UserGroups: return "USER_GROUPS";

        case Namespace::GroupMessages: return "GROUP_MESSAGES";
        case Namespace::GroupKeys: return "GROUP_KEYS";
        case Namespace::GroupInfo: return "GROUP_INFO";
        case Namespace::GroupMembers: return "GROUP_MEMBERS";

        case Namespace::LegacyClosedGroup: return "LEGACY_CLOSED_GROUP";
        case Namespace::RevokedRetrievableGroupMessages:
            return "REVOKED_RETRIEVABLE_GROUP_MESSAGES";
    }
    return "UNKNOWN(" + std::to_string(static_cast<int>(n)) + ")";
}

/// Legacy closed groups predate swarm authentication; everything else needs a signed request.
inline bool requires_read_auth(Namespace n) {
    return n != Namespace::LegacyClosedGroup;
}
inline bool requires_write_auth(Namespace n) {
    return n != Namespace::LegacyClosedGroup;
}

/// Namespaces holding regular messages are checked against previously seen hashes; config
/// namespaces are not since merging the same config twice is already a no-op.
inline bool should_dedupe(Namespace n) {
    switch (n) {
        case Namespace::Default:
        case Namespace::LegacyClosedGroup:
        case Namespace::GroupMessages:
        case Namespace::RevokedRetrievableGroupMessages: return true;
        default: return false;
    }
}

inline bool is_config_namespace(Namespace n) {
    switch (n) {
        case Namespace::UserProfile:
        case Namespace::Contacts:
        case Namespace::ConvoInfoVolatile:
        case Namespace::UserGroups:
        case Namespace::GroupKeys:
        case Namespace::GroupInfo:
        case Namespace::GroupMembers: return true;
        default: return false;
    }
}

/// True for the namespaces of a user's own swarm (as opposed to a group's swarm).
inline bool is_user_namespace(Namespace n) {
    switch (n) {
        case Namespace::Default:
        case Namespace::UserProfile:
        case Namespace::Contacts:
        case Namespace::ConvoInfoVolatile:
        case Namespace::UserGroups: return true;
        default: return false;
    }
}

/// Returns a number indicating the order that messages from the specified namespace should be
/// merged in (lower numbers should be merged first).  By merging in a specific order we prevent
/// edge-cases where data in one config depends on another: `ConvoInfoVolatile` data could
/// reference a conversation whose `Contacts`/`UserGroups` entry hasn't been processed yet, or a
/// `GroupInfo` could be encrypted with a key included in the `GroupKeys` of the same poll.
inline int processing_order(Namespace n) {
    switch (n) {
        case Namespace::UserProfile:
        case Namespace::Contacts:
        case Namespace::GroupKeys: return 0;
        case Namespace::UserGroups:
        case Namespace::GroupInfo:
        case Namespace::GroupMembers: return 1;
        case Namespace::ConvoInfoVolatile: return 2;
        default: return 3;
    }
}

/// Returns a number indicating the order that config dumps should be loaded in: `GroupKeys` needs
/// the `GroupInfo` and `GroupMembers` configs to exist when it is constructed.
inline int load_order(Namespace n) {
    if (n == Namespace::GroupInfo || n == Namespace::GroupMembers)
        return 1;
    if (n == Namespace::GroupKeys)
        return 2;
    return 0;
}

/// Returns a number indicating the order that config messages should be sent in: `GroupKeys` goes
/// first since `GroupInfo` and `GroupMembers` get encrypted with the latest key.
inline int send_order(Namespace n) {
    if (n == Namespace::GroupKeys)
        return 0;
    return 1;
}

/// Keys messages must be merged before anything else in the same poll can be decrypted, so they
/// are handled inline rather than through a deferred job.
inline bool handle_synchronously(Namespace n) {
    return n == Namespace::GroupKeys;
}

/// Relative share of the response size budget when several namespaces are polled in one request.
inline int64_t size_priority(Namespace n) {
    switch (n) {
        case Namespace::Default:
        case Namespace::LegacyClosedGroup:
        case Namespace::GroupMessages: return 10;
        default: return 1;
    }
}

/// Splits the response size budget across `namespaces`.  Higher priority namespaces are assigned
/// first; each value is stored as a negative divisor of the total budget (i.e. -4 means "a quarter
/// of the maximum response size"), which is how the storage servers expect it.
std::map<Namespace, int64_t> max_size_map(const std::vector<Namespace>& namespaces);

/// The namespace as it appears inside signed retrieve/store requests: empty for the default
/// namespace, the decimal value otherwise.
inline std::string verification_string(Namespace n) {
    if (n == Namespace::Default)
        return "";
    return std::to_string(static_cast<int>(n));
}

}  // namespace swarmsync
