#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "base.hpp"
#include "community.hpp"

namespace swarmsync::config {

/// The user's groups and community rooms.
///
/// Group records, "g/<group_id>":
///
///     K - the 32-byte seed of the group's Ed25519 secret key; written empty by non-admins
///     s - member authentication data; only without a seed
///     n - group name as given by the invite; the group's own Info takes over once joined
///     + - priority: absent for unpinned, -1 for hidden, >0 for pinned
///     i - 1 while the invite is pending, removed on joining
///     j - joined at, unix seconds; absent when 0
///
/// Community records, "o/<base_url>/<room>" (canonical):
///
///     k - server pubkey (32 bytes)
///     n - room name with its original capitalization
///     +, j - as for groups
///
/// Event keys: "groups.<group_id>.<field>" for name, priority, invited and joined_at, and
/// "communities.<base_url>/<room>.<field>" for pubkey, name, priority and joined_at.  Keys and
/// auth data never appear in events.

struct base_group_info {
    static constexpr size_t NAME_MAX_LENGTH = 100;

    int priority = 0;       // 0 unpinned, negative hidden, positive pinned (higher first)
    int64_t joined_at = 0;  // unix seconds of the latest join

  protected:
    void load(const ConfigData& data, std::string_view rec);
};

struct group_info : base_group_info {
    std::string id;  // "03" + hex Ed25519 group pubkey

    std::string name;

    /// Full 64-byte group secret key; admins only.
    ustring secretkey;

    /// What regular members authenticate with; empty for admins.
    ustring auth_data;

    bool invited = false;

    explicit group_info(std::string gid);

    bool is_admin() const { return secretkey.size() == 64; }

  private:
    friend class UserGroups;

    void load(const ConfigData& data, std::string_view rec);
};

/// A joined community room.  Changing the url, room or pubkey and calling `set` adds another room;
/// it never renames the existing one.
struct community_info : base_group_info, community {
    using community::community;

    std::string display_name;

  private:
    void load(const ConfigData& data, std::string_view rec);

    friend class UserGroups;
};

using any_group_info = std::variant<group_info, community_info>;

class UserGroups : public ConfigBase {

  public:
    UserGroups() = delete;

    UserGroups(ustring_view ed25519_secretkey, std::optional<ustring_view> dumped);

    ConfigVariant variant() const override { return ConfigVariant::UserGroups; }

    const char* encryption_domain() const override { return "UserGroups"; }

    /// API: user_groups/UserGroups::get_community
    ///
    /// Case-insensitive lookup by url and room.
    std::optional<community_info> get_community(
            std::string_view base_url, std::string_view room) const;

    std::optional<group_info> get_group(std::string_view pubkey_hex) const;

    // Unknown rooms and groups come back blank; nothing is stored until `set`.
    community_info get_or_construct_community(
            std::string_view base_url,
            std::string_view room,
            std::string_view pubkey_encoded) const;
    community_info get_or_construct_community(
            std::string_view base_url, std::string_view room, ustring_view pubkey) const;

    group_info get_or_construct_group(std::string_view pubkey_hex) const;

    /// API: user_groups/UserGroups::create_group
    ///
    /// A group_info for a new random Ed25519 keypair, not yet stored.
    group_info create_group() const;

    /// API: user_groups/UserGroups::set
    ///
    /// Inserts or replaces a group or room.
    void set(const community_info& info);
    void set(const group_info& info);
    void set(const any_group_info& info);

    // false when there was nothing to erase
    bool erase_community(std::string_view base_url, std::string_view room);
    bool erase_group(std::string_view pubkey_hex);

    bool erase(const any_group_info& info);

    size_t size() const;
    size_t size_communities() const;
    size_t size_groups() const;

    bool empty() const { return size() == 0; }

    std::vector<group_info> groups() const;
    std::vector<community_info> communities() const;

  protected:
    std::string event_key(std::string_view rec, std::string_view field) const override;
};

}  // namespace swarmsync::config
