#pragma once

#include <memory>
#include <optional>
#include <string>

#include "info.hpp"
#include "keys.hpp"
#include "members.hpp"

namespace swarmsync::config::groups {

/// Owner of the three config objects of one group.  Keys holds references to Info and Members
/// (it installs its keys into them), so the three are constructed together and destroyed
/// together; none of them is ever owned or freed individually.
class GroupConfigs {
  public:
    /// API: groups/GroupConfigs::GroupConfigs
    ///
    /// Constructs the Info, Members and Keys objects of a group, each from its dump if given.
    ///
    /// Inputs:
    /// - `user_ed25519_secretkey` -- the local user's 64-byte Ed25519 secret key.
    /// - `group_ed25519_pubkey` -- the 32-byte group pubkey (i.e. the group id without the 03).
    /// - `group_ed25519_secretkey` -- the group admin key, if we are an admin.
    /// - `info_dump`, `members_dump`, `keys_dump` -- dumps previously produced by the objects, or
    ///   nullopt to start empty.
    GroupConfigs(
            ustring_view user_ed25519_secretkey,
            ustring_view group_ed25519_pubkey,
            std::optional<ustring_view> group_ed25519_secretkey,
            std::optional<ustring_view> info_dump = std::nullopt,
            std::optional<ustring_view> members_dump = std::nullopt,
            std::optional<ustring_view> keys_dump = std::nullopt);

    GroupConfigs(const GroupConfigs&) = delete;
    GroupConfigs& operator=(const GroupConfigs&) = delete;
    GroupConfigs(GroupConfigs&&) = delete;
    GroupConfigs& operator=(GroupConfigs&&) = delete;

    const std::string& id() const { return _info->id; }

    bool admin() const { return _keys->admin(); }

    Info& info() { return *_info; }
    const Info& info() const { return *_info; }
    Members& members() { return *_members; }
    const Members& members() const { return *_members; }
    Keys& keys() { return *_keys; }
    const Keys& keys() const { return *_keys; }

    /// API: groups/GroupConfigs::get
    ///
    /// Returns the config object of the given group variant; throws std::invalid_argument for a
    /// non-group variant.
    ConfigBase& get(ConfigVariant variant);
    const ConfigBase& get(ConfigVariant variant) const;

    /// Loads the admin key into all three objects (see `Keys::load_admin_key`).
    void load_admin_key(ustring_view secret) { _keys->load_admin_key(secret); }

  private:
    // Declaration order matters: `_keys` refers to the other two and so must be destroyed first.
    std::unique_ptr<Info> _info;
    std::unique_ptr<Members> _members;
    std::unique_ptr<Keys> _keys;
};

}  // namespace swarmsync::config::groups
