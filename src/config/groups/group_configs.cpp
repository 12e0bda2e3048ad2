#include "swarmsync/config/groups/group_configs.hpp"

#include <stdexcept>

namespace swarmsync::config::groups {

GroupConfigs::GroupConfigs(
        ustring_view user_ed25519_secretkey,
        ustring_view group_ed25519_pubkey,
        std::optional<ustring_view> group_ed25519_secretkey,
        std::optional<ustring_view> info_dump,
        std::optional<ustring_view> members_dump,
        std::optional<ustring_view> keys_dump) {
    if (group_ed25519_pubkey.size() != 32)
        throw std::invalid_argument{"Invalid group pubkey: expected 32 bytes"};

    _info = std::make_unique<Info>(group_ed25519_pubkey, group_ed25519_secretkey, info_dump);
    _members =
            std::make_unique<Members>(group_ed25519_pubkey, group_ed25519_secretkey, members_dump);
    _keys = std::make_unique<Keys>(
            user_ed25519_secretkey,
            group_ed25519_pubkey,
            group_ed25519_secretkey,
            keys_dump,
            *_info,
            *_members);
}

ConfigBase& GroupConfigs::get(ConfigVariant variant) {
    switch (variant) {
        case ConfigVariant::GroupInfo: return *_info;
        case ConfigVariant::GroupMembers: return *_members;
        case ConfigVariant::GroupKeys: return *_keys;
        default:
            throw std::invalid_argument{
                    "Invalid group config variant " + std::string{variant_name(variant)}};
    }
}

const ConfigBase& GroupConfigs::get(ConfigVariant variant) const {
    return const_cast<GroupConfigs&>(*this).get(variant);
}

}  // namespace swarmsync::config::groups
