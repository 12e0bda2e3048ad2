#pragma once

#include <optional>
#include <string_view>

#include "../namespaces.hpp"

namespace swarmsync::config {

/// The kinds of config object.  Every variant except `Local` is stored in (exactly) one swarm
/// namespace.
enum class ConfigVariant {
    UserProfile,
    Contacts,
    ConvoInfoVolatile,
    UserGroups,
    GroupInfo,
    GroupMembers,
    GroupKeys,
    Local,
};

inline constexpr ConfigVariant USER_VARIANTS[] = {
        ConfigVariant::UserProfile,
        ConfigVariant::Contacts,
        ConfigVariant::ConvoInfoVolatile,
        ConfigVariant::UserGroups,
        ConfigVariant::Local};

inline constexpr ConfigVariant GROUP_VARIANTS[] = {
        ConfigVariant::GroupInfo, ConfigVariant::GroupMembers, ConfigVariant::GroupKeys};

std::string_view variant_name(ConfigVariant v);

/// Inverse of `variant_name`; nullopt for an unknown name.
std::optional<ConfigVariant> variant_from_name(std::string_view name);

/// The swarm namespace a variant is stored in; nullopt for `Local`, which is never pushed.
std::optional<Namespace> variant_namespace(ConfigVariant v);

/// The variant stored in a namespace; nullopt for non-config namespaces.
std::optional<ConfigVariant> variant_for_namespace(Namespace n);

inline bool is_group_variant(ConfigVariant v) {
    return v == ConfigVariant::GroupInfo || v == ConfigVariant::GroupMembers ||
           v == ConfigVariant::GroupKeys;
}

/// Dump loading order (see `swarmsync::load_order`); `Local` loads with the user configs.
inline int variant_load_order(ConfigVariant v) {
    auto ns = variant_namespace(v);
    return ns ? load_order(*ns) : 0;
}

/// Merge order (see `swarmsync::processing_order`); `Local` is never merged and sorts last.
inline int variant_processing_order(ConfigVariant v) {
    auto ns = variant_namespace(v);
    return ns ? processing_order(*ns) : 4;
}

inline int variant_send_order(ConfigVariant v) {
    auto ns = variant_namespace(v);
    return ns ? send_order(*ns) : 1;
}

}  // namespace swarmsync::config
