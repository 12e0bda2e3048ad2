#include "swarmsync/config/variant.hpp"

using namespace std::literals;

namespace swarmsync::config {

std::string_view variant_name(ConfigVariant v) {
    switch (v) {
        case ConfigVariant::UserProfile: return "userProfile"sv;
        case ConfigVariant::Contacts: return "contacts"sv;
        case ConfigVariant::ConvoInfoVolatile: return "convoInfoVolatile"sv;
        case ConfigVariant::UserGroups: return "userGroups"sv;
        case ConfigVariant::GroupInfo: return "groupInfo"sv;
        case ConfigVariant::GroupMembers: return "groupMembers"sv;
        case ConfigVariant::GroupKeys: return "groupKeys"sv;
        case ConfigVariant::Local: return "local"sv;
    }
    return "invalid"sv;
}

std::optional<ConfigVariant> variant_from_name(std::string_view name) {
    for (auto v :
         {ConfigVariant::UserProfile,
          ConfigVariant::Contacts,
          ConfigVariant::ConvoInfoVolatile,
          ConfigVariant::UserGroups,
          ConfigVariant::GroupInfo,
          ConfigVariant::GroupMembers,
          ConfigVariant::GroupKeys,
          ConfigVariant::Local})
        if (variant_name(v) == name)
            return v;
    return std::nullopt;
}

std::optional<Namespace> variant_namespace(ConfigVariant v) {
    switch (v) {
        case ConfigVariant::UserProfile: return Namespace::UserProfile;
        case ConfigVariant::Contacts: return Namespace::Contacts;
        case ConfigVariant::ConvoInfoVolatile: return Namespace::ConvoInfoVolatile;
        case ConfigVariant::UserGroups: return Namespace::UserGroups;
        case ConfigVariant::GroupInfo: return Namespace::GroupInfo;
        case ConfigVariant::GroupMembers: return Namespace::GroupMembers;
        case ConfigVariant::GroupKeys: return Namespace::GroupKeys;
        case ConfigVariant::Local: return std::nullopt;
    }
    return std::nullopt;
}

std::optional<ConfigVariant> variant_for_namespace(Namespace n) {
    switch (n) {
        case Namespace::UserProfile: return ConfigVariant::UserProfile;
        case Namespace::Contacts: return ConfigVariant::Contacts;
        case Namespace::ConvoInfoVolatile: return ConfigVariant::ConvoInfoVolatile;
        case Namespace::UserGroups: return ConfigVariant::UserGroups;
        case Namespace::GroupInfo: return ConfigVariant::GroupInfo;
        case Namespace::GroupMembers: return ConfigVariant::GroupMembers;
        case Namespace::GroupKeys: return ConfigVariant::GroupKeys;
        default: return std::nullopt;
    }
}

}  // namespace swarmsync::config
