#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "base.hpp"
#include "profile_pic.hpp"

namespace swarmsync::config {

using namespace std::literals;

/// The profile is a single unnamed record "" with fields:
///
/// n - display name
/// p - picture url
/// q - picture key (32 bytes)
/// + - Note to Self priority; absent when 0, -1 when hidden
/// e - Note to Self disappearing timer in seconds; absent when 0
/// M - blinded message requests: 1 enabled, 0 disabled, absent when never chosen
///
/// Event keys: profile.name, profile.pic_url, profile.pic_key, profile.nts_priority,
/// profile.nts_expiry and profile.blinded_msgreqs.
class UserProfile final : public ConfigBase {

  public:
    static constexpr size_t MAX_NAME_LENGTH = 100;

    UserProfile() = delete;

    /// API: user_profile/UserProfile::UserProfile
    ///
    /// Inputs:
    /// - `ed25519_secretkey` -- the user's Ed25519 secret key or its 32-byte seed
    /// - `dumped` -- a previous `dump()`, or nullopt to start with an empty profile
    UserProfile(ustring_view ed25519_secretkey, std::optional<ustring_view> dumped);

    ConfigVariant variant() const override { return ConfigVariant::UserProfile; }

    const char* encryption_domain() const override { return "UserProfile"; }

    std::optional<std::string> get_name() const;

    /// API: user_profile/UserProfile::set_name
    ///
    /// An empty name clears the field.  Throws std::invalid_argument past MAX_NAME_LENGTH bytes.
    void set_name(std::string_view new_name);

    /// As `set_name`, cutting an over-long name at the last whole UTF-8 character that fits.
    void set_name_truncated(std::string new_name);

    /// Picture url and key; false-y when either is missing.
    profile_pic get_profile_pic() const;

    /// API: user_profile/UserProfile::set_profile_pic
    ///
    /// Replaces the picture.  An empty url or key removes both.
    void set_profile_pic(std::string_view url, ustring_view key);
    void set_profile_pic(profile_pic pic);

    /// Hidden (< 0) sorts below unpinned (0), which sorts below pinned (> 0).
    int get_nts_priority() const;
    void set_nts_priority(int priority);

    std::optional<std::chrono::seconds> get_nts_expiry() const;

    /// A zero timer turns Note to Self disappearing messages off.
    void set_nts_expiry(std::chrono::seconds timer = 0s);

    /// API: user_profile/UserProfile::get_blinded_msgreqs
    ///
    /// Whether message requests from blinded community ids are accepted.  nullopt means the user
    /// never chose, and the client default applies.
    std::optional<bool> get_blinded_msgreqs() const;
    void set_blinded_msgreqs(std::optional<bool> enabled);

  protected:
    std::string event_key(std::string_view rec, std::string_view field) const override;
};

}  // namespace swarmsync::config
