#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "../base.hpp"
#include "../profile_pic.hpp"

namespace swarmsync::config::groups {

using namespace std::literals;

/// Group metadata, stored in the unnamed record "":
///
/// ! - destroyed; once set, members drop the conversation
/// c - created, unix seconds
/// d - members delete every message older than this unix timestamp
/// D - as `d`, for attachments only
/// E - disappearing (after send) timer in seconds; absent when disabled
/// n - name
/// o - description
/// p - picture url
/// q - picture key (32 bytes)
///
/// Event keys are "group.<group_id>.<field>": destroyed, created, delete_before,
/// delete_attach_before, expiry_timer, name, description, pic_url, pic_key.

class Info final : public ConfigBase {

  public:
    static constexpr size_t NAME_MAX_LENGTH = 100;
    static constexpr size_t DESCRIPTION_MAX_LENGTH = 2000;

    Info() = delete;

    /// API: groups/Info::Info
    ///
    /// The object can neither merge nor push until the group's `Keys` installs its encryption
    /// keys.
    ///
    /// Inputs:
    /// - `ed25519_pubkey` -- the group pubkey; messages it did not sign are rejected
    /// - `ed25519_secretkey` -- the group secret key, held by admins only; without it the object
    ///   is read-only
    /// - `dumped` -- a previous `dump()`, or nullopt to start empty
    Info(ustring_view ed25519_pubkey,
         std::optional<ustring_view> ed25519_secretkey,
         std::optional<ustring_view> dumped);

    ConfigVariant variant() const override { return ConfigVariant::GroupInfo; }

    const char* encryption_domain() const override { return "groups::Info"; }

    /// "03" + hex group pubkey.
    const std::string id;

    std::optional<std::string> get_name() const;

    /// Empty clears the name; longer than NAME_MAX_LENGTH gets truncated.
    void set_name(std::string_view new_name);

    std::optional<std::string> get_description() const;

    /// Empty clears the description; longer than DESCRIPTION_MAX_LENGTH gets truncated.
    void set_description(std::string_view new_desc);

    profile_pic get_profile_pic() const;
    void set_profile_pic(std::string_view url, ustring_view key);
    void set_profile_pic(profile_pic pic);

    /// Zero disables disappearing messages.
    void set_expiry_timer(std::chrono::seconds expiration_timer = 0min);

    std::optional<std::chrono::seconds> get_expiry_timer() const;

    void set_created(int64_t timestamp);

    std::optional<int64_t> get_created() const;

    /// API: groups/Info::set_delete_before
    ///
    /// Asks every member to delete group messages sent before `timestamp` (unix seconds).
    void set_delete_before(int64_t timestamp);

    std::optional<int64_t> get_delete_before() const;

    void set_delete_attach_before(int64_t timestamp);

    std::optional<int64_t> get_delete_attach_before() const;

    /// API: groups/Info::destroy_group
    ///
    /// Marks the group destroyed.  There is no way back: the flag cannot be cleared.
    void destroy_group();

    bool is_destroyed() const;

  protected:
    std::string event_key(std::string_view rec, std::string_view field) const override;
};

}  // namespace swarmsync::config::groups
