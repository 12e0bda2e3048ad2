#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../base.hpp"
#include "../profile_pic.hpp"

namespace swarmsync::config::groups {

using namespace std::literals;

/// One record per member, "m/<session id in hex>":
///   n - display name; always written (possibly empty) so the record stays alive
///   p - picture url
///   q - picture key (32 bytes)
///   I - invite state: 1 sent and not yet accepted, 2 failed to send; absent once accepted
///   s - 1 when the invite came with the existing keys instead of a rekey; only alongside `I`
///   P - promotion state: 1 sent, 2 failed to send; absent once the member is an admin
///   R - removal: 1 remove the member, 2 also remove their messages
///
/// Admins are the members of the "admins" set, so promotions made concurrently on different
/// devices are all kept.
///
/// Event keys are "group.<group_id>.member.<session_id>.<field>": name, pic_url, pic_key, invite,
/// supplement, promotion, removed, admin.

struct member {
    static constexpr size_t MAX_NAME_LENGTH = 100;

    static constexpr int INVITE_SENT = 1, INVITE_FAILED = 2;
    static constexpr int REMOVED_MEMBER = 1, REMOVED_MEMBER_AND_MESSAGES = 2;

    explicit member(std::string sid);

    std::string session_id;

    /// Shown by other members until they see a message from this one.
    std::string name;

    profile_pic profile_picture;

    /// Mirrors membership of the "admins" set.
    bool admin = false;

    /// Invited with the existing keys rather than through a rekey.
    bool supplement = false;

    // Read through set_invited(), invite_pending() and invite_failed().
    int invite_status = 0;

    void set_invited(bool failed = false) { invite_status = failed ? INVITE_FAILED : INVITE_SENT; }

    void set_accepted() {
        invite_status = 0;
        supplement = false;
    }

    bool invite_pending() const { return invite_status > 0; }

    bool invite_failed() const { return invite_status == INVITE_FAILED; }

    int promotion_status = 0;

    void set_promoted(bool failed = false) {
        promotion_status = failed ? INVITE_FAILED : INVITE_SENT;
    }

    bool promotion_pending() const { return !admin && promotion_status > 0; }

    bool promotion_failed() const { return !admin && promotion_status == INVITE_FAILED; }

    bool promoted() const { return admin || promotion_pending(); }

    int removed_status = 0;

    void set_removed(bool messages = false) {
        removed_status = messages ? REMOVED_MEMBER_AND_MESSAGES : REMOVED_MEMBER;
    }

    bool is_removed() const { return removed_status > 0; }

    bool should_remove_messages() const { return removed_status == REMOVED_MEMBER_AND_MESSAGES; }

    /// Throws std::invalid_argument past MAX_NAME_LENGTH bytes.
    void set_name(std::string name);

  private:
    friend class Members;
    void load(const ConfigData& data, std::string_view rec);
};

class Members final : public ConfigBase {

  public:
    Members() = delete;

    /// API: groups/Members::Members
    ///
    /// Same arguments as `Info`: the group pubkey, the admin-only secret key and an optional
    /// dump.  Keys must be installed by the group's `Keys` before anything merges or pushes.
    Members(ustring_view ed25519_pubkey,
            std::optional<ustring_view> ed25519_secretkey,
            std::optional<ustring_view> dumped);

    ConfigVariant variant() const override { return ConfigVariant::GroupMembers; }

    const char* encryption_domain() const override { return "groups::Members"; }

    const std::string id;

    std::optional<member> get(std::string_view pubkey_hex) const;

    /// A blank member for unknown ids; nothing is stored until `set`.
    member get_or_construct(std::string_view pubkey_hex) const;

    /// API: groups/Members::set
    ///
    /// Writes the member record and adds it to, or removes it from, the admins set.
    void set(const member& member);

    /// API: groups/Members::erase
    ///
    /// Drops the record and any admin entry; false if the member was unknown.
    bool erase(std::string_view session_id);

    size_t size() const;

    /// All members, ordered by session id.
    std::vector<member> all() const;

    /// The session ids of all admins.
    std::vector<std::string> admins() const;

    bool is_admin(std::string_view session_id) const;

  protected:
    std::string event_key(std::string_view rec, std::string_view field) const override;
};

}  // namespace swarmsync::config::groups
