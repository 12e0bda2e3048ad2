#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "base.hpp"
#include "expiring.hpp"
#include "profile_pic.hpp"

namespace swarmsync::config {

using namespace std::literals;

/// Record layout.  One record per contact, named "c/<session id in hex>":
///
///     n - display name; always present (possibly empty) so the record never loses every field
///     p - profile picture url
///     q - profile picture key (32 bytes)
///     a - approved (1, or absent)
///     A - the contact approved us (1, or absent)
///     b - blocked (1, or absent)
///     + - conversation priority: absent for unpinned, -1 for hidden, >0 for pinned
///     e - disappearing mode (1 after send, 2 after read); absent when disabled
///     E - disappearing timer in seconds; only with `e`
///     j - creation time (unix seconds); absent when 0
///
/// Local nicknames stay on the device and are not stored here.  Changed fields surface as
/// "contact.<session id>.<field>" events, with field one of name, pic_url, pic_key, approved,
/// approved_me, blocked, priority, exp_mode, exp_timer or created.

struct contact_info {
    static constexpr size_t MAX_NAME_LENGTH = 100;

    std::string session_id;
    std::string name;
    profile_pic profile_picture;
    bool approved = false;
    bool approved_me = false;
    bool blocked = false;
    // 0 for a normal conversation, negative when hidden, positive when pinned (larger pins sort
    // first).
    int priority = 0;
    expiration_mode exp_mode = expiration_mode::none;
    std::chrono::seconds exp_timer{0};
    int64_t created = 0;  // unix seconds

    explicit contact_info(std::string sid);

    /// Assigns `name`, throwing std::invalid_argument past MAX_NAME_LENGTH bytes.
    void set_name(std::string name);

    bool hidden() const { return priority < 0; }

    bool operator==(const contact_info& o) const;
    bool operator!=(const contact_info& o) const { return !(*this == o); }

  private:
    friend class Contacts;
    void load(const ConfigData& data, std::string_view rec);
};

/// The user's contact list, shared by all of the user's devices.
class Contacts : public ConfigBase {

  public:
    Contacts() = delete;

    /// API: contacts/Contacts::Contacts
    ///
    /// Inputs:
    /// - `ed25519_secretkey` -- the user's Ed25519 secret key (64 bytes, or just the 32-byte
    ///   seed); the encryption key of the contact list is derived from it
    /// - `dumped` -- the result of an earlier `dump()`, or nullopt for an empty list
    Contacts(ustring_view ed25519_secretkey, std::optional<ustring_view> dumped);

    ConfigVariant variant() const override { return ConfigVariant::Contacts; }

    const char* encryption_domain() const override { return "Contacts"; }

    /// API: contacts/Contacts::get
    ///
    /// The contact with the given hex session id, or nullopt if it is not in the list.  Throws
    /// std::invalid_argument for a malformed id.
    std::optional<contact_info> get(std::string_view pubkey_hex) const;

    /// API: contacts/Contacts::get_or_construct
    ///
    /// Like `get`, but returns a blank contact_info for unknown ids.  The contact is only added
    /// once the value is passed to `set`.
    contact_info get_or_construct(std::string_view pubkey_hex) const;

    /// API: contacts/Contacts::set
    ///
    /// Writes every field of `contact`, creating the record if needed:
    ///
    ///```cpp
    ///     auto c = contacts.get_or_construct(pubkey);
    ///     c.approved = true;
    ///     contacts.set(c);
    ///```
    void set(const contact_info& contact);

    // Single-field setters; each creates the contact if it does not exist.
    void set_name(std::string_view session_id, std::string name);
    void set_profile_pic(std::string_view session_id, profile_pic pic);
    void set_approved(std::string_view session_id, bool approved);
    void set_approved_me(std::string_view session_id, bool approved_me);
    void set_blocked(std::string_view session_id, bool blocked);
    void set_priority(std::string_view session_id, int priority);
    void set_expiry(
            std::string_view session_id,
            expiration_mode exp_mode,
            std::chrono::seconds expiration_timer = 0min);
    void set_created(std::string_view session_id, int64_t timestamp);

    /// API: contacts/Contacts::erase
    ///
    /// Removes the contact; false if there was nothing to remove.
    bool erase(std::string_view session_id);

    size_t size() const;

    bool empty() const { return size() == 0; }

    /// Every contact, sorted by session id.
    std::vector<contact_info> all() const;

  protected:
    std::string event_key(std::string_view rec, std::string_view field) const override;
};

}  // namespace swarmsync::config
