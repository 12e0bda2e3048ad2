#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../base.hpp"
#include "info.hpp"
#include "members.hpp"

namespace swarmsync::config::groups {

/// keys used in this config, either currently or in the past (so that we don't reuse):
///
/// Each key generation is a record named "k/" followed by the 10-digit, zero-padded generation
/// number (so that records sort by generation):
///
///   n - the 24-byte nonce the copies of the key are encrypted with
///   K - the key encrypted for admins, under a hash of the group secret key
///   m0, m1, ... - the key encrypted for each member, under H(aB || A || B) where a/A is the
///       group's X25519 keypair and B the member's X25519 pubkey (the session id)
///   t - the unix timestamp (milliseconds) at which the key was generated
///
/// The newest generation we can open is the key used to encrypt the group's Info and Members
/// configs; older generations are kept for decrypting older messages.  The Keys config itself is
/// encrypted with a key derived from the group's public key, which hides nothing from someone who
/// knows the group id: only members and admins can open the generation keys inside.  It is signed
/// by the group admin key; only admins can rotate keys.
///
/// Changes produce a single "group.<group_id>.keys" event whose value is the current generation.
class Keys final : public ConfigBase {

  public:
    // No default constructor
    Keys() = delete;

    /// API: groups/Keys::Keys
    ///
    /// Constructs a group keys object from existing data (stored from `dump()`), or a new one.
    ///
    /// The Info and Members objects of the group must outlive this object: the current keys are
    /// installed into them on construction and whenever the keys change.
    ///
    /// Inputs:
    /// - `user_ed25519_secretkey` is the 64-byte Ed25519 secret key of the local user; it opens
    ///   the key copies issued to us as a member.
    /// - `group_ed25519_pubkey` is the public key of the group, used to verify incoming keys
    ///   messages and to derive the keys config encryption key.
    /// - `group_ed25519_secretkey` is the secret key of the group (64 bytes), which only admins
    ///   possess.  If a new object (i.e. without a dump) is constructed with this, an initial
    ///   rekey() is performed.
    /// - `dumped` -- either `std::nullopt` to construct a new, empty object; or binary state data
    ///   that was previously dumped from an instance of this class by calling `dump()`.
    /// - `info` and `members` -- the group's Info and Members config objects.
    Keys(ustring_view user_ed25519_secretkey,
         ustring_view group_ed25519_pubkey,
         std::optional<ustring_view> group_ed25519_secretkey,
         std::optional<ustring_view> dumped,
         Info& info,
         Members& members);

    ConfigVariant variant() const override { return ConfigVariant::GroupKeys; }

    const char* encryption_domain() const override { return "groups::Keys"; }

    /// Keys configs are small and random; compression does not help.
    std::optional<int> compression_level() const override { return std::nullopt; }

    /// The group id: "03" followed by the hex group pubkey.
    const std::string id;

    /// API: groups/Keys::admin
    ///
    /// True if we have the admin secret key for this group (and so can rekey and modify the
    /// group configs).
    bool admin() const { return !is_readonly(); }

    /// API: groups/Keys::load_admin_key
    ///
    /// Loads the group admin secret key into this Keys object and the group's Info and Members
    /// objects, making all three writable.  Throws std::invalid_argument if the secret key does
    /// not belong to this group.
    void load_admin_key(ustring_view secret);

    /// API: groups/Keys::rekey
    ///
    /// Generates a new encryption key generation, issued to the admins and to every member
    /// currently in the group's Members config, and installs it as the encryption key of the
    /// group's Info and Members configs (which become dirty, and need to be re-pushed).  Members
    /// added later cannot read the group until the next rekey.  Only admins can call this; throws
    /// `admin_violation` otherwise.
    ///
    /// Outputs:
    /// - the new generation number.
    int64_t rekey();

    /// API: groups/Keys::current_generation
    ///
    /// The newest generation whose key we can open; nullopt if there is none (e.g. the group has
    /// not issued keys to us).
    std::optional<int64_t> current_generation() const;

    /// API: groups/Keys::group_keys
    ///
    /// Returns all the group keys we can open, newest generation first.
    std::vector<ustring> group_keys() const;

    /// Number of key generations.
    size_t size() const;

  protected:
    void emit_changes(const changes& c) override;

    void after_merge() override;

  private:
    Info& _info;
    Members& _members;

    // Opens the member copies of a generation key.
    sodium_cleared<std::array<unsigned char, 32>> _member_key;

    // The key of a generation record, if we are an admin or it was issued to us.
    std::optional<Key> decrypt_generation(std::string_view rec) const;

    // The newest generation of any record, whether or not we can open it.
    std::optional<int64_t> newest_generation() const;

    void install_keys(bool dirty);
};

}  // namespace swarmsync::config::groups
