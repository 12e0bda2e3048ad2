#pragma once

#include <array>
#include <deque>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <unordered_set>
#include <utility>
#include <vector>

#include "../config.hpp"
#include "../events.hpp"
#include "../log.hpp"
#include "../namespaces.hpp"
#include "../util.hpp"
#include "variant.hpp"

namespace swarmsync::config {

/// Our current config state
enum class ConfigState : int {
    /// Clean means the config is confirmed stored on the server and we haven't changed anything.
    Clean = 0,

    /// Dirty means we have local changes, and the changes haven't been serialized yet for sending
    /// to the server.
    Dirty = 1,

    /// Waiting is halfway in-between clean and dirty: the caller has serialized the data, but
    /// hasn't yet reported back that the data has been stored, *and* we haven't made any changes
    /// since the data was serialize.
    Waiting = 2,
};

using Ed25519PubKey = std::array<unsigned char, 32>;
using Ed25519Secret = std::array<unsigned char, 64>;

/// Base config type for client-side configs containing common functionality needed by all config
/// sub-types.
///
/// A config object is *not* thread-safe: it is owned by a single writer (normally the
/// `ConfigStore`) which serializes all access to it.
class ConfigBase {
  public:
    static constexpr size_t KEY_SIZE = 32;
    using Key = std::array<unsigned char, KEY_SIZE>;

  private:
    // The config's current state, see `ConfigState`
    ConfigState _state = ConfigState::Clean;

    // Whether we have changes that haven't been written to a dump yet
    bool _needs_dump = false;

    // Encryption keys used for encrypting pushes and decrypting incoming messages.  The first key
    // is the one used for encryption; all keys are tried when decrypting.
    std::vector<Key> _keys;

    // Signing keys; see `set_sig_keys`.
    std::optional<Ed25519PubKey> _sign_pk;
    std::optional<Ed25519Secret> _sign_sk;

    // The hash of the message that currently holds our complete state on the swarm, if known.
    std::string _curr_hash;

    // Hashes of messages that have been superseded and can be deleted from the swarm on our next
    // push.
    std::set<std::string> _old_hashes;

    // Hashes of messages we have already merged, oldest first; merging one of these again does
    // nothing.
    std::deque<std::string> _merged_order;
    std::unordered_set<std::string> _merged_hashes;
    size_t _max_merged_hashes = 1000;

    // Random id of this config object, used to break ties between concurrent writes.
    std::string _writer;

    bool _compression = true;

    // Events produced since the last `take_events()` call.
    EventList _events;

    void init_from_dump(ustring_view dump);

    void remember_merged(const std::string& hash);

    ConfigData::sign_callable signer() const;
    ConfigData::verify_callable verifier() const;

  protected:
    // The merge-capable config data.
    ConfigData _data;

    // Constructs a base config by loading the data from a dump as produced by `dump()`.  If the
    // dump is nullopt then an empty base config is constructed with no config settings and seqno
    // set to 0.  Signing keys are set as given (see `set_sig_keys`/`set_sig_pubkey`).
    explicit ConfigBase(
            std::optional<ustring_view> dump = std::nullopt,
            std::optional<ustring_view> ed25519_pubkey = std::nullopt,
            std::optional<ustring_view> ed25519_secretkey = std::nullopt);

    // Tracks that the config has changed; throws if the config is read-only.
    void set_state(ConfigState s);

    // Marks the config dirty (throwing if read-only).
    void dirty();

    // Invokes the `logger` callback if set, does nothing if there is no logger.
    void log(LogLevel lvl, std::string msg) const {
        if (logger)
            logger(lvl, std::move(msg));
    }

    // Appends an event to the pending event list.
    void emit(std::string key, std::string value);

    // Called with the live changes of a local mutation or merge to produce events.  The default
    // implementation emits one event per changed field/set element using `event_key`.
    virtual void emit_changes(const changes& c);

    // Returns the event key for a changed (record, field); subclasses map their short field names
    // to readable keys here.
    virtual std::string event_key(std::string_view rec, std::string_view field) const;

    // Returns the event value of a field: the live value formatted as a string, or an empty string
    // for a deleted field.
    std::string event_value(std::string_view rec, std::string_view field) const;

    // Called after any merge that changed something.
    virtual void after_merge() {}

    // Sets (or deletes, with nullopt) a field, marking the config dirty and emitting an event if
    // the value changed.  Returns true if it changed.
    bool set_field(std::string_view rec, std::string_view field, std::optional<scalar> value);

    /// Sets a value to 1 if true, removes it if false.
    void set_flag(std::string_view rec, std::string_view field, bool val);

    /// Sets a string value if non-empty, clears it if empty.
    void set_nonempty_str(std::string_view rec, std::string_view field, std::string_view val);

    /// Sets an integer value, if non-zero; removes it if 0.
    void set_nonzero_int(std::string_view rec, std::string_view field, int64_t val);

    /// Sets an integer value, if positive; removes it if <= 0.
    void set_positive_int(std::string_view rec, std::string_view field, int64_t val);

    /// Sets both string fields if `condition` is true, otherwise removes both.
    void set_pair_if(
            bool condition,
            std::string_view rec,
            std::string_view field1,
            std::string_view val1,
            std::string_view field2,
            std::string_view val2);

    // Removes every field of a record; returns true if anything was removed.
    bool erase_record(std::string_view rec);

    // Adds/removes a set element; returns true if the set changed.
    bool set_insert(std::string_view set, std::string_view elem);
    bool set_erase(std::string_view set, std::string_view elem);

    // Returns a hash of the signing seed using `key` as the hash key; throws if there is no
    // signing secret key.
    std::array<unsigned char, 32> seed_hash(std::string_view key) const;

    const std::optional<Ed25519Secret>& get_sig_secret() const { return _sign_sk; }

  public:
    virtual ~ConfigBase();

    // Config objects are owned in place; they are neither copied nor moved.
    ConfigBase(const ConfigBase&) = delete;
    ConfigBase& operator=(const ConfigBase&) = delete;
    ConfigBase(ConfigBase&&) = delete;
    ConfigBase& operator=(ConfigBase&&) = delete;

    /// API: base/ConfigBase::variant
    ///
    /// Returns the variant of this config object.
    virtual ConfigVariant variant() const = 0;

    /// API: base/ConfigBase::storage_namespace
    ///
    /// Returns the swarm namespace this config is stored in; nullopt for configs that are never
    /// pushed.
    std::optional<Namespace> storage_namespace() const { return variant_namespace(variant()); }

    /// API: base/ConfigBase::encryption_domain
    ///
    /// Subclasses must override this to return a constant string that is unique per config type;
    /// this value is used for domain separation in encryption.  The string length must be between
    /// 1 and 24 characters.
    virtual const char* encryption_domain() const = 0;

    /// API: base/ConfigBase::compression_level
    ///
    /// The zstd compression level to use for this type.  Subclasses can override this if they have
    /// some particular special compression level, or to disable compression entirely (by returning
    /// std::nullopt).  The default is zstd level 1.
    virtual std::optional<int> compression_level() const {
        if (!_compression)
            return std::nullopt;
        return 1;
    }

    /// Enables or disables compression of pushed messages.
    void set_compression_enabled(bool enabled) { _compression = enabled; }

    /// Limits the number of merged message hashes remembered for deduplication.
    void set_max_merged_hashes(size_t n);

    // Proxy logger callback.  Set this to receive log messages from the config object.
    Logger logger;

    /// API: base/ConfigBase::merge
    ///
    /// This takes all of the messages pulled down from the server and does whatever is necessary
    /// to merge (or replace) the current values.
    ///
    /// Values are pairs of the message hash (as provided by the server) and the raw message body.
    ///
    /// Messages are decrypted with each known key in turn, decompressed, and (if a signing pubkey
    /// is set) verified; messages that fail any of these steps are logged and skipped.  A message
    /// whose hash has already been merged is skipped without any effect.
    ///
    /// After merging, the state is:
    /// - clean, with the hash of the merged message as the current hash, if one of the messages
    ///   contained everything we now have;
    /// - dirty if the merged result exists nowhere on the swarm (and so must be pushed);
    /// - unchanged if nothing we received changed anything.
    ///
    /// Messages that are superseded are recorded as obsolete and returned from the next `push()`.
    ///
    /// Throws `std::logic_error` if the config has no decryption keys.
    ///
    /// Inputs:
    /// - `configs` -- vector of pairs containing the message hash and the raw message body
    ///
    /// Outputs:
    /// - vector of the hashes that were successfully parsed and merged.
    std::vector<std::string> merge(
            const std::vector<std::pair<std::string, ustring_view>>& configs);

    /// API: base/ConfigBase::merge(vector<pair<string, ustring>>)
    ///
    /// Same as above, but takes the values as ustring's as sometimes that is more convenient.
    std::vector<std::string> merge(const std::vector<std::pair<std::string, ustring>>& configs);

    /// API: base/ConfigBase::state
    ///
    /// Returns the current state of the config.
    ConfigState state() const { return _state; }

    bool is_dirty() const { return _state == ConfigState::Dirty; }
    bool is_clean() const { return _state == ConfigState::Clean; }

    /// API: base/ConfigBase::seqno
    ///
    /// Returns the current seqno of the config data.
    seqno_t seqno() const { return _data.seqno(); }

    /// API: base/ConfigBase::current_hashes
    ///
    /// The current config hashes; this can be empty if the current hash is unknown or the current
    /// state is not clean (i.e. a push is needed or pending).
    std::vector<std::string> current_hashes() const;

    /// API: base/ConfigBase::needs_push
    ///
    /// Returns true if this object contains updated data that has not yet been confirmed stored on
    /// the server.  This will be true whenever `is_clean()` is false: that is, if we are currently
    /// "dirty" (i.e.  have changes that haven't been pushed) or are still awaiting confirmation of
    /// storage of the most recent serialized push data.
    virtual bool needs_push() const;

    /// API: base/ConfigBase::push
    ///
    /// Returns a tuple of three elements:
    /// - the seqno value of the data
    /// - the data message to push to the server
    /// - a list of known message hashes that are obsoleted by this push.
    ///
    /// Additionally, if the internal state is currently dirty (i.e. there are unpushed changes),
    /// the seqno is incremented and the internal state is changed so that we are in a "pushed"
    /// state awaiting confirmation of storage.  Data should be sent to the server with its
    /// associated hash returned to `confirm_pushed()`.
    ///
    /// Throws `std::length_error` if the message is larger than the storage server limit and
    /// `std::logic_error` if the config has no encryption key or cannot be signed.
    virtual std::tuple<seqno_t, ustring, std::vector<std::string>> push();

    /// API: base/ConfigBase::confirm_pushed
    ///
    /// Should be called after the push is confirmed stored on the storage server swarm to let the
    /// object know the config message has been stored and, ideally, that the obsolete messages
    /// returned by `push()` are deleted.  Confirmations for a seqno other than the one we are
    /// waiting on are ignored.
    ///
    /// Inputs:
    /// - `seqno` -- sequence number that was pushed
    /// - `msg_hash` -- message hash that was pushed
    void confirm_pushed(seqno_t seqno, std::string msg_hash);

    /// API: base/ConfigBase::dump
    ///
    /// Returns a dump of the current state for storage in the database; this value would get
    /// passed into the constructor to reconstitute the object (including the push/not pushed
    /// status).  This method *does* modify the object: it clears the `needs_dump()` flag.
    ustring dump();

    /// API: base/ConfigBase::make_dump
    ///
    /// Returns a dump of the current state; unlike `dump()` this does *not* update the internal
    /// needs_dump flag.
    ustring make_dump() const;

    /// API: base/ConfigBase::needs_dump
    ///
    /// Returns true if something has changed since the last call to `dump()` that requires
    /// calling (and saving the output of) `dump()` again.
    bool needs_dump() const { return _needs_dump; }

    /// API: base/ConfigBase::confirm_dumped
    ///
    /// Clears the `needs_dump()` flag once the output of `make_dump()` has been durably stored.
    /// Must be called without any change to the object since that `make_dump()` call.
    void confirm_dumped() { _needs_dump = false; }

    /// API: base/ConfigBase::take_events
    ///
    /// Returns the events produced by local changes and merges since the last call, clearing the
    /// pending list.
    EventList take_events();

    /// API: base/ConfigBase::discard_events
    ///
    /// Drops any pending events (used when a change is abandoned).
    void discard_events() { _events.clear(); }

    /// API: base/ConfigBase::writer_id
    ///
    /// The id this object writes into field timestamps to break ties with concurrent writers.
    const std::string& writer_id() const { return _writer; }

    /// API: base/ConfigBase::add_key
    ///
    /// Adds an encryption/decryption key, without removing existing keys.  They key must be
    /// exactly 32 bytes long.  If `high_priority` is true the key becomes the encryption key
    /// (moving to the front of the list); otherwise it is appended (if not already present) and
    /// only used for decryption.  If `dirty_config` is true and the encryption key changes, the
    /// config is marked dirty so that it gets re-encrypted and pushed.
    void add_key(ustring_view key, bool high_priority = true, bool dirty_config = false);

    /// API: base/ConfigBase::replace_keys
    ///
    /// Replaces the full set of keys with the given ones (the first becomes the encryption key).
    void replace_keys(const std::vector<ustring_view>& new_keys, bool dirty_config = false);

    /// API: base/ConfigBase::clear_keys
    ///
    /// Clears all stored encryption/decryption keys; returns how many were removed.
    int clear_keys(bool dirty_config = false);

    int key_count() const { return static_cast<int>(_keys.size()); }

    /// API: base/ConfigBase::has_key
    ///
    /// Returns true if the given key is already in the keys list.  Throws `std::invalid_argument`
    /// if the key is not 32 bytes.
    bool has_key(ustring_view key) const;

    /// API: base/ConfigBase::get_keys
    ///
    /// Returns views of all the keys, encryption key first.  The views are invalidated by any key
    /// changes.
    std::vector<ustring_view> get_keys() const;

    /// API: base/ConfigBase::key
    ///
    /// Accesses the key at position i (0 if omitted).  Throws `std::out_of_range` if there is no
    /// such key.
    ustring_view key(size_t i = 0) const;

    /// API: base/ConfigBase::load_key
    ///
    /// Called to load an ed25519 key for encryption; this is meant for use by single-owner config
    /// types (the user's own configs), where the encryption key is the seed of the user's Ed25519
    /// secret key.  Takes a 64-byte secret key or a 32-byte seed.
    void load_key(ustring_view ed25519_secretkey);

    /// API: base/ConfigBase::set_sig_keys
    ///
    /// Sets an Ed25519 keypair pair for signing and verifying config messages.  When set, this adds
    /// a signature for verification into the config message (*after* decryption) that validates a
    /// config message.
    ///
    /// When a signature public key (with or without a secret key) is set, incoming messages must
    /// contain a signature that verifies with the public key; messages without such a signature
    /// are dropped as invalid.  Without the secret key the object is read-only.
    ///
    /// Inputs:
    /// - `secret` -- the 64-byte sodium-style Ed25519 "secret key" (actually the seed+pubkey
    ///   concatenated together) that sets both the secret key and public key.
    void set_sig_keys(ustring_view secret);

    /// API: base/ConfigBase::set_sig_pubkey
    ///
    /// Sets a Ed25519 signing pubkey which incoming messages must be signed by to be acceptable.
    void set_sig_pubkey(ustring_view pubkey);

    const std::optional<Ed25519PubKey>& get_sig_pubkey() const { return _sign_pk; }

    /// API: base/ConfigBase::clear_sig_keys
    ///
    /// Drops the signature pubkey and/or secret key, if the object has them.
    void clear_sig_keys();

    /// API: base/ConfigBase::is_readonly
    ///
    /// Returns true if this object requires signatures but has no secret key to produce them,
    /// i.e. it can merge incoming data but cannot be modified or pushed.
    bool is_readonly() const { return _sign_pk && !_sign_sk; }
};

}  // namespace swarmsync::config
