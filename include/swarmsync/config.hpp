#pragma once

#include <array>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "errors.hpp"
#include "types.hpp"

namespace swarmsync::config {

inline constexpr int MAX_MESSAGE_SIZE = 76800;  // 76.8kB = Storage server's limit

// Application data data types:
using scalar = std::variant<int64_t, std::string>;

using hash_t = std::array<unsigned char, 32>;

/// One field of a config record.  A field that has been deleted keeps its timestamp and writer
/// (with an empty `value`) so that the deletion itself can win or lose a merge.
struct field_value {
    std::optional<scalar> value;
    int64_t timestamp_ms = 0;
    std::string writer;

    bool deleted() const { return !value; }

    bool operator==(const field_value& o) const {
        return timestamp_ms == o.timestamp_ms && writer == o.writer && value == o.value;
    }
    bool operator!=(const field_value& o) const { return !(*this == o); }
};

/// Returns true if `a` takes precedence over `b` when merging: the later timestamp wins, ties are
/// broken by writer id and then by value (a deletion sorts before any value) so that every device
/// resolves the same conflict the same way.
bool supersedes(const field_value& a, const field_value& b);

/// An element of a named set.  The element is present if it has been added at least as recently
/// as it was removed (i.e. concurrent add and remove resolve to "present").
struct set_entry {
    int64_t added_ms = 0;
    int64_t removed_ms = 0;

    bool present() const { return added_ms > 0 && added_ms >= removed_ms; }

    bool operator==(const set_entry& o) const {
        return added_ms == o.added_ms && removed_ms == o.removed_ms;
    }
    bool operator!=(const set_entry& o) const { return !(*this == o); }
};

/// (record, field) or (set, element)
using field_key = std::pair<std::string, std::string>;

/// The live changes produced by a merge or local mutation.
struct changes {
    std::set<field_key> fields;
    std::set<field_key> set_elements;

    bool empty() const { return fields.empty() && set_elements.empty(); }

    void absorb(const changes& other) {
        fields.insert(other.fields.begin(), other.fields.end());
        set_elements.insert(other.set_elements.begin(), other.set_elements.end());
    }
};

/// The merge-capable data held by every config object: a map of records, each holding named
/// fields, plus a map of named sets.  Merging two ConfigData values takes, for each field, the
/// value that `supersedes` the other, and for each set element the latest add and remove
/// timestamps; the sequence number merges to the larger of the two.  Merge is therefore
/// commutative, associative and idempotent.
///
/// Serialized form is a bt-encoded dict:
///
///     #: seqno
///     f: { record: { field: [timestamp, writer, value] } }   (value omitted for a deletion)
///     s: { set: { element: [added, removed] } }
///     ~: optional signature of everything preceding it
class ConfigData {
  public:
    using record = std::map<std::string, field_value, std::less<>>;
    using set_type = std::map<std::string, set_entry, std::less<>>;

    /// Callable that verifies `signature` over `data`.
    using verify_callable = std::function<bool(ustring_view data, ustring_view signature)>;

    /// Callable that returns a 64-byte signature of `data`.
    using sign_callable = std::function<ustring(ustring_view data)>;

    ConfigData() = default;

    /// Parses a serialized ConfigData.  If `verifier` is given the data must carry a signature
    /// that it accepts (throws `signature_error` otherwise); a signature present without a
    /// verifier is ignored.  Throws `config_parse_error` on malformed data.
    explicit ConfigData(ustring_view serialized, const verify_callable& verifier = nullptr);

    seqno_t seqno() const { return _seqno; }
    void seqno(seqno_t s) { _seqno = s; }

    /// Returns the raw field (including deleted fields), or nullptr if the field was never set.
    const field_value* field(std::string_view rec, std::string_view name) const;

    /// Returns the live value of a field, or nullptr if not set (or deleted).
    const scalar* get(std::string_view rec, std::string_view name) const;

    std::optional<int64_t> get_int(std::string_view rec, std::string_view name) const;
    std::optional<std::string> get_string(std::string_view rec, std::string_view name) const;

    /// Sets (or, with `std::nullopt`, deletes) a field.  The stored timestamp is `now_ms`, bumped
    /// past the current timestamp of the field if needed so that the local write always takes
    /// precedence over what we already have.  Returns true if the live value changed; setting a
    /// field to its current value does nothing.
    bool set(
            std::string_view rec,
            std::string_view name,
            std::optional<scalar> value,
            int64_t now_ms,
            std::string_view writer);

    /// Deletes every live field of a record; returns the keys of the fields that were removed.
    std::vector<field_key> erase_record(
            std::string_view rec, int64_t now_ms, std::string_view writer);

    /// Returns all fields (including deleted ones) of a record, or nullptr if the record has
    /// never had any fields.
    const record* record_fields(std::string_view rec) const;

    /// True if the record has at least one live field.
    bool has_record(std::string_view rec) const;

    /// Names of records with at least one live field, optionally restricted to those starting with
    /// `prefix`, in sorted order.
    std::vector<std::string> records(std::string_view prefix = "") const;

    bool set_contains(std::string_view set, std::string_view elem) const;
    std::vector<std::string> set_elements(std::string_view set) const;

    /// Adds/removes a set element; returns true if its presence changed.
    bool set_insert(std::string_view set, std::string_view elem, int64_t now_ms);
    bool set_erase(std::string_view set, std::string_view elem, int64_t now_ms);

    /// Merges `other` into this, returning the fields and set elements whose live value changed.
    /// `modified` (if given) is set to true if anything in this object changed at all, including
    /// changes to deleted fields and timestamps that are not visible as live changes.
    changes merge(const ConfigData& other, bool* modified = nullptr);

    /// True if both hold the same fields and sets; the seqno is not compared.
    bool same_content(const ConfigData& other) const;

    /// bt-encodes the data, signing it if a signer is given.
    ustring serialize(const sign_callable& signer = nullptr) const;

    /// BLAKE2b-256 hash of the unsigned serialization.
    hash_t hash() const;

  private:
    seqno_t _seqno = 0;
    std::map<std::string, record, std::less<>> _records;
    std::map<std::string, set_type, std::less<>> _sets;

    const set_entry* set_element(std::string_view set, std::string_view elem) const;
};

}  // namespace swarmsync::config
