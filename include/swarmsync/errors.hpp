#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace swarmsync {

struct Error {
    static constexpr const char* READ_ONLY_CONFIG =
            "Unable to make changes to a read-only config object";
    static constexpr const char* NO_ADMIN_KEY =
            "Unable to modify group config without the group admin key";
};

/// Base class of failures coming out of a config object (bad data, bad signature, failed
/// decryption).
struct config_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/// Thrown when a serialized config message or dump cannot be parsed.
struct config_parse_error : config_error {
    using config_error::config_error;
};

/// Thrown when a config message requires a signature and the signature is missing or invalid.
struct signature_error : config_error {
    using config_error::config_error;
};

/// Thrown when config data cannot be decrypted with a given key.
struct decrypt_error : config_error {
    using config_error::config_error;
};

/// Programming-contract violations: these indicate a bug in the caller and are logged at critical
/// level before being thrown.
struct contract_violation : std::logic_error {
    using std::logic_error::logic_error;
};

/// Attempt to modify or push a group's shared config without the group admin key.
struct admin_violation : contract_violation {
    using contract_violation::contract_violation;
};

/// Attempt to operate on a config object that was never loaded.
struct config_not_loaded : contract_violation {
    using contract_violation::contract_violation;
};

enum class RequestErrorKind {
    rate_limited,
    clock_out_of_sync,
    unauthorized,
    missing_capability,
    timeout,
    transport,
    invalid_response,
    ran_out_of_nodes,
};

/// Returns a short readable name for the error kind.
const char* to_string(RequestErrorKind kind);

/// A failed request to a swarm node or community server.
class request_error : public std::runtime_error {
  public:
    request_error(RequestErrorKind kind, std::string message, int16_t status_code = 0) :
            std::runtime_error{std::move(message)}, _kind{kind}, _status_code{status_code} {}

    RequestErrorKind kind() const { return _kind; }
    int16_t status_code() const { return _status_code; }

    /// True for errors that should simply be retried (with backoff) against the same node.
    bool is_retryable() const {
        return _kind == RequestErrorKind::transport || _kind == RequestErrorKind::timeout;
    }

    /// True for errors that abort the current poll cycle but not the polling of the target.
    bool is_fatal_for_cycle() const {
        return _kind == RequestErrorKind::rate_limited ||
               _kind == RequestErrorKind::clock_out_of_sync;
    }

  private:
    RequestErrorKind _kind;
    int16_t _status_code;
};

enum class MessageErrorKind {
    duplicate_message,
    duplicate_control_message,
    duplicate_message_new_node,
    self_send,
    invalid_message,
    decrypt_failed,
};

/// Returns a short readable name for the error kind.
const char* to_string(MessageErrorKind kind);

/// Failure to process a single polled message.
class message_error : public std::runtime_error {
  public:
    message_error(MessageErrorKind kind, std::string message) :
            std::runtime_error{std::move(message)}, _kind{kind} {}
    explicit message_error(MessageErrorKind kind) : message_error{kind, to_string(kind)} {}

    MessageErrorKind kind() const { return _kind; }

    /// Duplicates and self-sends are steady-state swarm replication noise: they are dropped
    /// without logging.
    bool is_expected_noise() const {
        return _kind == MessageErrorKind::duplicate_message ||
               _kind == MessageErrorKind::duplicate_control_message ||
               _kind == MessageErrorKind::duplicate_message_new_node ||
               _kind == MessageErrorKind::self_send;
    }

    /// A message we have already seen, but delivered by a node we have not seen it from, still
    /// proves the cursor we polled with is valid; so does a message we sent ourselves.
    bool updates_last_hash() const {
        return _kind == MessageErrorKind::duplicate_message_new_node ||
               _kind == MessageErrorKind::self_send;
    }

    bool is_duplicate() const {
        return _kind == MessageErrorKind::duplicate_message ||
               _kind == MessageErrorKind::duplicate_control_message ||
               _kind == MessageErrorKind::duplicate_message_new_node;
    }

  private:
    MessageErrorKind _kind;
};

}  // namespace swarmsync
