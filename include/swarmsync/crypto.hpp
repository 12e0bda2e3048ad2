#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "namespaces.hpp"
#include "network.hpp"
#include "types.hpp"

namespace swarmsync {

/// A regular (non-config) message after its envelope has been opened.
struct DecodedMessage {
    std::string hash;
    Namespace ns = Namespace::Default;

    // The conversation the message belongs to: the sender's session id for one-to-one messages,
    // the group id for group messages, "<server>/<room>" for community messages.
    std::string conversation_id;

    std::string sender;
    ustring plaintext;
    int64_t sent_timestamp_ms = 0;
    int64_t server_timestamp_ms = 0;
};

/// The crypto collaborator: envelope decoding and request signing for the identities whose
/// swarms we poll.  Failures are reported by throwing; there is no internal retry.
class Crypto {
  public:
    virtual ~Crypto() = default;

    /// Authenticates and decrypts a message received from `swarm_pubkey`'s swarm.  Throws
    /// `message_error` (`invalid_message`, `decrypt_failed` or `self_send`) if the message cannot
    /// be used.
    virtual DecodedMessage decode_envelope(
            std::string_view swarm_pubkey, Namespace ns, const SwarmMessage& message) = 0;

    /// Signs `data` with the key that authenticates requests to `swarm_pubkey`'s swarm (the
    /// user's key, or a group's admin key or auth data).  Throws if we have no such key.
    virtual ustring sign(std::string_view swarm_pubkey, ustring_view data) = 0;

    virtual bool verify(ustring_view signature, ustring_view message, ustring_view pubkey) = 0;
};

}  // namespace swarmsync
