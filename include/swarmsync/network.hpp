#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "errors.hpp"
#include "namespaces.hpp"
#include "types.hpp"

namespace swarmsync {

/// A storage node of a swarm.
struct Node {
    std::string pubkey;  // ed25519 pubkey, hex
    std::string address;

    bool operator==(const Node& o) const { return pubkey == o.pubkey; }
    bool operator!=(const Node& o) const { return !(*this == o); }
    bool operator<(const Node& o) const { return pubkey < o.pubkey; }
};

/// A raw message as returned by a swarm node.
struct SwarmMessage {
    std::string hash;
    ustring data;
    int64_t timestamp_ms = 0;
    int64_t expiry_ms = 0;
};

/// A signed batch retrieve of several namespaces of one swarm.
struct PollRequest {
    std::string swarm_pubkey;
    std::vector<Namespace> namespaces;

    // Namespaces with a cursor only fetch messages newer than it.
    std::map<Namespace, std::string> last_hashes;

    // Share of the response size budget of each namespace (see `max_size_map`).
    std::map<Namespace, int64_t> max_sizes;

    // Config message hashes whose expiry should be extended while we poll.
    std::vector<std::string> refresh_hashes;

    int64_t timestamp_ms = 0;

    // Signature of ("retrieve" || namespace || timestamp), per namespace that requires auth.
    std::map<Namespace, ustring> signatures;
};

/// Messages returned per namespace.  A namespace missing from the response failed on the node
/// side and is treated as having no new messages.
using PollResponse = std::map<Namespace, std::vector<SwarmMessage>>;

/// Raw response to a JSON request sent to a swarm node.
struct SwarmResponse {
    int16_t status_code = 0;
    std::string body;
};

/// The request/response collaborator for swarm storage.  Calls block until the response arrives
/// and report failures by throwing `request_error`.
class SwarmClient {
  public:
    virtual ~SwarmClient() = default;

    /// The nodes of the swarm that stores `swarm_pubkey`'s messages.
    virtual std::vector<Node> get_swarm(std::string_view swarm_pubkey) = 0;

    virtual PollResponse poll(const Node& node, const PollRequest& request) = 0;

    /// Sends a JSON request (such as the `sequence` built by `ConfigStore::prepare_push`).
    virtual SwarmResponse send(
            const Node& node, std::string_view swarm_pubkey, std::string payload) = 0;
};

/// A message posted to a community room.
struct CommunityMessage {
    int64_t seqno = 0;
    std::string session_id;
    ustring data;
    int64_t posted_ms = 0;
};

struct CommunityPollRequest {
    std::string server;
    // room token -> last seqno we have from that room
    std::map<std::string, int64_t> rooms;
    bool blinded = false;
};

/// room token -> new messages
using CommunityPollResponse = std::map<std::string, std::vector<CommunityMessage>>;

/// The request/response collaborator for community servers.
class CommunityClient {
  public:
    virtual ~CommunityClient() = default;

    virtual CommunityPollResponse poll_rooms(const CommunityPollRequest& request) = 0;

    /// Fetches the server's capabilities (e.g. "sogs", "blind"), authenticating with a blinded id
    /// if `blinded` is set.
    virtual std::vector<std::string> capabilities(std::string_view server, bool blinded) = 0;
};

/// Extracts the error from a swarm response: the root status for a failed request, or the common
/// status when every sub-request of a batch/sequence failed the same way.  Returns nullopt if
/// the request (or at least one sub-request) succeeded.  406/425 mean the clock is out of sync,
/// 429 that we are rate limited, 401/403 that the request was not authorized.
std::optional<request_error> extract_error(int16_t status_code, std::string_view body);

}  // namespace swarmsync
