#pragma once

#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "../crypto.hpp"
#include "../hash_store.hpp"
#include "../jobs.hpp"
#include "../namespaces.hpp"
#include "../network.hpp"
#include "../store.hpp"
#include "poller.hpp"
#include "result_processor.hpp"

namespace swarmsync::poller {

/// The collaborators a swarm poller works with.
struct SwarmCollaborators {
    SwarmClient& client;
    Crypto& crypto;
    MessageHashStore& hashes;
    ConfigStore& store;
    JobDispatcher& dispatcher;
};

/// Poller of the namespaces of one swarm (the user's own swarm or a group's).
///
/// Each cycle picks a node (see `node_for_polling`), sends one signed batch retrieve for all the
/// namespaces with the cursor we have for each of them on that node, and, if the cycle is still
/// current once the response arrives, processes it with a `ResultProcessor`.
///
/// Node policy: a node is reused for `max_node_poll_count` successful polls and then replaced even
/// without error (0 picks a new random node every poll).  A node that fails
/// `max_failures_before_drop` times in a row with a retryable error is dropped for the rest of
/// the poller's life, until every node of the swarm has been dropped.  Rate limiting and clock
/// skew keep the node: the next cycle, after the backoff, asks it again.
class SwarmPoller : public Poller {
  public:
    SwarmPoller(
            std::string swarm_pubkey,
            std::vector<Namespace> namespaces,
            Scheduler& scheduler,
            SwarmCollaborators collaborators,
            PollerOptions options);

    const std::vector<Namespace>& namespaces() const { return _namespaces; }

    /// The node the next cycle will poll, if one has been picked.
    std::optional<Node> current_node() const;

    /// Pubkeys of the nodes dropped after repeated failures.
    std::set<std::string> dropped_nodes() const;

    /// API: poller/SwarmPoller::set_can_start_jobs
    ///
    /// Whether the jobs created from poll results may start right away (false e.g. while the app
    /// is in the background: the dispatcher then persists them for later).
    void set_can_start_jobs(bool can_start) {
        std::lock_guard lock{_node_mutex};
        _can_start_jobs = can_start;
    }

  protected:
    Apply poll() override;

    ErrorResponse handle_poll_error(const std::exception& e, int failure_count) override;

    void poll_succeeded(const PollResult& result) override;

    /// Picks the node for a cycle.  Throws `request_error` (`ran_out_of_nodes`) if the swarm has
    /// no usable node.
    virtual Node node_for_polling();

    /// Called with every response that gets applied, after its messages have been processed.
    virtual void response_applied(const PollResponse&) {}

    /// Builds the signed batch retrieve for `node`.
    PollRequest build_request(const Node& node);

    SwarmCollaborators _collab;

  private:
    const std::vector<Namespace> _namespaces;
    ResultProcessor _processor;

    mutable std::mutex _node_mutex;
    std::optional<Node> _node;
    int _polls_on_node = 0;
    int _node_failures = 0;
    std::set<std::string> _dropped;
    bool _can_start_jobs = true;
};

}  // namespace swarmsync::poller
