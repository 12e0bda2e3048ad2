#pragma once

#include <chrono>
#include <vector>

#include "swarm_poller.hpp"

namespace swarmsync::poller {

/// Polls the user's own swarm: one-to-one messages and the user's config namespaces.
class UserPoller : public SwarmPoller {
  public:
    static constexpr auto MIN_POLL_INTERVAL = std::chrono::milliseconds{1500};
    static constexpr auto RETRY_INTERVAL = std::chrono::milliseconds{250};
    static constexpr double BACKOFF_FACTOR = 1.2;
    static constexpr auto MAX_RETRY_INTERVAL = std::chrono::seconds{15};
    static constexpr int MAX_NODE_POLL_COUNT = 6;

    static std::vector<Namespace> default_namespaces();

    /// Creates the poller of `collaborators.store`'s user.  `options.name` defaults to
    /// "UserPoller" and `options.max_node_poll_count` to MAX_NODE_POLL_COUNT when left empty/0.
    UserPoller(Scheduler& scheduler, SwarmCollaborators collaborators, PollerOptions options = {});

    /// API: poller/UserPoller::next_poll_delay
    ///
    /// MIN_POLL_INTERVAL without failures, then grows linearly with the failure count:
    /// `min(MAX_RETRY_INTERVAL, MIN_POLL_INTERVAL + RETRY_INTERVAL * failures * BACKOFF_FACTOR)`.
    std::chrono::milliseconds next_poll_delay(int failure_count) const override;
};

}  // namespace swarmsync::poller
