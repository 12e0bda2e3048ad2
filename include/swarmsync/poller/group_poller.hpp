#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

#include "swarm_poller.hpp"

namespace swarmsync::poller {

/// Polls a group's swarm.  The interval depends on how active the group is: it goes from
/// MIN_POLL_INTERVAL right after a message was received (or the conversation was read) up to
/// MAX_POLL_INTERVAL after ACTIVITY_LIMIT without activity.  A random node is picked for every
/// poll.
class GroupPoller : public SwarmPoller {
  public:
    static constexpr auto MIN_POLL_INTERVAL = std::chrono::seconds{3};
    static constexpr auto MAX_POLL_INTERVAL = std::chrono::seconds{30};
    static constexpr auto ACTIVITY_LIMIT = std::chrono::hours{12};

    // Assumed age of the last activity when there is no message and no read marker yet.
    static constexpr auto DEFAULT_INACTIVITY = std::chrono::minutes{5};

    /// The namespaces polled for a group: the group namespaces for "03" groups, the legacy closed
    /// group namespace for anything else.
    static std::vector<Namespace> namespaces_for(std::string_view group_id);

    /// API: poller/GroupPoller::activity_delay
    ///
    /// The poll interval after `since_activity` without activity:
    ///
    ///     MIN + (MAX - MIN) * min(since_activity, ACTIVITY_LIMIT) / ACTIVITY_LIMIT
    static std::chrono::milliseconds activity_delay(std::chrono::milliseconds since_activity);

    GroupPoller(
            std::string group_id,
            Scheduler& scheduler,
            SwarmCollaborators collaborators,
            PollerOptions options = {});

    /// The interval depends on the time since the last message or read marker of the group
    /// conversation (whichever is more recent), not on the failure count.
    std::chrono::milliseconds next_poll_delay(int failure_count) const override;

    /// Server timestamp of the newest group message received by this poller (0 if none).
    int64_t last_message_timestamp() const { return _last_message_ms; }

  protected:
    void response_applied(const PollResponse& response) override;

  private:
    std::atomic<int64_t> _last_message_ms{0};
};

}  // namespace swarmsync::poller
