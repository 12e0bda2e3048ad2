#include "swarmsync/poller/user_poller.hpp"

#include <algorithm>
#include <cmath>

namespace swarmsync::poller {

namespace {
    PollerOptions user_options(PollerOptions options) {
        if (options.name.empty())
            options.name = "UserPoller";
        if (options.max_node_poll_count == 0)
            options.max_node_poll_count = UserPoller::MAX_NODE_POLL_COUNT;
        return options;
    }
}  // namespace

std::vector<Namespace> UserPoller::default_namespaces() {
    return {Namespace::Default,
            Namespace::UserProfile,
            Namespace::Contacts,
            Namespace::ConvoInfoVolatile,
            Namespace::UserGroups};
}

UserPoller::UserPoller(
        Scheduler& scheduler, SwarmCollaborators collaborators, PollerOptions options) :
        SwarmPoller{
                collaborators.store.user_id(),
                default_namespaces(),
                scheduler,
                collaborators,
                user_options(std::move(options))} {}

std::chrono::milliseconds UserPoller::next_poll_delay(int failure_count) const {
    if (failure_count <= 0)
        return MIN_POLL_INTERVAL;

    auto backoff = static_cast<int64_t>(std::llround(
            RETRY_INTERVAL.count() * static_cast<double>(failure_count) * BACKOFF_FACTOR));
    return std::min<std::chrono::milliseconds>(
            MAX_RETRY_INTERVAL, MIN_POLL_INTERVAL + std::chrono::milliseconds{backoff});
}

}  // namespace swarmsync::poller
