#include "swarmsync/poller/group_poller.hpp"

#include <algorithm>

#include "swarmsync/config/convo_info_volatile.hpp"
#include "swarmsync/util.hpp"

namespace swarmsync::poller {

std::vector<Namespace> GroupPoller::namespaces_for(std::string_view group_id) {
    if (group_id.size() != 66 || !starts_with(group_id, "03"))
        return {Namespace::LegacyClosedGroup};

    return {Namespace::GroupMessages,
            Namespace::GroupInfo,
            Namespace::GroupMembers,
            Namespace::GroupKeys,
            Namespace::RevokedRetrievableGroupMessages};
}

std::chrono::milliseconds GroupPoller::activity_delay(std::chrono::milliseconds since_activity) {
    using std::chrono::milliseconds;
    const int64_t min = milliseconds{MIN_POLL_INTERVAL}.count();
    const int64_t max = milliseconds{MAX_POLL_INTERVAL}.count();
    const int64_t limit = milliseconds{ACTIVITY_LIMIT}.count();

    auto since = std::clamp<int64_t>(since_activity.count(), 0, limit);
    return milliseconds{min + (max - min) * since / limit};
}

GroupPoller::GroupPoller(
        std::string group_id,
        Scheduler& scheduler,
        SwarmCollaborators collaborators,
        PollerOptions options) :
        SwarmPoller{
                group_id,
                namespaces_for(group_id),
                scheduler,
                collaborators,
                [&] {
                    if (options.name.empty())
                        options.name = "GroupPoller-" + group_id;
                    return std::move(options);
                }()} {}

std::chrono::milliseconds GroupPoller::next_poll_delay(int) const {
    const auto now = now_ms();
    const auto fallback =
            now - std::chrono::duration_cast<std::chrono::milliseconds>(DEFAULT_INACTIVITY).count();

    int64_t last_read = _collab.store.read<config::ConvoInfoVolatile>(
            _collab.store.user_id(), [this](const config::ConvoInfoVolatile& convos) -> int64_t {
                auto c = convos.get_group(target());
                return c ? c->last_read : 0;
            });
    if (last_read <= 0)
        last_read = fallback;

    int64_t last_message = _last_message_ms;
    if (last_message <= 0)
        last_message = fallback;

    return activity_delay(std::chrono::milliseconds{now - std::max(last_read, last_message)});
}

void GroupPoller::response_applied(const PollResponse& response) {
    int64_t newest = _last_message_ms;
    for (auto& [ns, messages] : response) {
        if (is_config_namespace(ns))
            continue;
        for (auto& m : messages)
            newest = std::max(newest, m.timestamp_ms);
    }
    _last_message_ms = newest;
}

}  // namespace swarmsync::poller
