#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "../jobs.hpp"
#include "../network.hpp"
#include "../storage.hpp"
#include "poller.hpp"

namespace swarmsync::poller {

/// Polls the rooms of one community server.  The rooms polled are the community threads of the
/// server in local storage ("<server>/<room>" ids); for each room only messages newer than the
/// last seqno received are requested.
///
/// Error recovery:
/// - a `missing_capability` failure (the server wants blinded authentication) triggers one
///   capabilities request; when it succeeds the following polls authenticate blinded.  The repair
///   is attempted once until a poll succeeds again.
/// - past MAX_HIDDEN_ROOM_FAILURE_COUNT consecutive failures, rooms the user has hidden are
///   removed locally: they were most likely added by another device and will keep failing, with
///   no way for the user to remove them.  The removal is not synced, so a device on which the room
///   works keeps it.
class CommunityPoller : public Poller {
  public:
    static constexpr auto MIN_POLL_INTERVAL = std::chrono::seconds{3};
    static constexpr auto MAX_POLL_INTERVAL = std::chrono::hours{1};
    static constexpr int MAX_HIDDEN_ROOM_FAILURE_COUNT = 10;

    CommunityPoller(
            std::string server,
            Scheduler& scheduler,
            CommunityClient& client,
            Storage& storage,
            JobDispatcher& dispatcher,
            PollerOptions options = {});

    /// API: poller/CommunityPoller::next_poll_delay
    ///
    /// MIN_POLL_INTERVAL without failures, `min(MAX_POLL_INTERVAL, MIN_POLL_INTERVAL +
    /// 2^failures seconds)` otherwise.
    std::chrono::milliseconds next_poll_delay(int failure_count) const override;

    /// Room tokens of the server currently in local storage.
    std::vector<std::string> rooms() const;

    /// The newest message seqno received from a room (0 if none).
    int64_t last_seqno(std::string_view room) const;

    /// True once a capability repair switched the poller to blinded authentication.
    bool blinded() const;

    std::vector<std::string> capabilities() const;

    /// API: poller/CommunityPoller::set_can_start_jobs
    ///
    /// Whether the jobs created from poll results may start right away; see
    /// SwarmPoller::set_can_start_jobs.
    void set_can_start_jobs(bool can_start) {
        std::lock_guard lock{_state_mutex};
        _can_start_jobs = can_start;
    }

  protected:
    Apply poll() override;

    ErrorResponse handle_poll_error(const std::exception& e, int failure_count) override;

    void poll_succeeded(const PollResult& result) override;

  private:
    // Removes the hidden rooms of the server from local storage; returns their tokens, sorted.
    std::vector<std::string> prune_hidden_rooms();

    std::string conversation_id(std::string_view room) const;

    CommunityClient& _client;
    Storage& _storage;
    JobDispatcher& _dispatcher;

    mutable std::mutex _state_mutex;
    std::map<std::string, int64_t, std::less<>> _seqnos;
    bool _blinded = false;
    bool _repair_attempted = false;
    bool _can_start_jobs = true;
    std::vector<std::string> _capabilities;
};

}  // namespace swarmsync::poller
