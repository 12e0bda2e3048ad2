#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "../log.hpp"
#include "../scheduler.hpp"

namespace swarmsync::poller {

struct PollerOptions {
    // Name used in log messages, e.g. "UserPoller" or "GroupPoller-03abcd".
    std::string name;

    // Number of successful polls made against one node before moving on to another one; 0 picks a
    // new node for every poll.  Only used by pollers that talk to a swarm.
    int max_node_poll_count = 0;

    // Number of consecutive retryable failures against one node after which the node is dropped.
    int max_failures_before_drop = 3;

    // Current unix time in milliseconds; defaults to the system clock.
    std::function<int64_t()> now_ms;
};

/// Counts describing what one poll cycle received.
struct PollResult {
    int raw_message_count = 0;
    int valid_message_count = 0;
    int invalid_message_count = 0;

    // True if at least one poll cursor was advanced (including by duplicates a new node served).
    bool had_valid_hash_update = false;

    int duplicate_count() const {
        return raw_message_count - valid_message_count - invalid_message_count;
    }
};

/// What a poller does after a failed cycle.
enum class ErrorAction {
    stop_polling,
    continue_polling,
    // Continue, logging the attached info message.
    continue_polling_info,
};

struct ErrorResponse {
    ErrorAction action = ErrorAction::continue_polling;
    std::string info;
};

/// Base class of the pollers: the recurring poll state machine of one target.
///
///     idle -> polling -> (success: wait -> polling) | (failure: backoff wait -> polling)
///
/// and `stop()` leads to `stopped` from any state.  Each cycle runs on the scheduler; a cycle
/// schedules the next one only once it has finished, so there is never more than one cycle of a
/// target in flight.  Stopping bumps a generation counter: a cycle that started before the stop
/// discards its response (and schedules nothing) when the response arrives.
///
/// Subclasses provide the network part of a cycle (`poll`), the backoff policy
/// (`next_poll_delay`) and any custom error recovery (`handle_poll_error`).
///
/// Pollers must be owned by a std::shared_ptr: scheduled cycles only hold a weak reference, so a
/// destroyed poller's pending cycle never runs.
class Poller : public std::enable_shared_from_this<Poller> {
  public:
    /// Applies the response obtained by `poll()`: processes the messages, advances cursors and
    /// hands jobs off.  Only called while the cycle that produced it is still current.
    using Apply = std::function<PollResult()>;

    Poller(std::string target, Scheduler& scheduler, PollerOptions options);
    virtual ~Poller();

    Poller(const Poller&) = delete;
    Poller& operator=(const Poller&) = delete;

    Logger logger;

    void log(LogLevel lvl, std::string msg) const {
        if (logger)
            logger(lvl, std::move(msg));
    }

    const std::string& target() const { return _target; }
    const std::string& name() const { return _options.name; }

    /// API: poller/Poller::start_if_needed
    ///
    /// Starts polling: marks the poller as polling and schedules a poll cycle to run right away.
    /// Does nothing if the poller is already polling, so concurrent and repeated calls result in
    /// a single chain of poll cycles.
    ///
    /// Throws std::logic_error if the poller is not owned by a std::shared_ptr.
    ///
    /// Outputs:
    /// - true if polling was started by this call.
    bool start_if_needed();

    /// API: poller/Poller::stop
    ///
    /// Stops polling: cancels the pending cycle, if any, and makes the result of a cycle that is
    /// currently in flight be discarded.  If a response is being applied on another thread, waits
    /// for it to finish; no response is applied once this returns.  Polling can be started again
    /// afterwards.
    void stop();

    bool is_polling() const;

    int failure_count() const;

    // Number of successful poll cycles since the poller was created.
    int poll_count() const;

    /// API: poller/Poller::next_poll_delay
    ///
    /// The delay before the next cycle after a cycle that left the failure count at
    /// `failure_count`.  Non-decreasing in `failure_count` and capped.
    virtual std::chrono::milliseconds next_poll_delay(int failure_count) const = 0;

  protected:
    /// The network part of a poll cycle; throws on failure.  Must not change any persistent state:
    /// everything the response changes goes into the returned `Apply`.
    virtual Apply poll() = 0;

    /// Custom handling of a failed cycle.  Called after the failure count has been incremented.
    virtual ErrorResponse handle_poll_error(const std::exception& e, int failure_count);

    // Hook called after a cycle succeeded, before the next one is scheduled.
    virtual void poll_succeeded(const PollResult&) {}

    int64_t now_ms() const;

    const PollerOptions& options() const { return _options; }

  private:
    // Runs one poll cycle if `generation` is still current.
    void run_cycle(uint64_t generation);

    // Schedules a cycle after `delay` if `generation` is still current.
    void schedule_cycle(uint64_t generation, std::chrono::milliseconds delay);

    bool is_current(uint64_t generation) const;

    const std::string _target;
    Scheduler& _scheduler;
    const PollerOptions _options;

    // Held from the final generation check until a response is applied.  Recursive so that
    // stop() can be called from within the apply step.
    std::recursive_mutex _apply_mutex;

    mutable std::mutex _mutex;
    bool _polling = false;
    uint64_t _generation = 0;
    int _failure_count = 0;
    int _poll_count = 0;
    std::optional<Scheduler::task_id> _timer;
};

/// Formats a duration in seconds the way the poll summaries print it, e.g. "3s" or "1.75s".
std::string format_seconds(std::chrono::milliseconds d);

}  // namespace swarmsync::poller
