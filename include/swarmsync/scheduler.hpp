#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace swarmsync {

/// Runs tasks after a delay.  Pollers schedule their next cycle through this, and the config
/// store schedules its detached push jobs through it.
class Scheduler {
  public:
    using task_id = uint64_t;
    using clock = std::chrono::steady_clock;

    virtual ~Scheduler() = default;

    /// Schedules `fn` to run once after `delay`; returns an id that can be passed to `cancel`.
    virtual task_id schedule(std::chrono::milliseconds delay, std::function<void()> fn) = 0;

    /// Schedules `fn` to run as soon as possible.
    task_id post(std::function<void()> fn) {
        return schedule(std::chrono::milliseconds{0}, std::move(fn));
    }

    /// Cancels a scheduled task.  Returns false if the task already ran (or is running) or was
    /// already cancelled.
    virtual bool cancel(task_id id) = 0;
};

/// Scheduler backed by a pool of worker threads sharing one timer queue.
class ThreadScheduler final : public Scheduler {
  public:
    explicit ThreadScheduler(unsigned int num_threads = 1);

    /// Stops the workers; tasks that have not started yet are dropped.
    ~ThreadScheduler() override;

    ThreadScheduler(const ThreadScheduler&) = delete;
    ThreadScheduler& operator=(const ThreadScheduler&) = delete;

    task_id schedule(std::chrono::milliseconds delay, std::function<void()> fn) override;
    bool cancel(task_id id) override;

  private:
    void worker_loop();

    std::mutex _mutex;
    std::condition_variable _cv;
    // (due, id) -> task; ids are increasing so equal deadlines run in scheduling order.
    std::map<std::pair<clock::time_point, task_id>, std::function<void()>> _tasks;
    std::map<task_id, clock::time_point> _due;
    task_id _next_id = 1;
    bool _stop = false;
    std::vector<std::thread> _workers;
};

/// Deterministic scheduler driven by hand: time only moves when `advance` is called, and tasks
/// only run from `run_pending`/`advance`, on the calling thread.
class ManualScheduler final : public Scheduler {
  public:
    task_id schedule(std::chrono::milliseconds delay, std::function<void()> fn) override;
    bool cancel(task_id id) override;

    /// Runs every task that is due at the current (virtual) time, including tasks that become due
    /// because of tasks run here.  Returns the number of tasks run.
    size_t run_pending();

    /// Moves the virtual clock forward by `by`, running due tasks in deadline order.  Returns the
    /// number of tasks run.
    size_t advance(std::chrono::milliseconds by);

    /// Number of tasks waiting to run.
    size_t pending() const;

    /// Delay until the earliest pending task, relative to the current virtual time, or -1ms if
    /// nothing is pending.
    std::chrono::milliseconds next_delay() const;

    /// Delays of all pending tasks, relative to the current virtual time, in deadline order.
    std::vector<std::chrono::milliseconds> pending_delays() const;

    /// Current virtual time; safe to read while another thread advances the clock.
    std::chrono::milliseconds now() const;

  private:
    // Pops the next task due at or before `until`, if any.
    bool pop_due(std::chrono::milliseconds until, std::function<void()>& fn);

    mutable std::mutex _mutex;
    std::chrono::milliseconds _now{0};
    std::map<std::pair<std::chrono::milliseconds, task_id>, std::function<void()>> _tasks;
    std::map<task_id, std::chrono::milliseconds> _due;
    task_id _next_id = 1;
};

}  // namespace swarmsync
