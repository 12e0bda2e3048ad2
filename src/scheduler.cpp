#include "swarmsync/scheduler.hpp"

namespace swarmsync {

using namespace std::literals;

ThreadScheduler::ThreadScheduler(unsigned int num_threads) {
    if (num_threads == 0)
        num_threads = 1;
    _workers.reserve(num_threads);
    for (unsigned int i = 0; i < num_threads; ++i)
        _workers.emplace_back([this] { worker_loop(); });
}

ThreadScheduler::~ThreadScheduler() {
    {
        std::lock_guard lock{_mutex};
        _stop = true;
        _tasks.clear();
        _due.clear();
    }
    _cv.notify_all();
    for (auto& w : _workers)
        if (w.joinable())
            w.join();
}

Scheduler::task_id ThreadScheduler::schedule(
        std::chrono::milliseconds delay, std::function<void()> fn) {
    task_id id;
    {
        std::lock_guard lock{_mutex};
        id = _next_id++;
        auto due = clock::now() + delay;
        _tasks.emplace(std::make_pair(due, id), std::move(fn));
        _due.emplace(id, due);
    }
    _cv.notify_one();
    return id;
}

bool ThreadScheduler::cancel(task_id id) {
    std::lock_guard lock{_mutex};
    auto it = _due.find(id);
    if (it == _due.end())
        return false;
    _tasks.erase({it->second, id});
    _due.erase(it);
    return true;
}

void ThreadScheduler::worker_loop() {
    std::unique_lock lock{_mutex};
    while (!_stop) {
        if (_tasks.empty()) {
            _cv.wait(lock);
            continue;
        }
        auto next = _tasks.begin();
        if (next->first.first > clock::now()) {
            _cv.wait_until(lock, next->first.first);
            continue;
        }
        auto fn = std::move(next->second);
        _due.erase(next->first.second);
        _tasks.erase(next);

        lock.unlock();
        fn();
        lock.lock();
    }
}

Scheduler::task_id ManualScheduler::schedule(
        std::chrono::milliseconds delay, std::function<void()> fn) {
    std::lock_guard lock{_mutex};
    auto id = _next_id++;
    auto due = _now + delay;
    _tasks.emplace(std::make_pair(due, id), std::move(fn));
    _due.emplace(id, due);
    return id;
}

bool ManualScheduler::cancel(task_id id) {
    std::lock_guard lock{_mutex};
    auto it = _due.find(id);
    if (it == _due.end())
        return false;
    _tasks.erase({it->second, id});
    _due.erase(it);
    return true;
}

bool ManualScheduler::pop_due(std::chrono::milliseconds until, std::function<void()>& fn) {
    std::lock_guard lock{_mutex};
    if (_tasks.empty())
        return false;
    auto next = _tasks.begin();
    if (next->first.first > until)
        return false;
    if (next->first.first > _now)
        _now = next->first.first;
    fn = std::move(next->second);
    _due.erase(next->first.second);
    _tasks.erase(next);
    return true;
}

size_t ManualScheduler::run_pending() {
    size_t count = 0;
    std::function<void()> fn;
    while (pop_due(now(), fn)) {
        fn();
        count++;
    }
    return count;
}

size_t ManualScheduler::advance(std::chrono::milliseconds by) {
    std::chrono::milliseconds until;
    {
        std::lock_guard lock{_mutex};
        until = _now + by;
    }
    size_t count = 0;
    std::function<void()> fn;
    while (pop_due(until, fn)) {
        fn();
        count++;
    }
    std::lock_guard lock{_mutex};
    _now = until;
    return count;
}

std::chrono::milliseconds ManualScheduler::now() const {
    std::lock_guard lock{_mutex};
    return _now;
}

size_t ManualScheduler::pending() const {
    std::lock_guard lock{_mutex};
    return _tasks.size();
}

std::chrono::milliseconds ManualScheduler::next_delay() const {
    std::lock_guard lock{_mutex};
    if (_tasks.empty())
        return -1ms;
    return _tasks.begin()->first.first - _now;
}

std::vector<std::chrono::milliseconds> ManualScheduler::pending_delays() const {
    std::lock_guard lock{_mutex};
    std::vector<std::chrono::milliseconds> result;
    for (auto& [key, fn] : _tasks)
        result.push_back(key.first - _now);
    return result;
}

}  // namespace swarmsync
