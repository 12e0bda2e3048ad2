#include "swarmsync/poller/poller.hpp"

#include <cstdio>
#include <stdexcept>
#include <string_view>

#include "swarmsync/errors.hpp"
#include "swarmsync/util.hpp"

namespace swarmsync::poller {

std::string format_seconds(std::chrono::milliseconds d) {
    auto ms = d.count();
    if (ms < 0)
        ms = 0;
    auto s = std::to_string(ms / 1000);
    if (auto frac = ms % 1000) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), ".%03d", static_cast<int>(frac));
        std::string f{buf};
        while (f.back() == '0')
            f.pop_back();
        s += f;
    }
    s += 's';
    return s;
}

namespace {

    // Clock skew and authorization problems will not go away by themselves and get logged louder
    // than failures that are expected to resolve on retry.
    LogLevel failure_level(const std::exception& e) {
        if (auto* req = dynamic_cast<const request_error*>(&e)) {
            if (req->kind() == RequestErrorKind::clock_out_of_sync ||
                req->kind() == RequestErrorKind::unauthorized)
                return LogLevel::error;
            return LogLevel::warning;
        }
        return LogLevel::error;
    }

}  // namespace

Poller::Poller(std::string target, Scheduler& scheduler, PollerOptions options) :
        _target{std::move(target)}, _scheduler{scheduler}, _options{std::move(options)} {}

Poller::~Poller() {
    std::lock_guard lock{_mutex};
    if (_timer)
        _scheduler.cancel(*_timer);
}

bool Poller::start_if_needed() {
    auto self = weak_from_this();
    if (self.expired())
        throw std::logic_error{
                "Poller::start_if_needed: " + name() + " is not owned by a std::shared_ptr"};

    {
        std::lock_guard lock{_mutex};
        if (_polling)
            return false;
        _polling = true;
        auto generation = ++_generation;
        _timer = _scheduler.post([self = std::move(self), generation] {
            if (auto p = self.lock())
                p->run_cycle(generation);
        });
    }
    log(LogLevel::info, "Started " + name() + ".");
    return true;
}

void Poller::stop() {
    {
        // Waits for a response that is being applied on another thread
        std::lock_guard apply_lock{_apply_mutex};
        std::lock_guard lock{_mutex};
        if (!_polling)
            return;
        _polling = false;
        ++_generation;
        if (_timer) {
            _scheduler.cancel(*_timer);
            _timer.reset();
        }
    }
    log(LogLevel::info, "Stopped " + name() + ".");
}

bool Poller::is_polling() const {
    std::lock_guard lock{_mutex};
    return _polling;
}

int Poller::failure_count() const {
    std::lock_guard lock{_mutex};
    return _failure_count;
}

int Poller::poll_count() const {
    std::lock_guard lock{_mutex};
    return _poll_count;
}

ErrorResponse Poller::handle_poll_error(const std::exception&, int) {
    return {};
}

int64_t Poller::now_ms() const {
    return _options.now_ms ? _options.now_ms() : get_timestamp_ms();
}

bool Poller::is_current(uint64_t generation) const {
    std::lock_guard lock{_mutex};
    return _polling && generation == _generation;
}

void Poller::schedule_cycle(uint64_t generation, std::chrono::milliseconds delay) {
    std::lock_guard lock{_mutex};
    if (!_polling || generation != _generation)
        return;
    _timer = _scheduler.schedule(delay, [self = weak_from_this(), generation] {
        if (auto p = self.lock())
            p->run_cycle(generation);
    });
}

void Poller::run_cycle(uint64_t generation) {
    {
        std::lock_guard lock{_mutex};
        if (!_polling || generation != _generation)
            return;
        _timer.reset();
    }

    auto started = std::chrono::steady_clock::now();
    auto elapsed = [&started] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
    };

    std::optional<PollResult> result;
    std::chrono::milliseconds delay{0};
    try {
        auto apply = poll();
        std::unique_lock apply_lock{_apply_mutex};
        if (!is_current(generation)) {
            apply_lock.unlock();
            log(LogLevel::debug, name() + " was stopped while polling; discarding the response.");
            return;
        }
        result = apply();
    } catch (const std::exception& e) {
        int failures;
        {
            std::lock_guard lock{_mutex};
            if (!_polling || generation != _generation) {
                log(LogLevel::debug,
                    name() + " was stopped while polling; ignoring error: " + e.what());
                return;
            }
            failures = ++_failure_count;
        }

        delay = next_poll_delay(failures);
        log(failure_level(e),
            name() + " failed to process any messages after " + format_seconds(elapsed()) +
                    " due to error: " + e.what() + ". Setting failure count to " +
                    std::to_string(failures) + ". Next poll in " + format_seconds(delay) + ".");

        auto response = handle_poll_error(e, failures);
        if (response.action == ErrorAction::stop_polling) {
            log(LogLevel::warning, name() + " will not poll again after error: " + e.what());
            stop();
            return;
        }
        if (response.action == ErrorAction::continue_polling_info)
            log(LogLevel::info, response.info);
    }

    if (result) {
        {
            std::lock_guard lock{_mutex};
            if (!_polling || generation != _generation) {
                log(LogLevel::debug, name() + " was stopped while processing its poll response.");
                return;
            }
            _failure_count = 0;
            ++_poll_count;
        }
        poll_succeeded(*result);

        delay = next_poll_delay(0);
        if (result->raw_message_count == 0) {
            log(LogLevel::info,
                "Received no new messages in " + name() + " after " + format_seconds(elapsed()) +
                        ". Next poll in " + format_seconds(delay) + ".");
        } else {
            std::string details;
            auto add_detail = [&details](std::string_view label, int count) {
                if (count <= 0)
                    return;
                details += details.empty() ? " (" : ", ";
                details += label;
                details += ": ";
                details += std::to_string(count);
            };
            add_detail("valid", result->valid_message_count);
            add_detail("invalid", result->invalid_message_count);
            add_detail("duplicates", result->duplicate_count());
            if (!details.empty())
                details += ')';

            std::string hash_note;
            if (result->valid_message_count == 0 && result->invalid_message_count == 0 &&
                !result->had_valid_hash_update)
                hash_note = " - marked the hash we polled with as invalid";

            log(LogLevel::info,
                "Received " + std::to_string(result->raw_message_count) +
                        " new message(s) in " + name() + " after " + format_seconds(elapsed()) +
                        details + hash_note + ". Next poll in " + format_seconds(delay) + ".");
        }
    }

    schedule_cycle(generation, delay);
}

}  // namespace swarmsync::poller
