#include "swarmsync/poller/community_poller.hpp"

#include <algorithm>
#include <stdexcept>

#include "swarmsync/errors.hpp"
#include "swarmsync/util.hpp"

namespace swarmsync::poller {

CommunityPoller::CommunityPoller(
        std::string server,
        Scheduler& scheduler,
        CommunityClient& client,
        Storage& storage,
        JobDispatcher& dispatcher,
        PollerOptions options) :
        Poller{to_lower(server),
               scheduler,
               [&] {
                   if (options.name.empty())
                       options.name = "CommunityPoller-" + to_lower(server);
                   return std::move(options);
               }()},
        _client{client},
        _storage{storage},
        _dispatcher{dispatcher} {}

std::chrono::milliseconds CommunityPoller::next_poll_delay(int failure_count) const {
    using std::chrono::milliseconds;
    if (failure_count <= 0)
        return MIN_POLL_INTERVAL;
    // 2^12 seconds is already past the cap
    if (failure_count >= 12)
        return MAX_POLL_INTERVAL;
    return std::min<milliseconds>(
            MAX_POLL_INTERVAL,
            MIN_POLL_INTERVAL + std::chrono::seconds{int64_t{1} << failure_count});
}

std::string CommunityPoller::conversation_id(std::string_view room) const {
    std::string id;
    id.reserve(target().size() + 1 + room.size());
    id += target();
    id += '/';
    id += room;
    return id;
}

std::vector<std::string> CommunityPoller::rooms() const {
    std::vector<std::string> result;
    const auto prefix = target() + "/";
    _storage.read([&](const Transaction& tx) {
        for (auto& t : tx.threads())
            if (t.kind == ThreadKind::community && starts_with(t.id, prefix) &&
                t.id.size() > prefix.size())
                result.push_back(t.id.substr(prefix.size()));
    });
    return result;
}

int64_t CommunityPoller::last_seqno(std::string_view room) const {
    std::lock_guard lock{_state_mutex};
    auto it = _seqnos.find(room);
    return it == _seqnos.end() ? 0 : it->second;
}

bool CommunityPoller::blinded() const {
    std::lock_guard lock{_state_mutex};
    return _blinded;
}

std::vector<std::string> CommunityPoller::capabilities() const {
    std::lock_guard lock{_state_mutex};
    return _capabilities;
}

Poller::Apply CommunityPoller::poll() {
    CommunityPollRequest request;
    request.server = target();
    for (auto& room : rooms())
        request.rooms.emplace(std::move(room), 0);
    if (request.rooms.empty())
        throw std::runtime_error{"no rooms to poll on " + target()};

    bool can_start;
    {
        std::lock_guard lock{_state_mutex};
        for (auto& [room, seqno] : request.rooms)
            if (auto it = _seqnos.find(room); it != _seqnos.end())
                seqno = it->second;
        request.blinded = _blinded;
        can_start = _can_start_jobs;
    }

    auto response = _client.poll_rooms(request);

    return [this, response = std::move(response), can_start]() -> PollResult {
        PollResult result;
        for (auto& [room, messages] : response) {
            if (messages.empty())
                continue;
            result.raw_message_count += static_cast<int>(messages.size());
            result.had_valid_hash_update = true;

            int64_t newest;
            {
                std::lock_guard lock{_state_mutex};
                newest = _seqnos[room];
            }
            const int64_t known = newest;

            ReceiveJob job;
            job.kind = ReceiveJob::Kind::messages;
            job.target = target();
            job.conversation_id = conversation_id(room);
            for (auto& m : messages) {
                // Already received: the server repeats the boundary message after a timeout
                if (m.seqno <= known)
                    continue;
                DecodedMessage d;
                d.hash = std::to_string(m.seqno);
                d.conversation_id = job.conversation_id;
                d.sender = m.session_id;
                d.plaintext = m.data;
                d.sent_timestamp_ms = m.posted_ms;
                d.server_timestamp_ms = m.posted_ms;
                job.messages.push_back(std::move(d));
                newest = std::max(newest, m.seqno);
            }

            {
                std::lock_guard lock{_state_mutex};
                _seqnos[room] = newest;
            }

            if (job.messages.empty())
                continue;
            result.valid_message_count += static_cast<int>(job.messages.size());
            _dispatcher.enqueue(std::move(job), can_start);
        }
        return result;
    };
}

ErrorResponse CommunityPoller::handle_poll_error(const std::exception& e, int failure_count) {
    auto* req = dynamic_cast<const request_error*>(&e);
    if (req && req->kind() == RequestErrorKind::missing_capability) {
        bool attempt;
        {
            std::lock_guard lock{_state_mutex};
            attempt = !_repair_attempted;
            _repair_attempted = true;
        }
        if (attempt) {
            try {
                auto caps = _client.capabilities(target(), true);
                {
                    std::lock_guard lock{_state_mutex};
                    _capabilities = std::move(caps);
                    _blinded = true;
                }
                return {ErrorAction::continue_polling_info,
                        name() + " updated the capabilities of " + target() +
                                "; polling with blinded authentication."};
            } catch (const std::exception& err) {
                log(LogLevel::error,
                    name() + " failed to update capabilities due to error: " + err.what() + ".");
            }
        }
    }

    if (failure_count > MAX_HIDDEN_ROOM_FAILURE_COUNT) {
        auto removed = prune_hidden_rooms();
        if (!removed.empty()) {
            std::string list;
            for (auto& r : removed) {
                if (!list.empty())
                    list += ", ";
                list += r;
            }
            log(LogLevel::error,
                name() + " failure count surpassed " +
                        std::to_string(MAX_HIDDEN_ROOM_FAILURE_COUNT) + ", removed hidden rooms [" +
                        list + "].");
        }
    }
    return {};
}

void CommunityPoller::poll_succeeded(const PollResult&) {
    std::lock_guard lock{_state_mutex};
    _repair_attempted = false;
}

std::vector<std::string> CommunityPoller::prune_hidden_rooms() {
    std::vector<std::string> removed;
    const auto prefix = target() + "/";
    _storage.write([&](Transaction& tx) {
        removed.clear();
        for (auto& t : tx.threads()) {
            if (t.kind != ThreadKind::community || !starts_with(t.id, prefix) || t.priority >= 0)
                continue;
            tx.delete_thread(t.id);
            removed.push_back(t.id.substr(prefix.size()));
        }
    });

    {
        std::lock_guard lock{_state_mutex};
        for (auto& r : removed)
            if (auto it = _seqnos.find(r); it != _seqnos.end())
                _seqnos.erase(it);
    }
    std::sort(removed.begin(), removed.end());
    return removed;
}

}  // namespace swarmsync::poller
