#include "swarmsync/poller/swarm_poller.hpp"

#include "swarmsync/errors.hpp"
#include "swarmsync/random.hpp"
#include "swarmsync/util.hpp"

namespace swarmsync::poller {

SwarmPoller::SwarmPoller(
        std::string swarm_pubkey,
        std::vector<Namespace> namespaces,
        Scheduler& scheduler,
        SwarmCollaborators collaborators,
        PollerOptions options) :
        Poller{std::move(swarm_pubkey), scheduler, std::move(options)},
        _collab{collaborators},
        _namespaces{std::move(namespaces)},
        _processor{
                collaborators.hashes,
                collaborators.crypto,
                collaborators.store,
                collaborators.dispatcher} {
    _processor.logger = [this](LogLevel lvl, std::string msg) { log(lvl, std::move(msg)); };
}

std::optional<Node> SwarmPoller::current_node() const {
    std::lock_guard lock{_node_mutex};
    return _node;
}

std::set<std::string> SwarmPoller::dropped_nodes() const {
    std::lock_guard lock{_node_mutex};
    return _dropped;
}

Node SwarmPoller::node_for_polling() {
    const int max_polls = options().max_node_poll_count;
    {
        std::lock_guard lock{_node_mutex};
        if (_node && max_polls > 0 && _polls_on_node < max_polls)
            return *_node;
    }

    auto swarm = _collab.client.get_swarm(target());

    std::lock_guard lock{_node_mutex};
    std::vector<const Node*> candidates;
    auto collect = [&](bool skip_current) {
        for (auto& n : swarm)
            if (!_dropped.count(n.pubkey) && !(skip_current && _node && n == *_node))
                candidates.push_back(&n);
    };

    // Rotating after max_polls successful polls means moving to a different node, if there is one.
    collect(max_polls > 0);
    if (candidates.empty())
        collect(false);
    if (candidates.empty() && !swarm.empty()) {
        log(LogLevel::warning,
            "Every node of the swarm of " + name() + " has been dropped; starting over");
        _dropped.clear();
        collect(false);
    }
    if (candidates.empty())
        throw request_error{
                RequestErrorKind::ran_out_of_nodes, "no swarm nodes known for " + target()};

    const Node& picked = *candidates[random::uniform(static_cast<uint32_t>(candidates.size()))];
    if (!_node || picked != *_node) {
        _polls_on_node = 0;
        _node_failures = 0;
    }
    _node = picked;
    return picked;
}

PollRequest SwarmPoller::build_request(const Node& node) {
    PollRequest req;
    req.swarm_pubkey = target();
    req.namespaces = _namespaces;
    req.timestamp_ms = now_ms();
    req.max_sizes = max_size_map(_namespaces);
    req.refresh_hashes = _collab.store.current_hashes(target());

    for (auto ns : _namespaces) {
        if (auto hash = _collab.hashes.last_hash(target(), ns, node.pubkey))
            req.last_hashes.emplace(ns, std::move(*hash));
        if (requires_read_auth(ns)) {
            auto to_sign = "retrieve" + verification_string(ns) + std::to_string(req.timestamp_ms);
            req.signatures.emplace(ns, _collab.crypto.sign(target(), to_unsigned_sv(to_sign)));
        }
    }
    return req;
}

Poller::Apply SwarmPoller::poll() {
    auto node = node_for_polling();
    auto request = build_request(node);
    auto response = _collab.client.poll(node, request);

    bool can_start;
    {
        std::lock_guard lock{_node_mutex};
        can_start = _can_start_jobs;
    }

    return [this,
            node = std::move(node),
            cursors = std::move(request.last_hashes),
            response = std::move(response),
            can_start]() -> PollResult {
        // If a cursor was reset or moved while the request was in flight, the response no longer
        // lines up with what we have: drop it and let the next cycle fetch again.
        for (auto ns : _namespaces) {
            auto it = cursors.find(ns);
            std::optional<std::string> polled_with;
            if (it != cursors.end())
                polled_with = it->second;
            if (_collab.hashes.last_hash(target(), ns, node.pubkey) != polled_with) {
                log(LogLevel::warning,
                    name() + ": the last hash of " + namespace_name(ns) +
                            " changed while polling; ignoring the response of " + node.pubkey);
                return PollResult{};
            }
        }

        auto result = _processor.process(target(), node, response, can_start);
        response_applied(response);
        return result;
    };
}

ErrorResponse SwarmPoller::handle_poll_error(const std::exception& e, int) {
    std::lock_guard lock{_node_mutex};
    auto* req = dynamic_cast<const request_error*>(&e);

    if (req && req->is_fatal_for_cycle())
        return {};

    if (!_node)
        return {};

    if (req && req->is_retryable()) {
        if (++_node_failures < options().max_failures_before_drop)
            return {};

        auto dropped = _node->pubkey;
        _dropped.insert(dropped);
        _node.reset();
        return {ErrorAction::continue_polling_info,
                "Dropped node " + dropped + " from " + name() + " after " +
                        std::to_string(_node_failures) + " consecutive failures."};
    }

    // Anything else (bad response, authorization) moves on to another node without dropping this
    // one.
    _node.reset();
    return {};
}

void SwarmPoller::poll_succeeded(const PollResult&) {
    std::lock_guard lock{_node_mutex};
    ++_polls_on_node;
    _node_failures = 0;
}

}  // namespace swarmsync::poller
