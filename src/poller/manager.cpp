#include "swarmsync/poller/manager.hpp"

#include <stdexcept>

#include "swarmsync/poller/group_poller.hpp"
#include "swarmsync/util.hpp"

namespace swarmsync::poller {

PollerManager::PollerManager(Factory factory, TargetSource targets) :
        _factory{std::move(factory)}, _targets{std::move(targets)} {
    if (!_factory)
        throw std::invalid_argument{"PollerManager: a poller factory is required"};
}

PollerManager::~PollerManager() {
    std::lock_guard lock{_mutex};
    for (auto& [target, p] : _pollers)
        p->stop();
}

std::unique_ptr<PollerManager> PollerManager::for_groups(
        Scheduler& scheduler, SwarmCollaborators collaborators) {
    return std::make_unique<PollerManager>(
            [&scheduler, collaborators](const std::string& group_id) -> std::shared_ptr<Poller> {
                return std::make_shared<GroupPoller>(group_id, scheduler, collaborators);
            },
            [&store = collaborators.store] { return store.group_ids(); });
}

std::unique_ptr<PollerManager> PollerManager::for_communities(
        Scheduler& scheduler,
        CommunityClient& client,
        Storage& storage,
        JobDispatcher& dispatcher) {
    return std::make_unique<PollerManager>(
            [&scheduler, &client, &storage, &dispatcher](
                    const std::string& server) -> std::shared_ptr<Poller> {
                return std::make_shared<CommunityPoller>(
                        server, scheduler, client, storage, dispatcher);
            },
            [&storage] {
                // Community thread ids are "<server>/<room>"; rooms never contain a '/'.
                std::set<std::string> servers;
                storage.read([&](const Transaction& tx) {
                    for (auto& t : tx.threads()) {
                        if (t.kind != ThreadKind::community)
                            continue;
                        if (auto pos = t.id.rfind('/'); pos != std::string::npos && pos > 0)
                            servers.insert(t.id.substr(0, pos));
                    }
                });
                return std::vector<std::string>{servers.begin(), servers.end()};
            });
}

void PollerManager::start_all() {
    auto targets = _targets ? _targets() : std::vector<std::string>{};
    for (auto& t : targets)
        get_or_create_poller(t)->start_if_needed();
    log(LogLevel::info, "Started " + std::to_string(targets.size()) + " poller(s)");
}

std::shared_ptr<Poller> PollerManager::get_or_create_poller(std::string_view target) {
    auto key = to_lower(target);
    std::lock_guard lock{_mutex};
    if (auto it = _pollers.find(key); it != _pollers.end())
        return it->second;

    auto p = _factory(key);
    if (!p)
        throw std::runtime_error{"PollerManager: the factory created no poller for " + key};
    p->logger = logger;
    _pollers.emplace(key, p);
    publish_targets();
    return p;
}

std::shared_ptr<Poller> PollerManager::poller(std::string_view target) const {
    auto key = to_lower(target);
    std::lock_guard lock{_mutex};
    auto it = _pollers.find(key);
    return it == _pollers.end() ? nullptr : it->second;
}

void PollerManager::stop_and_remove_poller(std::string_view target) {
    auto key = to_lower(target);
    std::lock_guard lock{_mutex};
    auto it = _pollers.find(key);
    if (it == _pollers.end())
        return;
    it->second->stop();
    _pollers.erase(it);
    publish_targets();
}

void PollerManager::stop_and_remove_all_pollers() {
    std::lock_guard lock{_mutex};
    for (auto& [target, p] : _pollers)
        p->stop();
    _pollers.clear();
    publish_targets();
}

std::set<std::string> PollerManager::targets_being_polled() const {
    std::lock_guard lock{_snapshot_mutex};
    return _snapshot;
}

void PollerManager::publish_targets() {
    std::set<std::string> targets;
    for (auto& [target, p] : _pollers)
        targets.insert(target);
    std::lock_guard lock{_snapshot_mutex};
    _snapshot = std::move(targets);
}

}  // namespace swarmsync::poller
