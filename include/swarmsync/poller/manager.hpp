#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "../log.hpp"
#include "../storage.hpp"
#include "community_poller.hpp"
#include "poller.hpp"
#include "swarm_poller.hpp"

namespace swarmsync::poller {

/// Owns the pollers of a family of targets (the groups, or the community servers), one per target,
/// keyed by the lower-cased target id.
///
/// A poller is always stopped before it is removed, and is never left in the map once stopped by
/// the manager.  The map is guarded by its own mutex, held only for lookups, insertions and
/// removals; the set of polled targets is published separately (`targets_being_polled`) so that
/// observers never contend with the manager's own bookkeeping.
class PollerManager {
  public:
    using Factory = std::function<std::shared_ptr<Poller>(const std::string& target)>;
    using TargetSource = std::function<std::vector<std::string>()>;

    /// `factory` creates the poller of a (lower-cased) target; `targets` lists the targets
    /// `start_all` starts polling.
    PollerManager(Factory factory, TargetSource targets);

    /// Stops every poller.
    ~PollerManager();

    PollerManager(const PollerManager&) = delete;
    PollerManager& operator=(const PollerManager&) = delete;

    /// Manager of the pollers of the groups with loaded configs (i.e. joined, not just invited).
    static std::unique_ptr<PollerManager> for_groups(
            Scheduler& scheduler, SwarmCollaborators collaborators);

    /// Manager of the pollers of the community servers that have rooms in local storage.
    static std::unique_ptr<PollerManager> for_communities(
            Scheduler& scheduler,
            CommunityClient& client,
            Storage& storage,
            JobDispatcher& dispatcher);

    /// Logger for the manager; pollers created from now on get a copy of it, so they may keep
    /// logging after the manager is gone.
    Logger logger;

    void log(LogLevel lvl, std::string msg) const {
        if (logger)
            logger(lvl, std::move(msg));
    }

    /// API: poller/PollerManager::start_all
    ///
    /// Creates (if needed) and starts the poller of every target listed by the target source.
    void start_all();

    /// API: poller/PollerManager::get_or_create_poller
    ///
    /// Returns the poller of `target`, creating it (not started) if there is none yet.  Target ids
    /// are case-insensitive.  The new poller gets a copy of `logger`.
    std::shared_ptr<Poller> get_or_create_poller(std::string_view target);

    /// Returns the poller of `target`, or nullptr.
    std::shared_ptr<Poller> poller(std::string_view target) const;

    /// API: poller/PollerManager::stop_and_remove_poller
    ///
    /// Stops the poller of `target` and then forgets it.  Does nothing if there is none.
    void stop_and_remove_poller(std::string_view target);

    /// API: poller/PollerManager::stop_and_remove_all_pollers
    void stop_and_remove_all_pollers();

    /// API: poller/PollerManager::targets_being_polled
    ///
    /// Snapshot of the (lower-cased) targets that currently have a poller.
    std::set<std::string> targets_being_polled() const;

  private:
    // Republishes the target snapshot; called with `_mutex` held.
    void publish_targets();

    Factory _factory;
    TargetSource _targets;

    mutable std::mutex _mutex;
    std::map<std::string, std::shared_ptr<Poller>, std::less<>> _pollers;

    mutable std::mutex _snapshot_mutex;
    std::set<std::string> _snapshot;
};

}  // namespace swarmsync::poller
