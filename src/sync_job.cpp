#include "swarmsync/sync_job.hpp"

#include <algorithm>

#include "swarmsync/random.hpp"
#include "swarmsync/util.hpp"

namespace swarmsync {

ConfigSyncJob::ConfigSyncJob(ConfigStore& store, SwarmClient& client, std::string identity) :
        _store{store}, _client{client}, _identity{std::move(identity)} {}

bool ConfigSyncJob::run() {
    _store.sync_started(_identity);

    PendingPushes pending;
    try {
        pending = _store.pending_pushes(_identity);
    } catch (const std::exception& e) {
        _store.log(
                LogLevel::error,
                "ConfigSyncJob: unable to collect pushes for " + _identity + ": " + e.what());
        return false;
    }

    if (pending.empty()) {
        _store.log(LogLevel::debug, "ConfigSyncJob: nothing to push for " + _identity);
        return true;
    }

    try {
        auto swarm = _client.get_swarm(_identity);
        if (swarm.empty())
            throw request_error{
                    RequestErrorKind::ran_out_of_nodes, "no swarm nodes known for " + _identity};
        auto& node = swarm[random::uniform(static_cast<uint32_t>(swarm.size()))];

        auto timestamp = std::chrono::milliseconds{get_timestamp_ms()};
        auto push = _store.prepare_push(pending, timestamp);
        auto response = _client.send(node, _identity, push.payload);
        auto results = _store.handle_push_response(_identity, push, response, timestamp.count());

        _store.log(
                LogLevel::info,
                "ConfigSyncJob: stored " + std::to_string(results.size()) + " of " +
                        std::to_string(pending.pushes.size()) + " config message(s) for " +
                        _identity);
        return results.size() == pending.pushes.size();
    } catch (const request_error& e) {
        _store.log(
                e.kind() == RequestErrorKind::clock_out_of_sync ? LogLevel::error
                                                                : LogLevel::warning,
                "ConfigSyncJob: push for " + _identity + " failed (" + to_string(e.kind()) +
                        "): " + e.what());
    } catch (const std::exception& e) {
        _store.log(
                LogLevel::error, "ConfigSyncJob: push for " + _identity + " failed: " + e.what());
    }
    return false;
}

}  // namespace swarmsync
