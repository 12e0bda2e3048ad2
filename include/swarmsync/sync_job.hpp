#pragma once

#include <chrono>
#include <string>

#include "network.hpp"
#include "store.hpp"

namespace swarmsync {

/// Pushes everything an identity has pending: collects the pending pushes, sends the signed
/// sequence request to a random node of the identity's swarm and confirms what was stored.
///
/// Failures are logged (through the store's logger) and reported by `run()` returning false; the
/// unconfirmed configs stay in the waiting state and are pushed again by the next job.
class ConfigSyncJob {
  public:
    // Delays between retries of a failed job: RETRY_BASE * 2^attempt.
    static constexpr auto RETRY_BASE = std::chrono::seconds{2};
    static constexpr int MAX_ATTEMPTS = 5;

    ConfigSyncJob(ConfigStore& store, SwarmClient& client, std::string identity);

    /// API: sync_job/ConfigSyncJob::run
    ///
    /// Runs the job once.
    ///
    /// Outputs:
    /// - true if there was nothing to push or every push was confirmed; false otherwise.
    bool run();

    const std::string& identity() const { return _identity; }

  private:
    ConfigStore& _store;
    SwarmClient& _client;
    std::string _identity;
};

}  // namespace swarmsync
