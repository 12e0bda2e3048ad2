#pragma once

#include <string>
#include <vector>

#include "crypto.hpp"
#include "store.hpp"

namespace swarmsync {

/// Processing of polled items that is deferred to the application's job queue.
struct ReceiveJob {
    enum class Kind {
        // Config messages of `target`, to be merged with `ConfigStore::handle_config_messages`
        config_messages,
        // Decoded regular messages of one conversation
        messages,
    };

    Kind kind;

    // The swarm (user or group id) or community server the items were polled from.
    std::string target;

    // For `messages` jobs: the conversation all the messages belong to.
    std::string conversation_id;

    std::vector<ConfigMessage> configs;
    std::vector<DecodedMessage> messages;

    size_t size() const { return kind == Kind::config_messages ? configs.size() : messages.size(); }
};

/// The application's job queue.
class JobDispatcher {
  public:
    virtual ~JobDispatcher() = default;

    /// API: jobs/JobDispatcher::enqueue
    ///
    /// Queues a job.  If `can_start_immediately` is false the job must be persisted and run later
    /// (e.g. because the app is in the background).
    virtual void enqueue(ReceiveJob job, bool can_start_immediately) = 0;
};

/// API: jobs/run_config_job
///
/// Runs a `config_messages` job against the config store.  Throws std::invalid_argument for any
/// other kind of job.
///
/// Outputs:
/// - the timestamp of the newest merged message, per variant (see
///   `ConfigStore::handle_config_messages`).
std::map<config::ConfigVariant, int64_t> run_config_job(ConfigStore& store, const ReceiveJob& job);

}  // namespace swarmsync
