#pragma once

#include <string_view>

#include "../crypto.hpp"
#include "../hash_store.hpp"
#include "../jobs.hpp"
#include "../log.hpp"
#include "../network.hpp"
#include "../store.hpp"
#include "poller.hpp"

namespace swarmsync::poller {

/// Processing of the messages a swarm node returned for one poll, shared by the user and group
/// pollers.
///
/// Namespaces are handled in processing order.  Each message of a dedup namespace is checked
/// against the hashes seen before: a hash already received from the same node is a duplicate, one
/// received from another node is a duplicate that still advances the node's cursor.  Config
/// messages go to the config store (right away for namespaces handled synchronously, through a
/// config job otherwise); regular messages are opened by the crypto collaborator and handed to the
/// dispatcher as one job per conversation, queued after the config job.  A message that cannot be
/// opened is logged and dropped.
///
/// When a namespace returned messages that were all duplicates, the cursor we polled that
/// namespace with is invalidated so that the next poll fetches everything the node has.
class ResultProcessor {
  public:
    ResultProcessor(
            MessageHashStore& hashes,
            Crypto& crypto,
            ConfigStore& store,
            JobDispatcher& dispatcher);

    Logger logger;

    void log(LogLevel lvl, std::string msg) const {
        if (logger)
            logger(lvl, std::move(msg));
    }

    /// API: poller/ResultProcessor::process
    ///
    /// Processes a poll response of `target`'s swarm received from `node`.
    ///
    /// Inputs:
    /// - `target` -- the polled swarm (user or group id).
    /// - `node` -- the node the response came from; cursors and seen hashes are tracked per node.
    /// - `response` -- the messages, per namespace.
    /// - `can_start_jobs` -- passed to the dispatcher with every job.
    ///
    /// Outputs:
    /// - counts of the received, valid and invalid messages (the rest are duplicates).
    PollResult process(
            std::string_view target,
            const Node& node,
            const PollResponse& response,
            bool can_start_jobs = true);

  private:
    MessageHashStore& _hashes;
    Crypto& _crypto;
    ConfigStore& _store;
    JobDispatcher& _dispatcher;
};

}  // namespace swarmsync::poller
