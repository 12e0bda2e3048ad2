#include "swarmsync/poller/result_processor.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <utility>
#include <vector>

#include "swarmsync/errors.hpp"
#include "swarmsync/namespaces.hpp"

namespace swarmsync::poller {

ResultProcessor::ResultProcessor(
        MessageHashStore& hashes, Crypto& crypto, ConfigStore& store, JobDispatcher& dispatcher) :
        _hashes{hashes}, _crypto{crypto}, _store{store}, _dispatcher{dispatcher} {}

PollResult ResultProcessor::process(
        std::string_view target,
        const Node& node,
        const PollResponse& response,
        bool can_start_jobs) {
    PollResult result;

    std::vector<std::pair<Namespace, const std::vector<SwarmMessage>*>> sorted;
    for (auto& [ns, messages] : response) {
        if (messages.empty())
            continue;
        sorted.emplace_back(ns, &messages);
        result.raw_message_count += static_cast<int>(messages.size());
    }
    if (result.raw_message_count == 0)
        return result;

    std::stable_sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
        return processing_order(a.first) < processing_order(b.first);
    });

    std::string tgt{target};
    std::vector<ConfigMessage> deferred_configs;
    // conversation id -> messages, in the order the conversations first appear
    std::vector<std::pair<std::string, std::vector<DecodedMessage>>> conversations;

    for (auto& [ns, messages] : sorted) {
        int ns_used = 0;
        bool ns_hash_update = false;
        std::vector<ConfigMessage> configs;

        for (auto& msg : *messages) {
            try {
                if (should_dedupe(ns)) {
                    if (_hashes.seen_from(target, ns, msg.hash, node.pubkey))
                        throw message_error{MessageErrorKind::duplicate_message};
                    if (_hashes.seen(target, ns, msg.hash)) {
                        _hashes.record_seen(target, ns, msg.hash, node.pubkey);
                        throw message_error{MessageErrorKind::duplicate_message_new_node};
                    }
                }

                if (is_config_namespace(ns)) {
                    configs.push_back(ConfigMessage{ns, msg.hash, msg.data, msg.timestamp_ms});
                } else {
                    auto decoded = _crypto.decode_envelope(target, ns, msg);
                    decoded.hash = msg.hash;
                    decoded.ns = ns;
                    if (decoded.server_timestamp_ms == 0)
                        decoded.server_timestamp_ms = msg.timestamp_ms;
                    if (decoded.conversation_id.empty())
                        decoded.conversation_id = tgt;

                    auto it = std::find_if(
                            conversations.begin(), conversations.end(), [&](const auto& c) {
                                return c.first == decoded.conversation_id;
                            });
                    if (it == conversations.end())
                        it = conversations.emplace(
                                conversations.end(),
                                decoded.conversation_id,
                                std::vector<DecodedMessage>{});
                    it->second.push_back(std::move(decoded));
                }

                if (should_dedupe(ns))
                    _hashes.record_seen(target, ns, msg.hash, node.pubkey);
                _hashes.set_last_hash(target, ns, node.pubkey, msg.hash);
                ns_hash_update = true;
                ++ns_used;
                ++result.valid_message_count;
            } catch (const message_error& e) {
                if (e.updates_last_hash()) {
                    _hashes.set_last_hash(target, ns, node.pubkey, msg.hash);
                    ns_hash_update = true;
                }
                if (!e.is_expected_noise()) {
                    ++ns_used;
                    ++result.invalid_message_count;
                    log(LogLevel::error,
                        "Failed to deserialize envelope due to error: " + std::string{e.what()});
                }
            } catch (const std::runtime_error& e) {
                ++ns_used;
                ++result.invalid_message_count;
                log(LogLevel::error,
                    "Failed to deserialize envelope due to error: " + std::string{e.what()});
            }
        }

        if (ns_hash_update)
            result.had_valid_hash_update = true;
        else if (ns_used == 0) {
            log(LogLevel::debug,
                "Only duplicates in " + namespace_name(ns) + " of " + tgt + " from " +
                        node.pubkey + "; invalidating the last hash");
            _hashes.invalidate_last_hash(target, ns, node.pubkey);
        }

        if (configs.empty())
            continue;

        if (handle_synchronously(ns)) {
            // Contract violations (e.g. configs of the group were never loaded) propagate and
            // fail the poll.
            try {
                _store.handle_config_messages(target, configs);
            } catch (const std::runtime_error& e) {
                log(LogLevel::error,
                    "Failed to handle processed config message in " + tgt +
                            " due to error: " + e.what() + ".");
            }
        } else {
            std::move(configs.begin(), configs.end(), std::back_inserter(deferred_configs));
        }
    }

    // Config jobs go first: the messages may refer to conversations the configs create.
    if (!deferred_configs.empty()) {
        ReceiveJob job;
        job.kind = ReceiveJob::Kind::config_messages;
        job.target = tgt;
        job.conversation_id = tgt;
        job.configs = std::move(deferred_configs);
        _dispatcher.enqueue(std::move(job), can_start_jobs);
    }

    for (auto& [conversation, decoded] : conversations) {
        ReceiveJob job;
        job.kind = ReceiveJob::Kind::messages;
        job.target = tgt;
        job.conversation_id = conversation;
        job.messages = std::move(decoded);
        _dispatcher.enqueue(std::move(job), can_start_jobs);
    }

    return result;
}

}  // namespace swarmsync::poller
