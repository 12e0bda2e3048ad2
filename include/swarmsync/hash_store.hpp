#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>

#include "namespaces.hpp"

namespace swarmsync {

/// Persistence of the swarm poll cursors ("last hashes") and of the hashes of messages already
/// received, used for dedup.
class MessageHashStore {
  public:
    virtual ~MessageHashStore() = default;

    /// The last hash we received for `target` in namespace `ns` from node `node`, if any.
    virtual std::optional<std::string> last_hash(
            std::string_view target, Namespace ns, std::string_view node) const = 0;

    virtual void set_last_hash(
            std::string_view target, Namespace ns, std::string_view node, std::string hash) = 0;

    /// Drops the cursor so that the next poll refetches everything the node still has.
    virtual void invalidate_last_hash(
            std::string_view target, Namespace ns, std::string_view node) = 0;

    /// Records that a message hash has been received from `node`.  Returns false if it had
    /// already been recorded (from any node).
    virtual bool record_seen(
            std::string_view target,
            Namespace ns,
            std::string_view hash,
            std::string_view node) = 0;

    /// True if the hash has been recorded from any node.
    virtual bool seen(std::string_view target, Namespace ns, std::string_view hash) const = 0;

    /// True if the hash has been recorded from this particular node.
    virtual bool seen_from(
            std::string_view target,
            Namespace ns,
            std::string_view hash,
            std::string_view node) const = 0;

    /// Forgets everything recorded for a target (e.g. when leaving a group).
    virtual void clear(std::string_view target) = 0;
};

class MemoryMessageHashStore : public MessageHashStore {
  public:
    std::optional<std::string> last_hash(
            std::string_view target, Namespace ns, std::string_view node) const override;
    void set_last_hash(
            std::string_view target,
            Namespace ns,
            std::string_view node,
            std::string hash) override;
    void invalidate_last_hash(
            std::string_view target, Namespace ns, std::string_view node) override;
    bool record_seen(
            std::string_view target,
            Namespace ns,
            std::string_view hash,
            std::string_view node) override;
    bool seen(std::string_view target, Namespace ns, std::string_view hash) const override;
    bool seen_from(
            std::string_view target,
            Namespace ns,
            std::string_view hash,
            std::string_view node) const override;
    void clear(std::string_view target) override;

  private:
    using cursor_key = std::tuple<std::string, Namespace, std::string>;

    mutable std::mutex _mutex;
    std::map<cursor_key, std::string> _last_hashes;
    // (target, ns, hash) -> nodes the hash was received from
    std::map<cursor_key, std::set<std::string>> _seen;
};

}  // namespace swarmsync
