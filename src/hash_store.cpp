#include "swarmsync/hash_store.hpp"

#include <iterator>

namespace swarmsync {

namespace {
    std::tuple<std::string, Namespace, std::string> make_key(
            std::string_view a, Namespace ns, std::string_view b) {
        return {std::string{a}, ns, std::string{b}};
    }
}  // namespace

std::optional<std::string> MemoryMessageHashStore::last_hash(
        std::string_view target, Namespace ns, std::string_view node) const {
    std::lock_guard lock{_mutex};
    if (auto it = _last_hashes.find(make_key(target, ns, node)); it != _last_hashes.end())
        return it->second;
    return std::nullopt;
}

void MemoryMessageHashStore::set_last_hash(
        std::string_view target, Namespace ns, std::string_view node, std::string hash) {
    std::lock_guard lock{_mutex};
    _last_hashes[make_key(target, ns, node)] = std::move(hash);
}

void MemoryMessageHashStore::invalidate_last_hash(
        std::string_view target, Namespace ns, std::string_view node) {
    std::lock_guard lock{_mutex};
    _last_hashes.erase(make_key(target, ns, node));
}

bool MemoryMessageHashStore::record_seen(
        std::string_view target, Namespace ns, std::string_view hash, std::string_view node) {
    std::lock_guard lock{_mutex};
    auto& nodes = _seen[make_key(target, ns, hash)];
    bool fresh = nodes.empty();
    nodes.emplace(node);
    return fresh;
}

bool MemoryMessageHashStore::seen(
        std::string_view target, Namespace ns, std::string_view hash) const {
    std::lock_guard lock{_mutex};
    return _seen.count(make_key(target, ns, hash)) > 0;
}

bool MemoryMessageHashStore::seen_from(
        std::string_view target,
        Namespace ns,
        std::string_view hash,
        std::string_view node) const {
    std::lock_guard lock{_mutex};
    auto it = _seen.find(make_key(target, ns, hash));
    return it != _seen.end() && it->second.count(std::string{node}) > 0;
}

void MemoryMessageHashStore::clear(std::string_view target) {
    std::lock_guard lock{_mutex};
    for (auto it = _last_hashes.begin(); it != _last_hashes.end();)
        it = std::get<0>(it->first) == target ? _last_hashes.erase(it) : std::next(it);
    for (auto it = _seen.begin(); it != _seen.end();)
        it = std::get<0>(it->first) == target ? _seen.erase(it) : std::next(it);
}

}  // namespace swarmsync
