#include "swarmsync/namespaces.hpp"

#include <algorithm>
#include <functional>

namespace swarmsync {

std::map<Namespace, int64_t> max_size_map(const std::vector<Namespace>& namespaces) {
    std::map<int64_t, std::vector<Namespace>, std::greater<>> by_priority;
    for (auto ns : namespaces)
        by_priority[size_priority(ns)].push_back(ns);

    std::map<Namespace, int64_t> result;
    if (by_priority.empty())
        return result;

    const int64_t lowest = by_priority.rbegin()->first;
    int64_t last_split = 1;
    for (auto& [priority, group] : by_priority) {
        last_split *= static_cast<int64_t>(group.size() + (priority == lowest ? 0 : 1));
        for (auto ns : group)
            result[ns] = -last_split;
    }
    return result;
}

}  // namespace swarmsync
