#pragma once

#include <string>
#include <vector>

namespace swarmsync {

/// A single semantic change, e.g. `{"contact.05ab....blocked", "1"}`.  Events are produced while
/// mutating or merging a config object, buffered, and only published once the change that caused
/// them has been committed to storage.
struct ObservedEvent {
    std::string key;
    std::string value;

    bool operator==(const ObservedEvent& o) const { return key == o.key && value == o.value; }
    bool operator!=(const ObservedEvent& o) const { return !(*this == o); }
};

using EventList = std::vector<ObservedEvent>;

}  // namespace swarmsync
