#include "swarmsync/config/local.hpp"

#include <stdexcept>

namespace swarmsync::config {

Local::Local(std::optional<ustring_view> dumped) : ConfigBase{dumped} {}

std::tuple<seqno_t, ustring, std::vector<std::string>> Local::push() {
    throw std::logic_error{"Local config settings are never pushed"};
}

void Local::set(std::string_view name, int64_t value) {
    set_field("", name, value);
}

void Local::set(std::string_view name, std::string value) {
    set_field("", name, std::move(value));
}

std::optional<int64_t> Local::get_int(std::string_view name) const {
    return _data.get_int("", name);
}

std::optional<std::string> Local::get_string(std::string_view name) const {
    return _data.get_string("", name);
}

bool Local::erase(std::string_view name) {
    return set_field("", name, std::nullopt);
}

std::map<std::string, scalar> Local::settings() const {
    std::map<std::string, scalar> result;
    if (auto* fields = _data.record_fields(""))
        for (auto& [name, fv] : *fields)
            if (fv.value)
                result.emplace(name, *fv.value);
    return result;
}

std::string Local::event_key(std::string_view, std::string_view field) const {
    return "local." + std::string{field};
}

}  // namespace swarmsync::config
