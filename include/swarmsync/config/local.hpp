#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "base.hpp"

namespace swarmsync::config {

/// Device-local settings.  These are kept in a config object so that they share the dump and
/// event machinery of the synced configs, but they are never pushed to (or merged from) the
/// swarm.  Settings live as fields of the single unnamed record "" and produce "local.<name>"
/// events.
class Local final : public ConfigBase {

  public:
    explicit Local(std::optional<ustring_view> dumped);

    ConfigVariant variant() const override { return ConfigVariant::Local; }

    const char* encryption_domain() const override { return "Local"; }

    /// Local configs never need a push.
    bool needs_push() const override { return false; }

    /// Throws std::logic_error: local settings cannot be pushed.
    std::tuple<seqno_t, ustring, std::vector<std::string>> push() override;

    void set(std::string_view name, int64_t value);
    void set(std::string_view name, std::string value);

    std::optional<int64_t> get_int(std::string_view name) const;
    std::optional<std::string> get_string(std::string_view name) const;

    /// Removes a setting; returns true if it was set.
    bool erase(std::string_view name);

    /// All current settings.
    std::map<std::string, scalar> settings() const;

  protected:
    std::string event_key(std::string_view rec, std::string_view field) const override;
};

}  // namespace swarmsync::config
