#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>
#include <vector>

#include "base.hpp"
#include "community.hpp"

namespace swarmsync::config {

using namespace std::literals;

/// Per-conversation read state that changes often and matters only for a while.  Records:
///
/// "1/<session_id>"       one-to-one conversations
/// "o/<base_url>/<room>"  community rooms (canonical url and room)
/// "g/<group_id>"         groups
///
/// with fields
///
///     r - last read message time, unix milliseconds (always written; 0 when nothing was read)
///     u - 1 when the user marked the conversation unread
///
/// Event keys: "convo.<id>.last_read" and "convo.<id>.unread", where <id> is the part of the
/// record name after the prefix.

class ConvoInfoVolatile;

namespace convo {

    struct base {
        int64_t last_read = 0;
        bool unread = false;

      protected:
        void load(const ConfigData& data, std::string_view rec);
    };

    struct one_to_one : base {
        std::string session_id;

        explicit one_to_one(std::string_view session_id);

        friend class swarmsync::config::ConvoInfoVolatile;
    };

    struct community : config::community, base {

        using config::community::community;

        friend class swarmsync::config::ConvoInfoVolatile;
    };

    struct group : base {
        std::string id;

        /// Throws std::invalid_argument unless `group_id` is "03" and 64 hex digits.
        explicit group(std::string_view group_id);

        friend class swarmsync::config::ConvoInfoVolatile;
    };

    using any = std::variant<one_to_one, community, group>;
}  // namespace convo

class ConvoInfoVolatile : public ConfigBase {

  public:
    ConvoInfoVolatile() = delete;

    ConvoInfoVolatile(ustring_view ed25519_secretkey, std::optional<ustring_view> dumped);

    ConfigVariant variant() const override { return ConfigVariant::ConvoInfoVolatile; }

    const char* encryption_domain() const override { return "ConvoInfoVolatile"; }

    /// Read times older than PRUNE_LOW are not stored by `set`; entries older than PRUNE_HIGH
    /// are removed on the next push.
    static constexpr auto PRUNE_LOW = 30 * 24h;
    static constexpr auto PRUNE_HIGH = 45 * 24h;

    /// API: convo_info_volatile/ConvoInfoVolatile::prune_stale
    ///
    /// Erases conversations read more than `prune` ago, unless marked unread, and returns how
    /// many went.
    size_t prune_stale(std::chrono::milliseconds prune = PRUNE_HIGH);

    /// Prunes before building the push.
    std::tuple<seqno_t, ustring, std::vector<std::string>> push() override;

    std::optional<convo::one_to_one> get_1to1(std::string_view session_id) const;

    std::optional<convo::community> get_community(
            std::string_view base_url, std::string_view room) const;

    std::optional<convo::group> get_group(std::string_view group_id) const;

    // Blank values for unknown conversations; nothing is stored until `set`.
    convo::one_to_one get_or_construct_1to1(std::string_view session_id) const;
    convo::community get_or_construct_community(
            std::string_view base_url, std::string_view room) const;
    convo::group get_or_construct_group(std::string_view group_id) const;

    /// API: convo_info_volatile/ConvoInfoVolatile::set
    ///
    /// Stores the conversation.  A last read time older than PRUNE_LOW is dropped unless it
    /// moves an existing value backwards, which is how a reset is expressed.
    void set(const convo::one_to_one& c);
    void set(const convo::community& c);
    void set(const convo::group& c);
    void set(const convo::any& c);

    // false when there was nothing to erase
    bool erase_1to1(std::string_view session_id);
    bool erase_community(std::string_view base_url, std::string_view room);
    bool erase_group(std::string_view group_id);
    bool erase(const convo::any& c);

    size_t size() const;
    size_t size_1to1() const;
    size_t size_communities() const;
    size_t size_groups() const;

    bool empty() const { return size() == 0; }

    std::vector<convo::one_to_one> all_1to1() const;
    std::vector<convo::community> all_communities() const;
    std::vector<convo::group> all_groups() const;

  protected:
    std::string event_key(std::string_view rec, std::string_view field) const override;

  private:
    void set_base(const convo::base& c, std::string_view rec);
};

}  // namespace swarmsync::config
