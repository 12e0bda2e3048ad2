#pragma once

#include <oxenc/hex.h>

#include <array>
#include <chrono>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

#include "swarmsync/crypto.hpp"
#include "swarmsync/ed25519.hpp"
#include "swarmsync/errors.hpp"
#include "swarmsync/jobs.hpp"
#include "swarmsync/log.hpp"
#include "swarmsync/network.hpp"
#include "swarmsync/store.hpp"
#include "swarmsync/types.hpp"

using swarmsync::ustring;
using swarmsync::ustring_view;

inline ustring operator""_bytes(const char* x, size_t n) {
    return {reinterpret_cast<const unsigned char*>(x), n};
}
inline ustring operator""_hexbytes(const char* x, size_t n) {
    ustring bytes;
    oxenc::from_hex(x, x + n, std::back_inserter(bytes));
    return bytes;
}

inline std::string to_hex(ustring_view bytes) {
    std::string hex;
    oxenc::to_hex(bytes.begin(), bytes.end(), std::back_inserter(hex));
    return hex;
}

inline ustring_view to_usv(std::string_view x) {
    return {reinterpret_cast<const unsigned char*>(x.data()), x.size()};
}

inline std::string printable(ustring_view x) {
    std::string p;
    for (auto c : x) {
        if (c >= 0x20 && c <= 0x7e)
            p += c;
        else
            p += "\\x" + oxenc::to_hex(&c, &c + 1);
    }
    return p;
}
inline std::string printable(std::string_view x) {
    return printable(to_usv(x));
}

template <typename Container>
std::set<typename Container::value_type> as_set(const Container& c) {
    return {c.begin(), c.end()};
}

template <typename... T>
std::set<std::common_type_t<T...>> make_set(T&&... args) {
    return {std::forward<T>(args)...};
}

// Deterministic Ed25519 identity built from the usual test seed with `n` as its last byte.
struct TestKeys {
    std::array<unsigned char, 32> ed_pk;
    std::array<unsigned char, 64> ed_sk;
    std::string session_id;

    ustring_view sk() const { return {ed_sk.data(), ed_sk.size()}; }
};

inline TestKeys test_keys(unsigned char n = 0) {
    auto seed = "0123456789abcdef0123456789abcdef00000000000000000000000000000000"_hexbytes;
    seed[31] = n;
    TestKeys k;
    std::tie(k.ed_pk, k.ed_sk) = swarmsync::ed25519::ed25519_key_pair(seed);
    k.session_id = swarmsync::ed25519::session_id({k.ed_pk.data(), k.ed_pk.size()});
    return k;
}

// A syntactically valid session (05) or group (03) id whose hex digits are all `digit`.
inline std::string fake_id(char prefix, char digit) {
    std::string id{"0"};
    id += prefix;
    id.append(64, digit);
    return id;
}

// Pushes a config object and confirms the push under `hash`, returning the message a swarm would
// hand out for it.
inline swarmsync::ConfigMessage push_message(
        swarmsync::config::ConfigBase& config, std::string hash, int64_t timestamp_ms = 0) {
    auto [seqno, data, obsolete] = config.push();
    config.confirm_pushed(seqno, hash);
    return swarmsync::ConfigMessage{
            *config.storage_namespace(), std::move(hash), std::move(data), timestamp_ms};
}

inline swarmsync::SwarmMessage swarm_message(
        std::string hash, ustring data = {}, int64_t timestamp_ms = 0) {
    return swarmsync::SwarmMessage{std::move(hash), std::move(data), timestamp_ms, 0};
}

inline swarmsync::SwarmMessage swarm_message(const swarmsync::ConfigMessage& m) {
    return swarmsync::SwarmMessage{m.hash, m.data, m.timestamp_ms, 0};
}

inline std::vector<swarmsync::Node> make_swarm(size_t n) {
    std::vector<swarmsync::Node> nodes;
    for (size_t i = 0; i < n; i++)
        nodes.push_back({"node" + std::to_string(i), "10.0.0." + std::to_string(i + 1) + ":22021"});
    return nodes;
}

// Collects log lines.
struct LogCapture {
    mutable std::mutex mutex;
    std::vector<std::pair<swarmsync::LogLevel, std::string>> lines;

    swarmsync::Logger logger() {
        return [this](swarmsync::LogLevel lvl, std::string msg) {
            std::lock_guard lock{mutex};
            lines.emplace_back(lvl, std::move(msg));
        };
    }

    bool contains(std::string_view needle) const {
        std::lock_guard lock{mutex};
        for (auto& [lvl, msg] : lines)
            if (msg.find(needle) != std::string::npos)
                return true;
        return false;
    }

    bool contains(swarmsync::LogLevel level, std::string_view needle) const {
        std::lock_guard lock{mutex};
        for (auto& [lvl, msg] : lines)
            if (lvl == level && msg.find(needle) != std::string::npos)
                return true;
        return false;
    }

    size_t count(swarmsync::LogLevel level) const {
        std::lock_guard lock{mutex};
        size_t n = 0;
        for (auto& [lvl, msg] : lines)
            n += lvl == level;
        return n;
    }
};

// Swarm client driven by a script of poll steps.  Each poll consumes the next step; with no step
// left, polls return an empty response.
class FakeSwarmClient : public swarmsync::SwarmClient {
  public:
    using Step = std::function<swarmsync::PollResponse(
            const swarmsync::Node&, const swarmsync::PollRequest&)>;

    std::map<std::string, std::vector<swarmsync::Node>, std::less<>> swarms;
    std::vector<swarmsync::Node> default_swarm = make_swarm(3);

    void respond(swarmsync::PollResponse response) {
        std::lock_guard lock{_mutex};
        _steps.push_back([response = std::move(response)](auto&, auto&) { return response; });
    }

    void fail(swarmsync::request_error error) {
        std::lock_guard lock{_mutex};
        _steps.push_back([error = std::move(error)](auto&, auto&) -> swarmsync::PollResponse {
            throw error;
        });
    }

    void then(Step step) {
        std::lock_guard lock{_mutex};
        _steps.push_back(std::move(step));
    }

    std::vector<swarmsync::Node> get_swarm(std::string_view swarm_pubkey) override {
        std::lock_guard lock{_mutex};
        ++swarm_lookups;
        if (auto it = swarms.find(swarm_pubkey); it != swarms.end())
            return it->second;
        return default_swarm;
    }

    swarmsync::PollResponse poll(
            const swarmsync::Node& node, const swarmsync::PollRequest& request) override {
        Step step;
        {
            std::lock_guard lock{_mutex};
            polls.emplace_back(node, request);
            if (!_steps.empty()) {
                step = std::move(_steps.front());
                _steps.pop_front();
            }
        }
        return step ? step(node, request) : swarmsync::PollResponse{};
    }

    // Stores every push successfully, answering with "hash<N>" for the Nth store request.
    swarmsync::SwarmResponse send(
            const swarmsync::Node& node, std::string_view swarm_pubkey, std::string payload) override {
        std::lock_guard lock{_mutex};
        sent.push_back({node, std::string{swarm_pubkey}, payload});
        if (send_response)
            return *send_response;

        auto request = nlohmann::json::parse(payload);
        auto results = nlohmann::json::array();
        for (auto& sub : request["params"]["requests"]) {
            if (sub["method"] == "store")
                results.push_back(
                        {{"code", 200},
                         {"body", {{"hash", "hash" + std::to_string(++_stored)}}}});
            else
                results.push_back({{"code", 200}, {"body", nlohmann::json::object()}});
        }
        return {200, nlohmann::json{{"results", results}}.dump()};
    }

    struct Sent {
        swarmsync::Node node;
        std::string swarm_pubkey;
        std::string payload;
    };

    std::vector<std::pair<swarmsync::Node, swarmsync::PollRequest>> polls;
    std::vector<Sent> sent;
    std::optional<swarmsync::SwarmResponse> send_response;
    int swarm_lookups = 0;

    size_t poll_count() const {
        std::lock_guard lock{_mutex};
        return polls.size();
    }

  private:
    mutable std::mutex _mutex;
    std::deque<Step> _steps;
    int _stored = 0;
};

// Envelope "decryption" is the identity function; hashes listed in `errors` fail with the given
// kind, and `conversations` overrides the conversation of a hash.
class FakeCrypto : public swarmsync::Crypto {
  public:
    std::map<std::string, swarmsync::MessageErrorKind> errors;
    std::map<std::string, std::string> conversations;
    std::string sender = fake_id('5', 'a');
    int sign_calls = 0;

    swarmsync::DecodedMessage decode_envelope(
            std::string_view,
            swarmsync::Namespace ns,
            const swarmsync::SwarmMessage& message) override {
        if (auto it = errors.find(message.hash); it != errors.end())
            throw swarmsync::message_error{it->second};

        swarmsync::DecodedMessage d;
        d.hash = message.hash;
        d.ns = ns;
        if (auto it = conversations.find(message.hash); it != conversations.end())
            d.conversation_id = it->second;
        d.sender = sender;
        d.plaintext = message.data;
        d.sent_timestamp_ms = message.timestamp_ms;
        return d;
    }

    ustring sign(std::string_view, ustring_view) override {
        ++sign_calls;
        return ustring(64, 0x01);
    }

    bool verify(ustring_view, ustring_view, ustring_view) override { return true; }
};

class FakeDispatcher : public swarmsync::JobDispatcher {
  public:
    void enqueue(swarmsync::ReceiveJob job, bool can_start_immediately) override {
        std::lock_guard lock{_mutex};
        jobs.emplace_back(std::move(job), can_start_immediately);
    }

    size_t size() const {
        std::lock_guard lock{_mutex};
        return jobs.size();
    }

    std::vector<std::pair<swarmsync::ReceiveJob, bool>> jobs;

  private:
    mutable std::mutex _mutex;
};

class FakeCommunityClient : public swarmsync::CommunityClient {
  public:
    using Step = std::function<swarmsync::CommunityPollResponse(
            const swarmsync::CommunityPollRequest&)>;

    void respond(swarmsync::CommunityPollResponse response) {
        _steps.push_back([response = std::move(response)](auto&) { return response; });
    }

    void fail(swarmsync::request_error error) {
        _steps.push_back([error = std::move(error)](auto&) -> swarmsync::CommunityPollResponse {
            throw error;
        });
    }

    swarmsync::CommunityPollResponse poll_rooms(
            const swarmsync::CommunityPollRequest& request) override {
        requests.push_back(request);
        if (_steps.empty())
            return {};
        auto step = std::move(_steps.front());
        _steps.pop_front();
        return step(request);
    }

    std::vector<std::string> capabilities(std::string_view server, bool blinded) override {
        capability_requests.emplace_back(std::string{server}, blinded);
        if (capabilities_error)
            throw *capabilities_error;
        return caps;
    }

    std::vector<swarmsync::CommunityPollRequest> requests;
    std::vector<std::pair<std::string, bool>> capability_requests;
    std::vector<std::string> caps{"sogs", "blind"};
    std::optional<swarmsync::request_error> capabilities_error;

  private:
    std::deque<Step> _steps;
};
