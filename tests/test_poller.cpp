#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <swarmsync/hash_store.hpp>
#include <swarmsync/poller/community_poller.hpp>
#include <swarmsync/poller/group_poller.hpp>
#include <swarmsync/poller/user_poller.hpp>
#include <swarmsync/scheduler.hpp>
#include <swarmsync/util.hpp>
#include <thread>

#include "utils.hpp"

using namespace std::literals;
using namespace swarmsync;
using namespace swarmsync::poller;

namespace {

struct SwarmFixture {
    TestKeys keys = test_keys();
    MemoryStorage storage;
    ConfigStore store{keys.sk(), storage};
    ManualScheduler sched;
    FakeSwarmClient client;
    FakeCrypto crypto;
    MemoryMessageHashStore hashes;
    FakeDispatcher dispatcher;
    LogCapture logs;

    SwarmCollaborators collab() { return {client, crypto, hashes, store, dispatcher}; }

    std::shared_ptr<UserPoller> user_poller() {
        auto p = std::make_shared<UserPoller>(sched, collab());
        p->logger = logs.logger();
        return p;
    }

    // Runs the next scheduled task (and anything due at the same time).
    size_t step() { return sched.advance(sched.next_delay()); }

    const std::string& uid() const { return store.user_id(); }
};

// Dispatcher that runs a hook whenever a job is handed to it.
class HookDispatcher : public FakeDispatcher {
  public:
    std::function<void()> on_enqueue;

    void enqueue(ReceiveJob job, bool can_start_immediately) override {
        FakeDispatcher::enqueue(std::move(job), can_start_immediately);
        if (on_enqueue)
            on_enqueue();
    }
};

struct CommunityFixture {
    static constexpr auto server = "https://open.example.org"sv;

    MemoryStorage storage;
    ManualScheduler sched;
    FakeCommunityClient client;
    FakeDispatcher dispatcher;
    LogCapture logs;
    std::shared_ptr<CommunityPoller> poller;

    CommunityFixture() {
        storage.write([](Transaction& tx) {
            tx.upsert_thread({std::string{server} + "/lokinet", ThreadKind::community, 0});
            tx.upsert_thread({std::string{server} + "/hidden", ThreadKind::community, -1});
            tx.upsert_thread({"https://other.example.org/lokinet", ThreadKind::community, 0});
        });
        poller = std::make_shared<CommunityPoller>(
                "https://OPEN.example.org", sched, client, storage, dispatcher);
        poller->logger = logs.logger();
    }

    size_t step() { return sched.advance(sched.next_delay()); }

    bool has_thread(std::string_view room) const {
        bool found = false;
        storage.read([&](const Transaction& tx) {
            found = tx.thread(std::string{server} + "/" + std::string{room}).has_value();
        });
        return found;
    }
};

// Polls as often as the scheduler allows and counts the responses it applies.
class BusyPoller : public Poller {
  public:
    explicit BusyPoller(Scheduler& sched) : Poller{"busy", sched, PollerOptions{"BusyPoller"}} {}

    std::atomic<bool> stopped{false};
    std::atomic<int> applied{0};
    std::atomic<int> applied_after_stop{0};

    std::chrono::milliseconds next_poll_delay(int) const override { return 0ms; }

  protected:
    Apply poll() override {
        return [this] {
            if (stopped)
                ++applied_after_stop;
            ++applied;
            return PollResult{};
        };
    }
};

CommunityMessage community_message(int64_t seqno) {
    return {seqno, fake_id('5', 'c'), to_usv("message " + std::to_string(seqno)), seqno * 1000};
}

}  // namespace

TEST_CASE("Starting a poller twice runs a single poll chain", "[poller][start]") {
    SwarmFixture f;
    auto poller = f.user_poller();

    CHECK_FALSE(poller->is_polling());
    CHECK(poller->start_if_needed());
    CHECK_FALSE(poller->start_if_needed());
    CHECK(poller->is_polling());
    CHECK(f.sched.pending() == 1);

    CHECK(f.sched.run_pending() == 1);
    CHECK(f.client.poll_count() == 1);
    CHECK(f.sched.pending() == 1);
    CHECK(f.sched.next_delay() == UserPoller::MIN_POLL_INTERVAL);
    CHECK(f.logs.count(LogLevel::info) >= 2);

    // Still one chain after more cycles and more start calls
    CHECK_FALSE(poller->start_if_needed());
    f.step();
    f.step();
    CHECK(f.client.poll_count() == 3);
    CHECK(f.sched.pending() == 1);
    CHECK(poller->poll_count() == 3);

    SECTION("concurrent starts") {
        auto other = f.user_poller();
        std::atomic<int> started{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 8; i++)
            threads.emplace_back([&] {
                if (other->start_if_needed())
                    ++started;
            });
        for (auto& t : threads)
            t.join();
        CHECK(started == 1);
        CHECK(f.sched.pending() == 2);
    }

    SECTION("restart after stop") {
        poller->stop();
        CHECK_FALSE(poller->is_polling());
        CHECK(f.sched.pending() == 0);
        CHECK(poller->start_if_needed());
        CHECK(f.sched.pending() == 1);
    }
}

TEST_CASE("Pollers must be shared", "[poller][start]") {
    SwarmFixture f;
    UserPoller poller{f.sched, f.collab()};
    CHECK_THROWS_AS(poller.start_if_needed(), std::logic_error);
    CHECK(f.sched.pending() == 0);
}

TEST_CASE("A response arriving after stop is discarded", "[poller][stop]") {
    SwarmFixture f;
    auto poller = f.user_poller();
    for (auto& node : f.client.default_swarm)
        f.hashes.set_last_hash(f.uid(), Namespace::Default, node.pubkey, "cursor");

    SECTION("successful response") {
        f.client.then([&](const Node&, const PollRequest&) {
            poller->stop();
            return PollResponse{
                    {Namespace::Default, {swarm_message("late1", "hello"_bytes, 1000)}}};
        });
        poller->start_if_needed();
        f.sched.run_pending();

        CHECK(f.client.poll_count() == 1);
        CHECK(f.dispatcher.size() == 0);
        CHECK_FALSE(f.hashes.seen(f.uid(), Namespace::Default, "late1"));
        CHECK(poller->poll_count() == 0);
        CHECK(f.logs.contains(LogLevel::debug, "discarding the response"));
    }

    SECTION("failed response") {
        f.client.then([&](const Node&, const PollRequest&) -> PollResponse {
            poller->stop();
            throw request_error{RequestErrorKind::timeout, "timed out"};
        });
        poller->start_if_needed();
        f.sched.run_pending();

        CHECK(poller->failure_count() == 0);
        CHECK(f.logs.contains(LogLevel::debug, "ignoring error: timed out"));
        CHECK(f.logs.count(LogLevel::warning) == 0);
    }

    CHECK_FALSE(poller->is_polling());
    CHECK(f.sched.pending() == 0);
    for (auto& node : f.client.default_swarm)
        CHECK(f.hashes.last_hash(f.uid(), Namespace::Default, node.pubkey) == "cursor");
    CHECK(f.storage.published_events().empty());
}

TEST_CASE("Stopping a poller while it processes a response", "[poller][stop]") {
    TestKeys keys = test_keys();
    MemoryStorage storage;
    ConfigStore store{keys.sk(), storage};
    ManualScheduler sched;
    FakeSwarmClient client;
    FakeCrypto crypto;
    MemoryMessageHashStore hashes;
    HookDispatcher dispatcher;

    auto poller = std::make_shared<UserPoller>(
            sched, SwarmCollaborators{client, crypto, hashes, store, dispatcher});
    dispatcher.on_enqueue = [&] { poller->stop(); };

    client.respond({{Namespace::Default, {swarm_message("m1", "hi"_bytes, 1000)}}});
    poller->start_if_needed();
    sched.run_pending();

    // The response was applied, but nothing was scheduled after it
    CHECK(dispatcher.size() == 1);
    CHECK_FALSE(poller->is_polling());
    CHECK(sched.pending() == 0);
    CHECK(poller->poll_count() == 0);

    dispatcher.on_enqueue = nullptr;
    CHECK(poller->start_if_needed());
    CHECK(sched.pending() == 1);
    sched.run_pending();
    CHECK(client.poll_count() == 2);
    CHECK(poller->poll_count() == 1);
    CHECK(sched.pending() == 1);
}

TEST_CASE("No response is applied once stop returns", "[poller][stop]") {
    ThreadScheduler sched{2};
    auto poller = std::make_shared<BusyPoller>(sched);

    for (int i = 0; i < 100; i++) {
        poller->stopped = false;
        auto before = poller->applied.load();
        REQUIRE(poller->start_if_needed());
        auto deadline = std::chrono::steady_clock::now() + 5s;
        while (poller->applied == before && std::chrono::steady_clock::now() < deadline)
            std::this_thread::yield();
        poller->stop();
        poller->stopped = true;
    }
    std::this_thread::sleep_for(20ms);

    CHECK(poller->applied >= 100);
    CHECK(poller->applied_after_stop == 0);
    CHECK_FALSE(poller->is_polling());
}

TEST_CASE("Poll delays never decrease with failures", "[poller][backoff]") {
    SwarmFixture f;
    CommunityFixture c;
    auto now = get_timestamp_ms();
    PollerOptions fixed_clock;
    fixed_clock.now_ms = [now] { return now; };

    auto user = f.user_poller();
    auto group = std::make_shared<GroupPoller>(fake_id('3', '1'), f.sched, f.collab(), fixed_clock);

    struct Case {
        const Poller* poller;
        std::chrono::milliseconds min, max;
    };
    std::vector<Case> cases{
            {user.get(), UserPoller::MIN_POLL_INTERVAL, UserPoller::MAX_RETRY_INTERVAL},
            {c.poller.get(), CommunityPoller::MIN_POLL_INTERVAL, CommunityPoller::MAX_POLL_INTERVAL},
            {group.get(), group->next_poll_delay(0), GroupPoller::MAX_POLL_INTERVAL},
    };

    for (auto& [poller, min, max] : cases) {
        INFO(poller->name());
        CHECK(poller->next_poll_delay(0) == min);
        for (int n = 0; n < 64; n++) {
            auto d = poller->next_poll_delay(n);
            CHECK(d <= poller->next_poll_delay(n + 1));
            CHECK(d <= max);
        }
        CHECK(poller->next_poll_delay(1000) == (poller == group.get() ? min : max));
    }

    CHECK(user->next_poll_delay(1) == 1800ms);
    CHECK(user->next_poll_delay(3) == 2400ms);
    CHECK(c.poller->next_poll_delay(1) == 5s);
    CHECK(c.poller->next_poll_delay(11) == 2051s);
    CHECK(c.poller->next_poll_delay(12) == 1h);
}

TEST_CASE("A healthy poller waits its minimum interval", "[poller][backoff]") {
    SwarmFixture f;
    CommunityFixture c;

    CHECK(c.poller->next_poll_delay(0) == 3000ms);
    CHECK(f.user_poller()->next_poll_delay(0) == 1500ms);

    auto now = get_timestamp_ms();
    PollerOptions fixed_clock;
    fixed_clock.now_ms = [now] { return now; };
    const auto gid = fake_id('3', '1');
    auto group = std::make_shared<GroupPoller>(gid, f.sched, f.collab(), fixed_clock);

    // No activity yet: assumed to be a few minutes old
    CHECK(group->next_poll_delay(0) == GroupPoller::activity_delay(GroupPoller::DEFAULT_INACTIVITY));
    CHECK(group->next_poll_delay(0) > 3000ms);

    f.store.change<config::ConvoInfoVolatile>(f.uid(), [&](config::ConvoInfoVolatile& convos) {
        auto g = convos.get_or_construct_group(gid);
        g.last_read = now;
        convos.set(g);
    });
    CHECK(group->next_poll_delay(0) == 3000ms);
    CHECK(group->next_poll_delay(5) == 3000ms);
}

TEST_CASE("Group poll intervals follow activity", "[poller][groups]") {
    CHECK(GroupPoller::activity_delay(0ms) == 3s);
    CHECK(GroupPoller::activity_delay(6h) == 16500ms);
    CHECK(GroupPoller::activity_delay(12h) == 30s);
    CHECK(GroupPoller::activity_delay(48h) == 30s);
    CHECK(GroupPoller::activity_delay(-5s) == 3s);

    CHECK(GroupPoller::namespaces_for(fake_id('3', '1')).size() == 5);
    CHECK(GroupPoller::namespaces_for(fake_id('5', '1')) ==
          std::vector{Namespace::LegacyClosedGroup});

    SwarmFixture f;
    auto creation = f.store.create_group("Busy", std::nullopt, {});
    auto now = get_timestamp_ms();
    PollerOptions fixed_clock;
    fixed_clock.now_ms = [now] { return now; };
    auto group = std::make_shared<GroupPoller>(creation.group_id, f.sched, f.collab(), fixed_clock);
    group->logger = f.logs.logger();
    CHECK(group->name() == "GroupPoller-" + creation.group_id);

    f.client.respond(
            {{Namespace::GroupMessages, {swarm_message("g1", "hey"_bytes, now - 1000)}},
             {Namespace::GroupInfo, {}}});
    group->start_if_needed();
    f.sched.run_pending();

    CHECK(group->last_message_timestamp() == now - 1000);
    CHECK(f.sched.next_delay() == GroupPoller::activity_delay(1s));
    REQUIRE(f.dispatcher.size() == 1);
    CHECK(f.dispatcher.jobs[0].first.conversation_id == creation.group_id);

    // Group requests are signed for every namespace and refresh the group's config hashes
    auto& request = f.client.polls.at(0).second;
    CHECK(request.swarm_pubkey == creation.group_id);
    CHECK(request.signatures.size() == 5);
    CHECK(request.refresh_hashes == f.store.current_hashes(creation.group_id));
}

TEST_CASE("User poller requests", "[poller][user]") {
    SwarmFixture f;
    auto poller = f.user_poller();
    poller->start_if_needed();

    f.client.respond({{Namespace::Default, {swarm_message("m1", "one"_bytes, 1000)}}});
    f.sched.run_pending();

    REQUIRE(f.client.polls.size() == 1);
    auto [node, request] = f.client.polls[0];
    CHECK(request.swarm_pubkey == f.uid());
    CHECK(request.namespaces == UserPoller::default_namespaces());
    CHECK(request.last_hashes.empty());
    CHECK(request.signatures.size() == 5);
    CHECK(f.crypto.sign_calls == 5);
    CHECK(request.max_sizes.size() == 5);

    // The next poll of the same node continues from the last message
    f.step();
    REQUIRE(f.client.polls.size() == 2);
    CHECK(f.client.polls[1].first == node);
    CHECK(f.client.polls[1].second.last_hashes.at(Namespace::Default) == "m1");
    CHECK_FALSE(f.client.polls[1].second.last_hashes.count(Namespace::Contacts));

    SECTION("jobs wait while the app is in the background") {
        poller->set_can_start_jobs(false);
        f.client.respond({{Namespace::Default, {swarm_message("m2", "two"_bytes, 2000)}}});
        f.step();
        REQUIRE(f.dispatcher.size() == 2);
        CHECK(f.dispatcher.jobs[0].second);
        CHECK_FALSE(f.dispatcher.jobs[1].second);
    }
}

TEST_CASE("User poller moves to another node after a few polls", "[poller][nodes]") {
    SwarmFixture f;
    auto poller = f.user_poller();
    poller->start_if_needed();
    f.sched.run_pending();
    for (int i = 1; i <= UserPoller::MAX_NODE_POLL_COUNT; i++)
        f.step();

    REQUIRE(f.client.polls.size() == 7);
    for (int i = 1; i < 6; i++)
        CHECK(f.client.polls[i].first == f.client.polls[0].first);
    CHECK(f.client.polls[6].first != f.client.polls[5].first);
    CHECK(poller->current_node() == f.client.polls[6].first);
    CHECK(poller->dropped_nodes().empty());
}

TEST_CASE("Swarm poller failures", "[poller][errors]") {
    SwarmFixture f;
    auto poller = f.user_poller();

    SECTION("a node failing repeatedly is dropped") {
        for (int i = 0; i < 3; i++)
            f.client.fail({RequestErrorKind::transport, "connection reset"});
        poller->start_if_needed();
        f.sched.run_pending();
        CHECK(poller->failure_count() == 1);
        CHECK(f.sched.next_delay() == 1800ms);
        f.step();
        CHECK(f.sched.next_delay() == 2100ms);
        f.step();
        CHECK(poller->failure_count() == 3);
        f.step();

        REQUIRE(f.client.polls.size() == 4);
        auto failing = f.client.polls[0].first;
        CHECK(f.client.polls[1].first == failing);
        CHECK(f.client.polls[2].first == failing);
        CHECK(f.client.polls[3].first != failing);
        CHECK(poller->dropped_nodes() == std::set{failing.pubkey});
        CHECK(poller->failure_count() == 0);
        CHECK(f.logs.count(LogLevel::warning) == 3);
        CHECK(f.logs.contains(LogLevel::warning, "due to error: connection reset"));
        CHECK(f.logs.contains(LogLevel::info, "Dropped node " + failing.pubkey));
    }

    SECTION("clock skew keeps the node and is logged as an error") {
        f.client.fail({RequestErrorKind::clock_out_of_sync, "clock is off", 425});
        poller->start_if_needed();
        f.sched.run_pending();
        f.step();

        REQUIRE(f.client.polls.size() == 2);
        CHECK(f.client.polls[1].first == f.client.polls[0].first);
        CHECK(poller->dropped_nodes().empty());
        CHECK(f.logs.contains(LogLevel::error, "clock is off"));
    }

    SECTION("rate limiting backs off on the same node") {
        for (int i = 0; i < 3; i++)
            f.client.fail({RequestErrorKind::rate_limited, "slow down", 429});
        poller->start_if_needed();
        f.sched.run_pending();
        CHECK(poller->failure_count() == 1);
        CHECK(poller->is_polling());
        CHECK(f.sched.pending() == 1);
        CHECK(f.sched.next_delay() == 1800ms);
        f.step();
        CHECK(f.sched.next_delay() == 2100ms);
        f.step();
        CHECK(poller->failure_count() == 3);
        f.step();

        // Past the drop threshold, and still the same node
        REQUIRE(f.client.polls.size() == 4);
        for (size_t i = 1; i < f.client.polls.size(); i++)
            CHECK(f.client.polls[i].first == f.client.polls[0].first);
        CHECK(poller->dropped_nodes().empty());
        CHECK(poller->failure_count() == 0);
        CHECK(f.logs.contains(LogLevel::warning, "due to error: slow down"));
        CHECK(f.logs.count(LogLevel::error) == 0);
    }

    SECTION("a bad response moves on without dropping the node") {
        f.client.fail({RequestErrorKind::invalid_response, "garbled"});
        poller->start_if_needed();
        f.sched.run_pending();
        CHECK_FALSE(poller->current_node());
        CHECK(poller->dropped_nodes().empty());
        CHECK(f.logs.contains(LogLevel::warning, "garbled"));
    }

    SECTION("every node dropped") {
        f.client.default_swarm = make_swarm(1);
        for (int i = 0; i < 3; i++)
            f.client.fail({RequestErrorKind::timeout, "timed out"});
        poller->start_if_needed();
        f.sched.run_pending();
        f.step();
        f.step();
        f.step();
        CHECK(f.client.polls.size() == 4);
        CHECK(f.logs.contains(LogLevel::warning, "has been dropped; starting over"));
        CHECK(poller->failure_count() == 0);
    }

    SECTION("no swarm") {
        f.client.default_swarm.clear();
        poller->start_if_needed();
        f.sched.run_pending();
        CHECK(poller->failure_count() == 1);
        CHECK(poller->is_polling());
        CHECK(f.client.poll_count() == 0);
    }
}

TEST_CASE("Community poller", "[poller][community]") {
    CommunityFixture f;
    auto& poller = *f.poller;

    CHECK(poller.target() == "https://open.example.org");
    CHECK(poller.name() == "CommunityPoller-https://open.example.org");
    CHECK(as_set(poller.rooms()) == make_set("lokinet"s, "hidden"s));

    f.client.respond({{"lokinet", {community_message(1), community_message(2)}}});
    poller.start_if_needed();
    f.sched.run_pending();

    REQUIRE(f.client.requests.size() == 1);
    CHECK(f.client.requests[0].server == "https://open.example.org");
    CHECK(f.client.requests[0].rooms == std::map<std::string, int64_t>{{"hidden", 0}, {"lokinet", 0}});
    CHECK_FALSE(f.client.requests[0].blinded);

    REQUIRE(f.dispatcher.size() == 1);
    auto& job = f.dispatcher.jobs[0].first;
    CHECK(job.kind == ReceiveJob::Kind::messages);
    CHECK(job.conversation_id == "https://open.example.org/lokinet");
    REQUIRE(job.messages.size() == 2);
    CHECK(job.messages[1].hash == "2");
    CHECK(job.messages[1].sender == fake_id('5', 'c'));
    CHECK(f.dispatcher.jobs[0].second);
    CHECK(poller.last_seqno("lokinet") == 2);
    CHECK(f.sched.next_delay() == CommunityPoller::MIN_POLL_INTERVAL);

    // The server repeats the newest message we have
    f.client.respond({{"lokinet", {community_message(2), community_message(3)}}});
    f.step();
    CHECK(f.client.requests[1].rooms.at("lokinet") == 2);
    REQUIRE(f.dispatcher.size() == 2);
    CHECK(f.dispatcher.jobs[1].first.messages.size() == 1);
    CHECK(poller.last_seqno("lokinet") == 3);

    SECTION("jobs held back while in the background") {
        poller.set_can_start_jobs(false);
        f.client.respond({{"lokinet", {community_message(4)}}});
        f.step();
        REQUIRE(f.dispatcher.size() == 3);
        CHECK_FALSE(f.dispatcher.jobs[2].second);

        poller.set_can_start_jobs(true);
        f.client.respond({{"lokinet", {community_message(5)}}});
        f.step();
        REQUIRE(f.dispatcher.size() == 4);
        CHECK(f.dispatcher.jobs[3].second);
    }

    SECTION("capability repair") {
        f.client.fail({RequestErrorKind::missing_capability, "blinding required", 400});
        f.client.fail({RequestErrorKind::missing_capability, "blinding required", 400});
        f.step();
        CHECK(f.client.capability_requests ==
              std::vector<std::pair<std::string, bool>>{{"https://open.example.org", true}});
        CHECK(poller.blinded());
        CHECK(poller.capabilities() == std::vector{"sogs"s, "blind"s});
        CHECK(f.logs.contains(LogLevel::info, "polling with blinded authentication"));

        // One repair until a poll succeeds again
        f.step();
        CHECK(f.client.capability_requests.size() == 1);
        CHECK(f.client.requests.back().blinded);
        CHECK(poller.failure_count() == 2);

        f.step();
        CHECK(poller.failure_count() == 0);
        f.client.fail({RequestErrorKind::missing_capability, "blinding required", 400});
        f.step();
        CHECK(f.client.capability_requests.size() == 2);
    }

    SECTION("failed capability repair") {
        f.client.capabilities_error = request_error{RequestErrorKind::timeout, "no answer"};
        f.client.fail({RequestErrorKind::missing_capability, "blinding required", 400});
        f.step();
        CHECK_FALSE(poller.blinded());
        CHECK(f.logs.contains(LogLevel::error, "failed to update capabilities"));
    }

    SECTION("hidden rooms are removed after repeated failures") {
        for (int i = 0; i < CommunityPoller::MAX_HIDDEN_ROOM_FAILURE_COUNT + 1; i++)
            f.client.fail({RequestErrorKind::transport, "unreachable"});
        for (int i = 0; i < CommunityPoller::MAX_HIDDEN_ROOM_FAILURE_COUNT; i++)
            f.step();
        CHECK(poller.failure_count() == 10);
        CHECK(f.has_thread("hidden"));

        f.step();
        CHECK(poller.failure_count() == 11);
        CHECK_FALSE(f.has_thread("hidden"));
        CHECK(f.has_thread("lokinet"));
        CHECK(f.logs.contains(LogLevel::error, "removed hidden rooms [hidden]"));
        CHECK(poller.rooms() == std::vector{"lokinet"s});

        // Other servers are left alone
        f.storage.read([](const Transaction& tx) {
            CHECK(tx.thread("https://other.example.org/lokinet"));
        });
    }
}

TEST_CASE("Community poller without rooms", "[poller][community]") {
    MemoryStorage storage;
    ManualScheduler sched;
    FakeCommunityClient client;
    FakeDispatcher dispatcher;
    auto poller = std::make_shared<CommunityPoller>(
            "https://empty.example.org", sched, client, storage, dispatcher);

    poller->start_if_needed();
    sched.run_pending();
    CHECK(client.requests.empty());
    CHECK(poller->failure_count() == 1);
    CHECK(sched.next_delay() == 5s);
}

TEST_CASE("Poll summaries format durations", "[poller]") {
    CHECK(format_seconds(3s) == "3s");
    CHECK(format_seconds(1750ms) == "1.75s");
    CHECK(format_seconds(1001ms) == "1.001s");
    CHECK(format_seconds(0ms) == "0s");
}
