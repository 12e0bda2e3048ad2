#include <catch2/catch_test_macros.hpp>
#include <swarmsync/hash_store.hpp>
#include <swarmsync/poller/result_processor.hpp>

#include "utils.hpp"

using namespace std::literals;
using namespace swarmsync;
using namespace swarmsync::poller;

namespace {

struct ProcessorFixture {
    TestKeys keys = test_keys();
    MemoryStorage storage;
    ConfigStore store{keys.sk(), storage};
    MemoryMessageHashStore hashes;
    FakeCrypto crypto;
    FakeDispatcher dispatcher;
    LogCapture logs;
    ResultProcessor processor{hashes, crypto, store, dispatcher};
    std::vector<Node> nodes = make_swarm(2);

    ProcessorFixture() { processor.logger = logs.logger(); }

    const std::string& uid() const { return store.user_id(); }
};

}  // namespace

TEST_CASE("Polled duplicates are counted and not processed again", "[poller][processor]") {
    ProcessorFixture f;
    PollResponse response{
            {Namespace::Default,
             {swarm_message("m1", "one"_bytes, 1000), swarm_message("m2", "two"_bytes, 2000)}}};

    auto result = f.processor.process(f.uid(), f.nodes[0], response);
    CHECK(result.raw_message_count == 2);
    CHECK(result.valid_message_count == 2);
    CHECK(result.invalid_message_count == 0);
    CHECK(result.had_valid_hash_update);
    CHECK(f.hashes.last_hash(f.uid(), Namespace::Default, f.nodes[0].pubkey) == "m2");

    REQUIRE(f.dispatcher.size() == 1);
    auto& job = f.dispatcher.jobs[0].first;
    CHECK(job.kind == ReceiveJob::Kind::messages);
    CHECK(job.target == f.uid());
    CHECK(job.conversation_id == f.uid());
    REQUIRE(job.messages.size() == 2);
    CHECK(job.messages[0].hash == "m1");
    CHECK(job.messages[0].ns == Namespace::Default);
    CHECK(job.messages[1].server_timestamp_ms == 2000);

    SECTION("from the same node") {
        result = f.processor.process(f.uid(), f.nodes[0], response);
        CHECK(result.raw_message_count == 2);
        CHECK(result.valid_message_count == 0);
        CHECK(result.duplicate_count() == 2);
        CHECK_FALSE(result.had_valid_hash_update);
        CHECK(f.dispatcher.size() == 1);
        // A namespace returning only duplicates was polled with a stale cursor
        CHECK_FALSE(f.hashes.last_hash(f.uid(), Namespace::Default, f.nodes[0].pubkey));
    }

    SECTION("from another node") {
        result = f.processor.process(f.uid(), f.nodes[1], response);
        CHECK(result.duplicate_count() == 2);
        CHECK(result.had_valid_hash_update);
        CHECK(f.dispatcher.size() == 1);
        CHECK(f.hashes.last_hash(f.uid(), Namespace::Default, f.nodes[1].pubkey) == "m2");
        CHECK(f.hashes.seen_from(f.uid(), Namespace::Default, "m1", f.nodes[1].pubkey));
    }

    CHECK(f.logs.count(LogLevel::error) == 0);
}

TEST_CASE("Polled messages that cannot be opened", "[poller][processor]") {
    ProcessorFixture f;
    f.crypto.errors["bad"] = MessageErrorKind::decrypt_failed;
    f.crypto.errors["mine"] = MessageErrorKind::self_send;
    f.hashes.set_last_hash(f.uid(), Namespace::Default, f.nodes[0].pubkey, "before");

    SECTION("mixed with valid messages") {
        auto result = f.processor.process(
                f.uid(),
                f.nodes[0],
                {{Namespace::Default,
                  {swarm_message("bad"), swarm_message("mine"), swarm_message("ok")}}});
        CHECK(result.raw_message_count == 3);
        CHECK(result.valid_message_count == 1);
        CHECK(result.invalid_message_count == 1);
        CHECK(result.duplicate_count() == 1);
        CHECK(f.logs.contains(LogLevel::error, "Failed to deserialize envelope"));
        CHECK(f.hashes.last_hash(f.uid(), Namespace::Default, f.nodes[0].pubkey) == "ok");
        REQUIRE(f.dispatcher.size() == 1);
        CHECK(f.dispatcher.jobs[0].first.messages.size() == 1);
    }

    SECTION("our own message still moves the cursor") {
        auto result = f.processor.process(
                f.uid(), f.nodes[0], {{Namespace::Default, {swarm_message("mine")}}});
        CHECK(result.valid_message_count == 0);
        CHECK(result.had_valid_hash_update);
        CHECK(f.hashes.last_hash(f.uid(), Namespace::Default, f.nodes[0].pubkey) == "mine");
        CHECK(f.dispatcher.size() == 0);
        CHECK(f.logs.count(LogLevel::error) == 0);
    }

    SECTION("only invalid messages keep the cursor") {
        auto result = f.processor.process(
                f.uid(), f.nodes[0], {{Namespace::Default, {swarm_message("bad")}}});
        CHECK(result.invalid_message_count == 1);
        CHECK_FALSE(result.had_valid_hash_update);
        CHECK(f.hashes.last_hash(f.uid(), Namespace::Default, f.nodes[0].pubkey) == "before");
    }
}

TEST_CASE("Config jobs are queued before message jobs", "[poller][processor]") {
    ProcessorFixture f;
    f.crypto.conversations["m1"] = fake_id('5', '1');

    config::Contacts remote{f.keys.sk(), std::nullopt};
    remote.set_name(fake_id('5', '1'), "Alice");
    auto contacts_msg = push_message(remote, "contacts1", 500);

    auto result = f.processor.process(
            f.uid(),
            f.nodes[0],
            {{Namespace::Default, {swarm_message("m1"), swarm_message("m2")}},
             {Namespace::Contacts, {swarm_message(contacts_msg)}},
             {Namespace::UserProfile, {}}},
            false);
    CHECK(result.valid_message_count == 3);
    CHECK(f.hashes.last_hash(f.uid(), Namespace::Contacts, f.nodes[0].pubkey) == "contacts1");
    // Config messages are never deduplicated
    CHECK_FALSE(f.hashes.seen(f.uid(), Namespace::Contacts, "contacts1"));

    REQUIRE(f.dispatcher.size() == 3);
    auto& [config_job, config_can_start] = f.dispatcher.jobs[0];
    CHECK(config_job.kind == ReceiveJob::Kind::config_messages);
    REQUIRE(config_job.configs.size() == 1);
    CHECK(config_job.configs[0].ns == Namespace::Contacts);
    CHECK(config_job.configs[0].timestamp_ms == 500);
    CHECK_FALSE(config_can_start);

    CHECK(f.dispatcher.jobs[1].first.conversation_id == fake_id('5', '1'));
    CHECK(f.dispatcher.jobs[2].first.conversation_id == f.uid());

    // Nothing was merged until the job runs
    CHECK(f.store.read<config::Contacts>(f.uid(), [](auto& c) { return c.size(); }) == 0);
    run_config_job(f.store, config_job);
    f.storage.read([](const Transaction& tx) {
        auto alice = tx.contact(fake_id('5', '1'));
        REQUIRE(alice);
        CHECK(alice->name == "Alice");
    });
}

TEST_CASE("Group keys are merged while processing", "[poller][processor]") {
    ProcessorFixture f;

    MemoryStorage admin_storage;
    ConfigStore admin{test_keys(3).sk(), admin_storage};
    auto gid = admin.create_group("Keyed", std::nullopt, {config::groups::member{f.uid()}})
                       .group_id;
    auto pending = admin.pending_pushes(gid);

    PollResponse response;
    for (auto& p : pending.pushes) {
        auto ns = *config::variant_namespace(p.variant);
        response[ns].push_back(swarm_message(std::string{namespace_name(ns)}, p.data, 1000));
    }
    REQUIRE(response.count(Namespace::GroupKeys));

    SECTION("for a group we have joined") {
        f.store.approve_group(gid);
        auto result = f.processor.process(gid, f.nodes[0], response);
        CHECK(result.valid_message_count == 3);

        CHECK(f.store.read<config::groups::Keys>(gid, [](auto& k) {
            return k.current_generation();
        }) == 1);
        // The info and members wait for their job
        CHECK(f.store.read<config::groups::Info>(gid, [](auto& i) { return i.get_name(); }) ==
              std::nullopt);

        REQUIRE(f.dispatcher.size() == 1);
        auto& job = f.dispatcher.jobs[0].first;
        CHECK(job.kind == ReceiveJob::Kind::config_messages);
        CHECK(job.configs.size() == 2);
        run_config_job(f.store, job);
        CHECK(f.store.read<config::groups::Info>(gid, [](auto& i) { return i.get_name(); }) ==
              "Keyed");
    }

    SECTION("for a group that was never loaded") {
        CHECK_THROWS_AS(f.processor.process(gid, f.nodes[0], response), config_not_loaded);
    }
}

TEST_CASE("Empty poll responses", "[poller][processor]") {
    ProcessorFixture f;
    f.hashes.set_last_hash(f.uid(), Namespace::Default, f.nodes[0].pubkey, "cursor");

    auto result = f.processor.process(f.uid(), f.nodes[0], {{Namespace::Default, {}}});
    CHECK(result.raw_message_count == 0);
    CHECK_FALSE(result.had_valid_hash_update);
    CHECK(f.dispatcher.size() == 0);
    CHECK(f.hashes.last_hash(f.uid(), Namespace::Default, f.nodes[0].pubkey) == "cursor");
}
