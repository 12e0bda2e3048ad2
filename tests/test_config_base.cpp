#include <catch2/catch_test_macros.hpp>
#include <swarmsync/config/contacts.hpp>
#include <swarmsync/config/user_profile.hpp>
#include <swarmsync/errors.hpp>

#include "utils.hpp"

using namespace std::literals;
using namespace swarmsync;
using namespace swarmsync::config;

TEST_CASE("Merging the same message twice emits its events once", "[config][events]") {
    auto keys = test_keys();
    Contacts remote{keys.sk(), std::nullopt};
    remote.set_name(fake_id('5', '1'), "Alice");
    auto remote_events = remote.take_events();
    REQUIRE(remote_events.size() == 1);
    auto msg = push_message(remote, "hashA");

    Contacts local{keys.sk(), std::nullopt};
    std::vector<std::pair<std::string, ustring>> batch{{msg.hash, msg.data}};

    CHECK(local.merge(batch) == std::vector{"hashA"s});
    auto events = local.take_events();
    REQUIRE(events.size() == 1);
    CHECK(events[0].key == "contact." + fake_id('5', '1') + ".name");
    CHECK(events[0].value == "Alice");

    CHECK(local.merge(batch).empty());
    CHECK(local.take_events().empty());
    CHECK(local.is_clean());

    SECTION("after a dump reload") {
        Contacts reloaded{keys.sk(), local.dump()};
        CHECK(reloaded.merge(batch).empty());
        CHECK(reloaded.take_events().empty());
    }
}

TEST_CASE("Config push states", "[config][push]") {
    auto keys = test_keys();
    UserProfile profile{keys.sk(), std::nullopt};

    CHECK(profile.is_clean());
    CHECK_FALSE(profile.needs_push());
    auto [s0, d0, o0] = profile.push();
    CHECK(s0 == 0);
    CHECK(profile.is_clean());

    profile.set_name("first");
    CHECK(profile.is_dirty());
    auto [s1, d1, o1] = profile.push();
    CHECK(s1 == 1);
    CHECK(profile.state() == ConfigState::Waiting);

    // Pushing again while waiting does not bump the seqno
    auto [s1b, d1b, o1b] = profile.push();
    CHECK(s1b == 1);

    // A change made after the push makes the pending confirmation stale
    profile.set_name("second");
    auto [s2, d2, o2] = profile.push();
    CHECK(s2 == 2);
    profile.confirm_pushed(1, "stale");
    CHECK(profile.state() == ConfigState::Waiting);
    profile.confirm_pushed(2, "hash2");
    CHECK(profile.is_clean());
    CHECK(profile.current_hashes() == std::vector{"hash2"s});

    profile.set_name("third");
    auto [s3, d3, o3] = profile.push();
    CHECK(o3 == std::vector{"hash2"s});
    profile.confirm_pushed(s3, "hash3");

    // Unchanged values do not dirty the config
    profile.set_name("third");
    CHECK(profile.is_clean());
}

TEST_CASE("Config encryption keys", "[config][keys]") {
    auto keys = test_keys();
    Contacts contacts{keys.sk(), std::nullopt};
    CHECK(contacts.key_count() == 1);
    CHECK(contacts.key() == keys.sk().substr(0, 32));

    auto extra = "0000000000000000000000000000000000000000000000000000000000000001"_hexbytes;
    contacts.add_key(extra, false);
    CHECK(contacts.key_count() == 2);
    CHECK(contacts.key() == keys.sk().substr(0, 32));
    CHECK(contacts.has_key(extra));
    CHECK_THROWS_AS(contacts.add_key("short"_bytes), std::invalid_argument);

    // A message encrypted with the secondary key still merges
    Contacts other{keys.sk(), std::nullopt};
    other.add_key(extra);
    other.set_name(fake_id('5', '2'), "Bob");
    auto msg = push_message(other, "otherhash");
    CHECK(contacts.merge(std::vector<std::pair<std::string, ustring>>{{msg.hash, msg.data}}) ==
          std::vector{"otherhash"s});
    CHECK(contacts.get(fake_id('5', '2')));

    CHECK(contacts.clear_keys() == 2);
    CHECK_THROWS_AS(contacts.push(), std::logic_error);
    CHECK_THROWS_AS(
            contacts.merge(std::vector<std::pair<std::string, ustring>>{{msg.hash, msg.data}}),
            std::logic_error);
}

TEST_CASE("Signed configs", "[config][signing]") {
    auto keys = test_keys();
    auto signer = test_keys(7);

    UserProfile admin{keys.sk(), std::nullopt};
    admin.set_sig_keys(signer.sk());
    admin.set_name("signed");
    auto msg = push_message(admin, "signedhash");

    UserProfile member{keys.sk(), std::nullopt};
    member.set_sig_pubkey({signer.ed_pk.data(), signer.ed_pk.size()});
    CHECK(member.is_readonly());
    CHECK(member.merge(std::vector<std::pair<std::string, ustring>>{{msg.hash, msg.data}}) ==
          std::vector{"signedhash"s});
    CHECK(member.get_name() == "signed");
    CHECK_THROWS_AS(member.set_name("nope"), std::runtime_error);

    // Unsigned messages are rejected once a signing key is required
    UserProfile unsigned_profile{keys.sk(), std::nullopt};
    unsigned_profile.set_name("forged");
    auto forged = push_message(unsigned_profile, "forgedhash");
    CHECK(member.merge(std::vector<std::pair<std::string, ustring>>{{forged.hash, forged.data}})
                  .empty());
    CHECK(member.get_name() == "signed");
}

TEST_CASE("Config dumps keep push state", "[config][dump]") {
    auto keys = test_keys();
    UserProfile profile{keys.sk(), std::nullopt};
    profile.set_name("waiting");
    auto [seqno, data, obs] = profile.push();

    UserProfile restored{keys.sk(), profile.dump()};
    CHECK(restored.state() == ConfigState::Waiting);
    CHECK(restored.seqno() == seqno);
    restored.confirm_pushed(seqno, "late-confirm");
    CHECK(restored.is_clean());
    CHECK(restored.get_name() == "waiting");

    CHECK_THROWS_AS(UserProfile(keys.sk(), "d1:!i9ee"_bytes), config_parse_error);
}
