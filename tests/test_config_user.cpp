#include <catch2/catch_test_macros.hpp>
#include <swarmsync/config/contacts.hpp>
#include <swarmsync/config/convo_info_volatile.hpp>
#include <swarmsync/config/local.hpp>
#include <swarmsync/config/user_groups.hpp>
#include <swarmsync/config/user_profile.hpp>
#include <swarmsync/util.hpp>

#include "utils.hpp"

using namespace std::literals;
using namespace swarmsync;
using namespace swarmsync::config;

namespace {

bool has_event(const EventList& events, std::string_view key, std::string_view value) {
    for (auto& e : events)
        if (e.key == key && e.value == value)
            return true;
    return false;
}

}  // namespace

TEST_CASE("Contacts", "[config][contacts]") {
    auto keys = test_keys();
    Contacts contacts{keys.sk(), std::nullopt};

    const auto definitely_real_id = fake_id('5', '0');

    CHECK_FALSE(contacts.get(definitely_real_id));
    CHECK(contacts.empty());
    CHECK_FALSE(contacts.needs_push());
    CHECK_FALSE(contacts.needs_dump());
    CHECK(std::get<seqno_t>(contacts.push()) == 0);

    auto c = contacts.get_or_construct(definitely_real_id);
    CHECK(c.name.empty());
    CHECK_FALSE(c.approved);
    CHECK_FALSE(c.profile_picture);
    CHECK_FALSE(c.hidden());

    c.set_name("Joe");
    c.approved = true;
    c.approved_me = true;
    c.created = 1680064059;
    contacts.set(c);

    REQUIRE(contacts.get(definitely_real_id));
    CHECK(contacts.get(definitely_real_id)->name == "Joe");
    CHECK(contacts.get(definitely_real_id)->approved);
    CHECK(contacts.get(definitely_real_id)->approved_me);
    CHECK(contacts.get(definitely_real_id)->created == 1680064059);
    CHECK(contacts.size() == 1);

    auto events = contacts.take_events();
    CHECK(has_event(events, "contact." + definitely_real_id + ".name", "Joe"));
    CHECK(has_event(events, "contact." + definitely_real_id + ".approved", "1"));
    CHECK(contacts.take_events().empty());

    CHECK(contacts.needs_push());
    CHECK(contacts.needs_dump());
    CHECK(contacts.is_dirty());

    auto [seqno, to_push, obsolete] = contacts.push();
    CHECK(seqno == 1);
    CHECK(obsolete.empty());
    CHECK(contacts.state() == ConfigState::Waiting);
    CHECK(contacts.needs_push());

    contacts.confirm_pushed(seqno, "fakehash1");
    CHECK(contacts.is_clean());
    CHECK_FALSE(contacts.needs_push());
    CHECK(contacts.current_hashes() == std::vector{"fakehash1"s});

    SECTION("second device") {
        Contacts contacts2{keys.sk(), std::nullopt};
        CHECK(contacts2.merge(std::vector<std::pair<std::string, ustring>>{
                      {"fakehash1", to_push}}) == std::vector{"fakehash1"s});
        CHECK_FALSE(contacts2.needs_push());
        REQUIRE(contacts2.get(definitely_real_id));
        CHECK(contacts2.get(definitely_real_id)->name == "Joe");
        CHECK(has_event(
                contacts2.take_events(),
                "contact." + definitely_real_id + ".name",
                "Joe"));

        // Both devices change the contact; each merges the other's push and they converge
        contacts2.set_name(definitely_real_id, "Joey");
        contacts2.set_blocked(definitely_real_id, true);
        auto [s2, push2, obs2] = contacts2.push();
        CHECK(s2 == 2);
        CHECK(obs2 == std::vector{"fakehash1"s});
        contacts2.confirm_pushed(s2, "fakehash2");

        contacts.set_priority(definitely_real_id, 3);
        auto [s3, push3, obs3] = contacts.push();
        contacts.confirm_pushed(s3, "fakehash3");

        contacts.merge(std::vector<std::pair<std::string, ustring>>{{"fakehash2", push2}});
        contacts2.merge(std::vector<std::pair<std::string, ustring>>{{"fakehash3", push3}});

        for (auto* conf : {&contacts, &contacts2}) {
            auto joe = conf->get(definitely_real_id);
            REQUIRE(joe);
            CHECK(joe->name == "Joey");
            CHECK(joe->blocked);
            CHECK(joe->priority == 3);
        }
        CHECK(contacts.all() == contacts2.all());

        // Neither message has everything, so both need a new push
        CHECK(contacts.needs_push());
        CHECK(contacts2.needs_push());
    }

    SECTION("erase") {
        contacts.set_name(fake_id('5', '1'), "Second");
        CHECK(contacts.size() == 2);
        CHECK(contacts.erase(definitely_real_id));
        CHECK_FALSE(contacts.erase(definitely_real_id));
        CHECK(contacts.size() == 1);
        CHECK(contacts.all().front().session_id == fake_id('5', '1'));
    }

    SECTION("invalid ids") {
        CHECK_THROWS_AS(contacts.get_or_construct("05abc"), std::invalid_argument);
        CHECK_THROWS_AS(contacts.set_name(fake_id('3', '0'), "x"), std::invalid_argument);
    }

    SECTION("readonly merge of garbage") {
        CHECK(contacts.merge(std::vector<std::pair<std::string, ustring>>{
                                     {"junk", "not a config message"_bytes}})
                      .empty());
        CHECK(contacts.is_clean());
    }
}

TEST_CASE("Contacts from another account cannot be merged", "[config][contacts]") {
    Contacts mine{test_keys(0).sk(), std::nullopt};
    Contacts theirs{test_keys(1).sk(), std::nullopt};

    theirs.set_name(fake_id('5', '2'), "Eve");
    auto msg = push_message(theirs, "theirhash");

    CHECK(mine.merge(std::vector<std::pair<std::string, ustring>>{{msg.hash, msg.data}}).empty());
    CHECK(mine.empty());
}

TEST_CASE("User profile", "[config][user_profile]") {
    auto keys = test_keys();
    UserProfile profile{keys.sk(), std::nullopt};

    CHECK_FALSE(profile.get_name());
    CHECK_FALSE(profile.get_profile_pic());
    CHECK(profile.get_nts_priority() == 0);
    CHECK_FALSE(profile.get_nts_expiry());
    CHECK_FALSE(profile.get_blinded_msgreqs());

    profile.set_name("Kallie");
    profile.set_profile_pic(
            "http://example.org/omg-pic-123.bmp",
            "secret78901234567890123456789012"_bytes);
    profile.set_nts_priority(9);
    profile.set_blinded_msgreqs(true);

    CHECK(profile.get_name() == "Kallie");
    auto pic = profile.get_profile_pic();
    CHECK(pic);
    CHECK(pic.url == "http://example.org/omg-pic-123.bmp");
    CHECK(pic.key == "secret78901234567890123456789012"_bytes);
    CHECK(profile.get_nts_priority() == 9);
    CHECK(profile.get_blinded_msgreqs() == true);

    auto events = profile.take_events();
    CHECK(has_event(events, "profile.name", "Kallie"));
    CHECK(has_event(events, "profile.nts_priority", "9"));

    CHECK_THROWS_AS(profile.set_name(std::string(101, 'x')), std::invalid_argument);
    profile.set_name_truncated(std::string(120, 'x'));
    CHECK(profile.get_name() == std::string(100, 'x'));

    // A key of the wrong size clears the picture
    profile.set_profile_pic("http://example.org/pic", "too short"_bytes);
    CHECK_FALSE(profile.get_profile_pic());
    CHECK_THROWS_AS(profile_pic("http://example.org/pic", "too short"_bytes), std::invalid_argument);
}

TEST_CASE("Conversation read state", "[config][convo_info_volatile]") {
    auto keys = test_keys();
    ConvoInfoVolatile convos{keys.sk(), std::nullopt};

    const auto now = get_timestamp_ms();
    const auto contact = fake_id('5', '5');
    const auto group = fake_id('3', '3');

    auto c = convos.get_or_construct_1to1(contact);
    CHECK(c.last_read == 0);
    c.last_read = now - 2 * 3600'000;
    convos.set(c);

    auto g = convos.get_or_construct_group(group);
    g.unread = true;
    convos.set(g);

    auto og = convos.get_or_construct_community("http://Example.ORG:5678", "SudokuRoom");
    og.last_read = now - 3 * 3600'000;
    convos.set(og);

    REQUIRE(convos.get_1to1(contact));
    CHECK(convos.get_1to1(contact)->last_read == now - 2 * 3600'000);
    REQUIRE(convos.get_group(group));
    CHECK(convos.get_group(group)->unread);
    REQUIRE(convos.get_community("http://example.org:5678", "sudokuroom"));
    CHECK(convos.get_community("http://example.org:5678", "sudokuroom")->last_read == now - 3 * 3600'000);
    CHECK(convos.size() == 3);
    CHECK(convos.size_1to1() == 1);

    CHECK(has_event(
            convos.take_events(), "convo." + contact + ".last_read", std::to_string(now - 2 * 3600'000)));

    SECTION("stale entries are ignored and pruned") {
        auto old = convos.get_or_construct_1to1(fake_id('5', '6'));
        old.last_read = now - std::chrono::milliseconds{ConvoInfoVolatile::PRUNE_LOW}.count() - 1000;
        convos.set(old);
        CHECK_FALSE(convos.get_1to1(fake_id('5', '6')));

        CHECK(convos.prune_stale(1h) == 2);
        // The unread group survives pruning
        CHECK(convos.get_group(group));
        CHECK(convos.size() == 1);
    }
}

TEST_CASE("User groups", "[config][user_groups]") {
    auto keys = test_keys();
    UserGroups groups{keys.sk(), std::nullopt};

    auto created = groups.create_group();
    CHECK(created.is_admin());
    CHECK(created.id.size() == 66);
    CHECK(created.id.substr(0, 2) == "03");
    created.name = "Admins only";
    created.joined_at = 1700000000;
    groups.set(created);

    auto invited = groups.get_or_construct_group(fake_id('3', '4'));
    invited.invited = true;
    invited.auth_data = ustring(100, 0x42);
    invited.priority = -1;
    groups.set(invited);

    auto community = groups.get_or_construct_community(
            "https://Example.com",
            "Lobby",
            "0123456789abcdef0123456789abcdef0123456789abcdef0123456789abcdef"sv);
    community.priority = 7;
    groups.set(community);

    CHECK(groups.size() == 3);
    CHECK(groups.size_groups() == 2);
    CHECK(groups.size_communities() == 1);

    auto g = groups.get_group(created.id);
    REQUIRE(g);
    CHECK(g->is_admin());
    CHECK(g->name == "Admins only");
    CHECK(g->joined_at == 1700000000);

    g = groups.get_group(fake_id('3', '4'));
    REQUIRE(g);
    CHECK_FALSE(g->is_admin());
    CHECK(g->invited);
    CHECK(g->auth_data == ustring(100, 0x42));
    CHECK(g->priority == -1);

    auto comm = groups.get_community("https://example.com", "lobby");
    REQUIRE(comm);
    CHECK(comm->priority == 7);
    CHECK(comm->pubkey_hex() ==
          "0123456789abcdef0123456789abcdef0123456789abcdef0123456789abcdef");

    // Keys never show up in events
    for (auto& e : groups.take_events())
        CHECK(e.value != to_hex(created.secretkey));

    CHECK(groups.erase_group(fake_id('3', '4')));
    CHECK(groups.erase_community("https://example.com", "Lobby"));
    CHECK(groups.size() == 1);
}

TEST_CASE("Local settings", "[config][local]") {
    Local local{std::nullopt};
    CHECK_FALSE(local.needs_push());

    local.set("theme", "dark"s);
    local.set("font_size", 14);
    CHECK(local.get_string("theme") == "dark");
    CHECK(local.get_int("font_size") == 14);
    CHECK_FALSE(local.get_int("theme"));
    CHECK(local.settings().size() == 2);

    CHECK(has_event(local.take_events(), "local.theme", "dark"));

    // Dirty, but never pushed
    CHECK_FALSE(local.needs_push());
    CHECK(local.needs_dump());

    Local restored{local.dump()};
    CHECK(restored.get_string("theme") == "dark");
    CHECK(restored.get_int("font_size") == 14);

    CHECK(restored.erase("theme"));
    CHECK_FALSE(restored.get_string("theme"));
}

TEST_CASE("Config dump round trip", "[config][dump]") {
    auto keys = test_keys();

    SECTION("contacts") {
        Contacts contacts{keys.sk(), std::nullopt};
        contacts.set_name(fake_id('5', '1'), "Alice");
        contacts.set_profile_pic(
                fake_id('5', '1'),
                {"http://example.org/alice.png", "qwerty78901234567890123456789012"_bytes});
        contacts.set_approved(fake_id('5', '1'), true);
        contacts.set_name(fake_id('5', '2'), "Bob");
        contacts.set_priority(fake_id('5', '2'), -1);
        auto [seqno, data, obs] = contacts.push();
        contacts.confirm_pushed(seqno, "pushed");
        contacts.set_blocked(fake_id('5', '2'), true);

        auto dump = contacts.dump();
        CHECK_FALSE(contacts.needs_dump());

        Contacts restored{keys.sk(), dump};
        CHECK(restored.all() == contacts.all());
        CHECK(restored.state() == contacts.state());
        CHECK(restored.seqno() == contacts.seqno());
        CHECK(restored.needs_push());
        CHECK(restored.writer_id() == contacts.writer_id());
        CHECK_FALSE(restored.needs_dump());
        CHECK(restored.get(fake_id('5', '2'))->hidden());

        // Pushing from the restored copy still obsoletes what the original pushed
        auto [s2, d2, obsolete] = restored.push();
        CHECK(s2 == seqno + 1);
        CHECK(obsolete == std::vector{"pushed"s});
    }

    SECTION("user profile") {
        UserProfile profile{keys.sk(), std::nullopt};
        profile.set_name("Kallie");
        profile.set_nts_priority(2);
        auto [seqno, data, obs] = profile.push();
        profile.confirm_pushed(seqno, "profilehash");

        UserProfile restored{keys.sk(), profile.dump()};
        CHECK(restored.get_name() == "Kallie");
        CHECK(restored.get_nts_priority() == 2);
        CHECK(restored.is_clean());
        CHECK(restored.current_hashes() == std::vector{"profilehash"s});
    }

    SECTION("garbage") {
        CHECK_THROWS_AS(Contacts(keys.sk(), "garbage"_bytes), config_parse_error);
    }
}
