#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <swarmsync/config/groups/group_configs.hpp>
#include <swarmsync/ed25519.hpp>
#include <swarmsync/errors.hpp>

#include "utils.hpp"

using namespace std::literals;
using namespace swarmsync;
using namespace swarmsync::config;
using namespace swarmsync::config::groups;

namespace {

struct GroupKeyPair {
    std::array<unsigned char, 32> pk;
    std::array<unsigned char, 64> sk;

    ustring_view pubkey() const { return {pk.data(), pk.size()}; }
    ustring_view secret() const { return {sk.data(), sk.size()}; }
    ustring_view seed() const { return {sk.data(), 32}; }
};

GroupKeyPair group_keys(unsigned char n) {
    auto seed = "00112233445566778899aabbccddeeff00112233445566778899aabbccddeeff"_hexbytes;
    seed[31] = n;
    GroupKeyPair g;
    std::tie(g.pk, g.sk) = ed25519::ed25519_key_pair(seed);
    return g;
}

std::vector<std::pair<std::string, ustring>> as_batch(const ConfigMessage& m) {
    return {{m.hash, m.data}};
}

}  // namespace

TEST_CASE("Group configs for an admin", "[config][groups]") {
    auto gk = group_keys(1);
    auto me = test_keys(0);
    GroupConfigs admin{me.sk(), gk.pubkey(), gk.secret()};

    CHECK(admin.admin());
    CHECK(admin.id() == "03" + to_hex(gk.pubkey()));
    CHECK(admin.keys().current_generation() == 0);
    CHECK(admin.info().key_count() == 1);
    CHECK(admin.members().key_count() == 1);
    // The initial rekey leaves the info and members needing a push
    CHECK(admin.info().needs_push());
    CHECK(admin.members().needs_push());

    auto key_events = admin.keys().take_events();
    REQUIRE(key_events.size() == 1);
    CHECK(key_events[0] == ObservedEvent{"group." + admin.id() + ".keys", "0"});

    admin.info().set_name("Test group");
    admin.info().set_description("Things happen here");
    admin.info().set_created(1700000000);

    auto m = admin.members().get_or_construct(fake_id('5', '1'));
    m.admin = true;
    m.set_name("Admin");
    admin.members().set(m);

    auto invited = admin.members().get_or_construct(fake_id('5', '2'));
    invited.set_invited();
    admin.members().set(invited);

    CHECK(admin.members().size() == 2);
    CHECK(admin.members().admins() == std::vector{fake_id('5', '1')});
    CHECK(admin.members().get(fake_id('5', '2'))->invite_pending());

    auto info_events = admin.info().take_events();
    CHECK(std::count(
                  info_events.begin(),
                  info_events.end(),
                  ObservedEvent{"group." + admin.id() + ".name", "Test group"}) == 1);

    auto member_events = admin.members().take_events();
    CHECK(std::count(
                  member_events.begin(),
                  member_events.end(),
                  ObservedEvent{
                          "group." + admin.id() + ".member." + fake_id('5', '1') + ".admin",
                          "1"}) == 1);

    CHECK(&admin.get(ConfigVariant::GroupInfo) == &admin.info());
    CHECK(&admin.get(ConfigVariant::GroupKeys) == &admin.keys());
    CHECK_THROWS_AS(admin.get(ConfigVariant::Contacts), std::invalid_argument);

    SECTION("rekeying keeps older messages readable") {
        auto old_info = push_message(admin.info(), "info1");
        auto friend_keys = test_keys(1);
        admin.members().set(admin.members().get_or_construct(friend_keys.session_id));
        CHECK(admin.keys().rekey() == 1);
        CHECK(admin.keys().size() == 2);
        CHECK(admin.info().key_count() == 2);
        CHECK(admin.info().is_dirty());

        // Generation 0 was issued before they joined, so only the admin copy opens it
        GroupConfigs other{friend_keys.sk(), gk.pubkey(), std::nullopt};
        auto keys_msg = push_message(admin.keys(), "keys1");
        other.keys().merge(as_batch(keys_msg));
        CHECK(other.keys().current_generation() == 1);
        CHECK(other.keys().size() == 1);
        CHECK(other.info().merge(as_batch(old_info)).empty());

        auto new_info = push_message(admin.info(), "info2");
        CHECK(other.info().merge(as_batch(new_info)) == std::vector{"info2"s});
        CHECK(other.info().get_name() == "Test group");

        // Promotion opens every generation
        other.load_admin_key(gk.secret());
        CHECK(other.keys().size() == 2);
        CHECK(other.info().key_count() == 2);
    }
}

TEST_CASE("Group configs for a regular member", "[config][groups]") {
    auto gk = group_keys(2);
    auto admin_user = test_keys(0);
    auto member_user = test_keys(1);
    GroupConfigs admin{admin_user.sk(), gk.pubkey(), gk.secret()};
    admin.info().set_name("Members only");
    auto mem = admin.members().get_or_construct(member_user.session_id);
    mem.set_name("Someone");
    admin.members().set(mem);
    CHECK(admin.keys().rekey() == 1);

    auto keys_msg = push_message(admin.keys(), "keys");
    auto info_msg = push_message(admin.info(), "info");
    auto members_msg = push_message(admin.members(), "members");

    GroupConfigs member{member_user.sk(), gk.pubkey(), std::nullopt};
    CHECK_FALSE(member.admin());
    CHECK(member.info().is_readonly());
    CHECK_FALSE(member.keys().current_generation());

    // Without the group keys the info cannot be decrypted yet
    CHECK_THROWS_AS(member.info().merge(as_batch(info_msg)), std::logic_error);

    CHECK(member.keys().merge(as_batch(keys_msg)) == std::vector{"keys"s});
    CHECK(member.keys().current_generation() == 1);
    CHECK(member.info().merge(as_batch(info_msg)) == std::vector{"info"s});
    CHECK(member.members().merge(as_batch(members_msg)) == std::vector{"members"s});

    CHECK(member.info().get_name() == "Members only");
    REQUIRE(member.members().get(member_user.session_id));
    CHECK(member.members().get(member_user.session_id)->name == "Someone");

    // Readonly objects never need pushing
    CHECK(member.info().is_clean());
    CHECK_THROWS_AS(member.info().set_name("nope"), std::runtime_error);
    CHECK_THROWS_AS(member.keys().rekey(), admin_violation);

    SECTION("messages not signed by the group are dropped") {
        auto other = group_keys(3);
        GroupConfigs impostor{admin_user.sk(), other.pubkey(), other.secret()};
        // Re-encrypt under the real group's keys so only the signature differs
        impostor.info().replace_keys(member.info().get_keys());
        impostor.info().set_name("Hijacked");
        auto forged = push_message(impostor.info(), "forged");
        CHECK(member.info().merge(as_batch(forged)).empty());
        CHECK(member.info().get_name() == "Members only");
    }

    SECTION("loading the admin key") {
        CHECK_THROWS_AS(
                member.load_admin_key(group_keys(4).secret()), std::invalid_argument);
        CHECK_FALSE(member.admin());

        member.load_admin_key(gk.seed());
        CHECK(member.admin());
        CHECK_FALSE(member.info().is_readonly());
        member.info().set_name("Promoted");
        CHECK(member.info().needs_push());
    }

    SECTION("someone who is not a member") {
        GroupConfigs outsider{test_keys(2).sk(), gk.pubkey(), std::nullopt};
        // The keys message itself opens for anyone who knows the group id...
        CHECK(outsider.keys().merge(as_batch(keys_msg)) == std::vector{"keys"s});
        // ...but none of the generation keys inside it does
        CHECK_FALSE(outsider.keys().current_generation());
        CHECK(outsider.keys().group_keys().empty());
        CHECK(outsider.info().key_count() == 0);
        CHECK_THROWS_AS(outsider.info().merge(as_batch(info_msg)), std::logic_error);
        CHECK_FALSE(outsider.info().get_name());

        // Nor does the info open with the key an outsider can derive for the keys message
        outsider.info().replace_keys(outsider.keys().get_keys());
        CHECK(outsider.info().merge(as_batch(info_msg)).empty());
        CHECK_FALSE(outsider.info().get_name());
    }

    SECTION("dumps") {
        GroupConfigs restored{
                member_user.sk(),
                gk.pubkey(),
                std::nullopt,
                member.info().dump(),
                member.members().dump(),
                member.keys().dump()};
        CHECK(restored.keys().current_generation() == 1);
        CHECK(restored.info().key_count() == 1);
        CHECK(restored.info().get_name() == "Members only");
        CHECK(restored.members().size() == 1);
    }
}
