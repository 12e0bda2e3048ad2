#include <catch2/catch_test_macros.hpp>
#include <swarmsync/config.hpp>

#include "utils.hpp"

using namespace std::literals;
using swarmsync::config::ConfigData;
using swarmsync::config::field_key;
using swarmsync::config::scalar;

namespace {

ConfigData sample_a() {
    ConfigData d;
    d.seqno(3);
    d.set("c05aa", "n", scalar{"Alice"s}, 1000, "a");
    d.set("c05aa", "+", scalar{int64_t{2}}, 1000, "a");
    d.set("c05bb", "n", scalar{"Bob"s}, 1500, "a");
    d.set_insert("admins", "05aa", 1000);
    return d;
}

ConfigData sample_b() {
    ConfigData d;
    d.seqno(5);
    d.set("c05aa", "n", scalar{"Alicia"s}, 2000, "b");
    d.set("c05bb", "n", scalar{"Robert"s}, 1200, "b");
    d.set("c05cc", "n", scalar{"Carol"s}, 1800, "b");
    d.set_insert("admins", "05cc", 1100);
    return d;
}

ConfigData sample_c() {
    ConfigData d;
    d.seqno(4);
    d.set("c05aa", "n", scalar{"Ally"s}, 2000, "c");
    d.set("c05cc", "n", scalar{"Caroline"s}, 1850, "c");
    d.set("c05cc", "n", std::nullopt, 1900, "c");
    d.set_insert("admins", "05aa", 500);
    d.set_erase("admins", "05aa", 900);
    return d;
}

ConfigData merged(std::initializer_list<ConfigData> parts) {
    ConfigData out;
    for (auto& p : parts)
        out.merge(p);
    return out;
}

}  // namespace

TEST_CASE("ConfigData fields", "[config][data]") {
    ConfigData d;
    CHECK_FALSE(d.set("r", "f", std::nullopt, 1000, "w"));
    CHECK(d.set("r", "f", scalar{int64_t{5}}, 1000, "w"));
    CHECK_FALSE(d.set("r", "f", scalar{int64_t{5}}, 2000, "w"));
    CHECK(d.get_int("r", "f") == 5);
    CHECK_FALSE(d.get_string("r", "f"));

    // A later local write always moves the timestamp forward, even with a stale clock
    CHECK(d.set("r", "f", scalar{"x"s}, 10, "w"));
    REQUIRE(d.field("r", "f"));
    CHECK(d.field("r", "f")->timestamp_ms == 1001);
    CHECK(d.get_string("r", "f") == "x");

    CHECK(d.has_record("r"));
    auto erased = d.erase_record("r", 1500, "w");
    CHECK(erased == std::vector<field_key>{{"r", "f"}});
    CHECK_FALSE(d.has_record("r"));
    CHECK(d.field("r", "f"));
    CHECK(d.field("r", "f")->deleted());
}

TEST_CASE("ConfigData sets", "[config][data]") {
    ConfigData d;
    CHECK(d.set_insert("s", "x", 1000));
    CHECK_FALSE(d.set_insert("s", "x", 1100));
    CHECK(d.set_insert("s", "y", 1000));
    CHECK(d.set_elements("s") == std::vector{"x"s, "y"s});
    CHECK(d.set_erase("s", "x", 1200));
    CHECK_FALSE(d.set_contains("s", "x"));
    CHECK_FALSE(d.set_erase("s", "x", 1300));

    SECTION("add wins on equal timestamps") {
        ConfigData removes;
        removes.set_insert("s", "z", 1000);
        removes.set_erase("s", "z", 1500);

        ConfigData adds;
        adds.set_insert("s", "z", 1500);
        removes.merge(adds);
        CHECK(removes.set_contains("s", "z"));
    }
}

TEST_CASE("ConfigData merge resolution", "[config][data]") {
    auto d = merged({sample_a(), sample_b(), sample_c()});

    // Same timestamp: the greater writer id wins
    CHECK(d.get_string("c05aa", "n") == "Ally");
    // Greater timestamp wins
    CHECK(d.get_string("c05bb", "n") == "Bob");
    // Tombstones win like any other value
    CHECK_FALSE(d.get("c05cc", "n"));
    CHECK(d.get_int("c05aa", "+") == 2);
    // Seqno merges as the max
    CHECK(d.seqno() == 5);
    CHECK(d.set_elements("admins") == std::vector{"05aa"s, "05cc"s});
}

TEST_CASE("ConfigData merge is commutative, associative and idempotent", "[config][data]") {
    auto abc = merged({sample_a(), sample_b(), sample_c()});
    auto cba = merged({sample_c(), sample_b(), sample_a()});
    auto bac = merged({sample_b(), sample_a(), sample_c()});
    CHECK(abc.same_content(cba));
    CHECK(abc.same_content(bac));
    CHECK(abc.hash() == cba.hash());

    // (a . b) . c == a . (b . c)
    auto ab = merged({sample_a(), sample_b()});
    ab.merge(sample_c());
    auto bc = merged({sample_b(), sample_c()});
    auto a = sample_a();
    a.merge(bc);
    CHECK(ab.same_content(a));

    bool modified = true;
    auto copy = abc;
    auto changes = abc.merge(copy, &modified);
    CHECK_FALSE(modified);
    CHECK(changes.empty());

    modified = true;
    changes = abc.merge(sample_b(), &modified);
    CHECK_FALSE(modified);
    CHECK(changes.empty());
}

TEST_CASE("ConfigData merge reports changes", "[config][data]") {
    auto d = sample_a();
    bool modified = false;
    auto changes = d.merge(sample_b(), &modified);
    CHECK(modified);
    CHECK(changes.fields ==
          std::set<field_key>{{"c05aa", "n"}, {"c05cc", "n"}});
    CHECK(changes.set_elements == std::set<field_key>{{"admins", "05cc"}});
}

TEST_CASE("ConfigData serialization", "[config][data]") {
    auto d = merged({sample_a(), sample_b(), sample_c()});
    auto serialized = d.serialize();

    ConfigData parsed{serialized};
    CHECK(parsed.same_content(d));
    CHECK(parsed.seqno() == d.seqno());
    CHECK(parsed.hash() == d.hash());
    CHECK(parsed.serialize() == serialized);

    CHECK_THROWS_AS(ConfigData{"de"_bytes}, swarmsync::config_parse_error);

    SECTION("signed") {
        auto signer = [](ustring_view) { return ustring(64, 'S'); };
        auto signed_data = d.serialize(signer);

        bool called = false;
        ConfigData ok{signed_data, [&](ustring_view, ustring_view sig) {
                          called = true;
                          return sig == ustring(64, 'S');
                      }};
        CHECK(called);
        CHECK(ok.same_content(d));

        CHECK_THROWS_AS(
                ConfigData(signed_data, [](ustring_view, ustring_view) { return false; }),
                swarmsync::signature_error);
        CHECK_THROWS_AS(
                ConfigData(serialized, [](ustring_view, ustring_view) { return true; }),
                swarmsync::signature_error);
    }
}
