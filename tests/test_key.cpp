#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <libwire.hpp>

#include <string>
#include <unordered_set>

using namespace libwire;

namespace {

struct Connection {};

} // namespace

TEST_CASE("Key: equal labels compare equal", "[key]") {
    REQUIRE(key("hash") == key("hash"));
    REQUIRE_FALSE(key("hash") == key("salt"));
    REQUIRE(key("hash").hash() == key("hash").hash());
}

TEST_CASE("Key: composite keys match only when every part matches", "[key]") {
    key a{"db", "primary"};
    key b{"db", "primary"};
    key c{"db", "replica"};
    key d{"primary", "db"};

    REQUIRE(a == b);
    REQUIRE_FALSE(a == c);
    REQUIRE_FALSE(a == d);
    REQUIRE(a.parts().size() == 2);
    REQUIRE(a.label() == "db:primary");
}

TEST_CASE("Key: single-part brace form equals string form", "[key]") {
    REQUIRE(key{"hash"} == key("hash"));
}

TEST_CASE("dependency_key: named and type keys never collide", "[key]") {
    dependency_key named_key = key("Connection");
    dependency_key typed_key = type_key<Connection>();

    REQUIRE(named_key.is_named());
    REQUIRE(typed_key.is_type());
    REQUIRE_FALSE(named_key == typed_key);
    REQUIRE(named_key.named() != nullptr);
    REQUIRE(typed_key.named() == nullptr);
    REQUIRE(typed_key.type() == std::type_index(typeid(Connection)));
    REQUIRE_FALSE(named_key.type().has_value());
}

TEST_CASE("dependency_key: usable in unordered containers", "[key]") {
    std::unordered_set<dependency_key> keys;
    keys.insert(key("a"));
    keys.insert(key("a"));
    keys.insert(key{"a", "b"});
    keys.insert(type_key<int>());
    keys.insert(type_key<int>());

    REQUIRE(keys.size() == 3);
    REQUIRE(keys.contains(key{"a", "b"}));
    REQUIRE(keys.contains(type_key<int>()));
}

TEST_CASE("dependency_key: to_string names the key", "[key]") {
    dependency_key named_key = key("hash");
    REQUIRE_THAT(named_key.to_string(), Catch::Matchers::ContainsSubstring("hash"));

    REQUIRE_THAT(type_key<Connection>().to_string(),
                 Catch::Matchers::ContainsSubstring("Connection"));
}
