// grafiek_structures SlotMap tests

#include <catch2/catch_test_macros.hpp>
#include <grafiek/structures/slot_map.hpp>
#include <memory>
#include <string>
#include <unordered_set>

using namespace grafiek_structures;

// =============================================================================
// SlotKey Tests
// =============================================================================

TEST_CASE("SlotKey construction", "[structures][slotkey]") {
    SECTION("default is null") {
        SlotKey<int> key;
        REQUIRE(key.is_null());
        REQUIRE_FALSE(static_cast<bool>(key));
    }

    SECTION("from index and generation") {
        SlotKey<int> key(5, 3);
        REQUIRE(key.index == 5);
        REQUIRE(key.generation == 3);
        REQUIRE(key.is_valid());
    }
}

TEST_CASE("SlotKey comparison and hashing", "[structures][slotkey]") {
    SlotKey<int> a(1, 1);
    SlotKey<int> b(1, 1);
    SlotKey<int> c(1, 2);

    REQUIRE(a == b);
    REQUIRE(a != c);
    REQUIRE(a < c);

    std::unordered_set<SlotKey<int>> set{a};
    REQUIRE(set.count(b) == 1);
    REQUIRE(set.count(c) == 0);
}

// =============================================================================
// SlotMap Tests
// =============================================================================

TEST_CASE("SlotMap insert and get", "[structures][slotmap]") {
    SlotMap<std::string> map;
    REQUIRE(map.empty());

    auto hello = map.insert("hello");
    auto world = map.insert("world");

    REQUIRE(map.size() == 2);
    REQUIRE(*map.get(hello) == "hello");
    REQUIRE(map.at(world) == "world");

    SECTION("mutation through get") {
        *map.get(hello) = "changed";
        REQUIRE(map.at(hello) == "changed");
    }

    SECTION("null key lookup") {
        REQUIRE(map.get(SlotKey<std::string>::null()) == nullptr);
        REQUIRE_THROWS_AS(map.at(SlotKey<std::string>::null()), std::out_of_range);
    }
}

TEST_CASE("SlotMap removal keeps other keys stable", "[structures][slotmap]") {
    SlotMap<int> map;
    auto a = map.insert(1);
    auto b = map.insert(2);
    auto c = map.insert(3);

    auto removed = map.remove(b);
    REQUIRE(removed.has_value());
    REQUIRE(*removed == 2);
    REQUIRE(map.size() == 2);

    REQUIRE(*map.get(a) == 1);
    REQUIRE(*map.get(c) == 3);
    REQUIRE_FALSE(map.contains_key(b));
    REQUIRE_FALSE(map.remove(b).has_value());
}

TEST_CASE("SlotMap detects stale keys after slot reuse", "[structures][slotmap]") {
    SlotMap<int> map;
    auto first = map.insert(10);
    REQUIRE(map.remove(first).has_value());

    auto second = map.insert(20);
    REQUIRE(second.index == first.index);
    REQUIRE(second.generation != first.generation);
    REQUIRE(map.get(first) == nullptr);
    REQUIRE(*map.get(second) == 20);
    REQUIRE(map.slot_count() == 1);
}

TEST_CASE("SlotMap holds move-only values", "[structures][slotmap]") {
    SlotMap<std::unique_ptr<int>> map;
    auto key = map.insert(std::make_unique<int>(7));
    REQUIRE(**map.get(key) == 7);

    auto out = map.remove(key);
    REQUIRE(out.has_value());
    REQUIRE(**out == 7);
}

TEST_CASE("SlotMap traversal", "[structures][slotmap]") {
    SlotMap<int> map;
    auto a = map.insert(1);
    auto b = map.insert(2);
    auto c = map.insert(3);
    REQUIRE(map.remove(b).has_value());

    SECTION("keys skip removed slots") {
        auto keys = map.keys();
        REQUIRE(keys.size() == 2);
        REQUIRE(keys[0] == a);
        REQUIRE(keys[1] == c);
    }

    SECTION("for_each visits live values") {
        int sum = 0;
        map.for_each([&](SlotKey<int>, int& value) { sum += value; });
        REQUIRE(sum == 4);
    }

    SECTION("clear invalidates everything") {
        map.clear();
        REQUIRE(map.empty());
        REQUIRE(map.get(a) == nullptr);
        auto fresh = map.insert(9);
        REQUIRE(*map.get(fresh) == 9);
    }
}
