#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

#include "gentrie/trie.hpp"

using namespace gentrie;
using ::testing::ElementsAre;
using ::testing::Pair;

namespace {
enum class Suit : std::uint8_t { Clubs, Diamonds, Hearts, Spades };

struct Card {
    Suit suit;
    int rank;

    friend auto operator==(const Card& lhs, const Card& rhs) -> bool {
        return lhs.suit == rhs.suit && lhs.rank == rhs.rank;
    }
};
}  // namespace

template <>
struct gentrie::KeyShape<Card> {
    using shape_type = shape::Wrap<shape::Fields<Suit, int>, "Card">;
    static auto toShape(const Card& card) -> shape_type {
        return {shape::makeFields(card.suit, card.rank)};
    }
    static auto fromShape(const shape_type& shape) -> Card {
        auto [suit, rank] = shape::takeFields<Suit, int>(shape.inner);
        return {suit, rank};
    }
};

TEST(InstancesTest, OptionalKeys) {
    DerivedMap<std::optional<int>, std::string> map;
    map.insert(std::nullopt, "none");
    map.insert(5, "five");
    map.insert(-5, "minus five");
    EXPECT_THAT(map.keys(), ElementsAre(std::optional<int>(), std::optional<int>(-5),
                                        std::optional<int>(5)));

    DerivedMap<std::optional<int>, std::string> noneOnly;
    noneOnly.insert(std::nullopt, "none");
    EXPECT_TRUE(map.erase(5));
    EXPECT_TRUE(map.erase(-5));
    EXPECT_EQ(map, noneOnly);
    EXPECT_TRUE(map.validate());
}

TEST(InstancesTest, NestedOptional) {
    using Key = std::optional<std::optional<bool>>;
    DerivedMap<Key, int> map;
    map.insert(Key{}, 0);
    map.insert(Key{std::optional<bool>{}}, 1);
    map.insert(Key{true}, 2);
    EXPECT_EQ(map.size(), 3U);
    EXPECT_EQ(map.lookup(Key{std::optional<bool>{}}), std::optional<int>(1));
    EXPECT_FALSE(map.contains(Key{false}));
}

TEST(InstancesTest, VariantKeysOrderedByAlternative) {
    using Key = std::variant<int, std::string, bool>;
    DerivedMap<Key, int> map;
    map.insert(Key{true}, 3);
    map.insert(Key{std::string("x")}, 2);
    map.insert(Key{7}, 1);
    EXPECT_THAT(map.keys(), ElementsAre(Key{7}, Key{std::string("x")}, Key{true}));
    EXPECT_FALSE(map.contains(Key{false}));
    EXPECT_FALSE(map.contains(Key{std::string("y")}));
}

TEST(InstancesTest, SingleAlternativeVariant) {
    using Key = std::variant<int>;
    DerivedMap<Key, int> map;
    map.insert(Key{4}, 4);
    EXPECT_EQ(map.lookup(Key{4}), std::optional<int>(4));
}

TEST(InstancesTest, PairKeysSharePrefix) {
    DerivedMap<std::pair<int, bool>, std::string> map;
    map.insert({1, false}, "1f");
    map.insert({1, true}, "1t");
    map.insert({0, true}, "0t");
    EXPECT_THAT(map.toPairs(),
                ElementsAre(Pair(std::pair(0, true), "0t"),
                            Pair(std::pair(1, false), "1f"),
                            Pair(std::pair(1, true), "1t")));
    EXPECT_TRUE(map.erase({1, false}));
    EXPECT_TRUE(map.erase({1, true}));
    EXPECT_EQ(map.size(), 1U);
    EXPECT_TRUE(map.validate());
}

TEST(InstancesTest, TuplesOfEveryArity) {
    DerivedMap<std::tuple<>, int> unit;
    unit.insert({}, 1);
    unit.insert({}, 2);
    EXPECT_EQ(unit.size(), 1U);
    EXPECT_EQ(unit.lookup({}), std::optional<int>(2));

    DerivedMap<std::tuple<int>, int> single;
    single.insert(std::tuple<int>{3}, 3);
    EXPECT_TRUE(single.contains(std::tuple<int>{3}));

    using Wide = std::tuple<int, bool, char, std::int64_t, std::string,
                            std::optional<int>, std::uint16_t>;
    DerivedMap<Wide, int> wide;
    Wide a{1, true, 'a', std::int64_t{1} << 40, "s", std::nullopt, 9};
    Wide b{1, true, 'a', std::int64_t{1} << 40, "s", 4, 9};
    wide.insert(a, 1);
    wide.insert(b, 2);
    EXPECT_EQ(wide.lookup(a), std::optional<int>(1));
    EXPECT_EQ(wide.lookup(b), std::optional<int>(2));
    EXPECT_THAT(wide.keys(), ElementsAre(a, b));
}

TEST(InstancesTest, MonostateAndOrdering) {
    DerivedMap<std::monostate, int> unit;
    unit.insert({}, 1);
    EXPECT_TRUE(unit.contains({}));

    DerivedMap<std::strong_ordering, std::string> names;
    names.insert(std::strong_ordering::greater, "gt");
    names.insert(std::strong_ordering::less, "lt");
    names.insert(std::strong_ordering::equal, "eq");
    EXPECT_EQ(names.fold([](std::string acc, const std::string& v) {
                  return acc + v;
              }, std::string{}),
              "lteqgt");
    EXPECT_TRUE(names.erase(std::strong_ordering::equal));
    EXPECT_FALSE(names.contains(std::strong_ordering::equal));
    EXPECT_TRUE(names.validate());
}

TEST(InstancesTest, StringKeys) {
    DerivedMap<std::string, int> words;
    words.insert("tea", 1);
    words.insert("ten", 2);
    words.insert("te", 3);
    words.insert("", 0);
    EXPECT_THAT(words.keys(), ElementsAre("", "te", "tea", "ten"));
    EXPECT_FALSE(words.contains("t"));
    EXPECT_TRUE(words.erase("te"));
    EXPECT_EQ(words.lookup("tea"), std::optional<int>(1));
}

TEST(InstancesTest, BoolSequences) {
    DerivedMap<std::vector<bool>, int> bits;
    bits.insert({true, false}, 2);
    bits.insert({false}, 1);
    bits.insert({true}, 3);
    EXPECT_THAT(bits.keys(),
                ElementsAre(std::vector<bool>{false}, std::vector<bool>{true},
                            std::vector<bool>{true, false}));
}

TEST(InstancesTest, NestedSequences) {
    using Key = std::vector<std::vector<int>>;
    DerivedMap<Key, int> map;
    map.insert({{1, 2}, {3}}, 1);
    map.insert({{1, 2}}, 2);
    map.insert({{}, {}}, 3);
    EXPECT_EQ(map.lookup({{1, 2}, {3}}), std::optional<int>(1));
    EXPECT_EQ(map.lookup({{1, 2}}), std::optional<int>(2));
    EXPECT_FALSE(map.contains({{1}}));
    EXPECT_EQ(map.size(), 3U);
}

TEST(InstancesTest, ListKeys) {
    DerivedMap<List<int>, std::string> map;
    map.insert(List<int>{1, 2}, "12");
    map.insert(List<int>{}, "nil");
    EXPECT_THAT(map.keys(), ElementsAre(List<int>{}, List<int>{1, 2}));
}

TEST(InstancesTest, UserRecordWithEnumLeaf) {
    DerivedMap<Card, std::string> hand;
    hand.insert({Suit::Spades, 1}, "ace of spades");
    hand.insert({Suit::Hearts, 12}, "queen of hearts");
    hand.insert({Suit::Hearts, 1}, "ace of hearts");
    EXPECT_THAT(hand.keys(), ElementsAre(Card{Suit::Hearts, 1},
                                         Card{Suit::Hearts, 12},
                                         Card{Suit::Spades, 1}));
    EXPECT_TRUE(hand.erase({Suit::Spades, 1}));
    EXPECT_EQ(hand.size(), 2U);
}

TEST(InstancesTest, OrdKeyInsideComposite) {
    using Key = std::pair<std::string, OrdKey<double>>;
    DerivedMap<Key, int> readings;
    readings.insert({"sensor", {0.25}}, 1);
    readings.insert({"sensor", {-3.5}}, 2);
    auto ordered = readings.keys();
    ASSERT_EQ(ordered.size(), 2U);
    EXPECT_EQ(ordered[0].second.value, -3.5);
    EXPECT_EQ(ordered[1].second.value, 0.25);
}
