#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <functional>
#include <string>

#include "gentrie/leaf/ordered_map.hpp"
#include "gentrie/trie/trie_key.hpp"

using namespace gentrie;
using ::testing::ElementsAre;
using ::testing::Pair;

TEST(OrderedMapTest, WideIntegersUseOrderedMap) {
    static_assert(std::is_same_v<Trie<std::int64_t, int>,
                                 OrderedMap<std::int64_t, int>>);
    static_assert(TrieMap<OrderedMap<std::int64_t, int>>);

    Trie<std::int64_t, std::string> map;
    map.insert(std::int64_t{1} << 40, "big");
    map.insert(-5, "small");
    EXPECT_THAT(keys(map), ElementsAre(-5, std::int64_t{1} << 40));
    EXPECT_EQ(map.size(), 2U);
}

TEST(OrderedMapTest, InsertFindErase) {
    OrderedMap<std::uint64_t, int> map;
    map.insert(7, 1);
    map.insert(7, 2);
    ASSERT_NE(map.find(7), nullptr);
    EXPECT_EQ(*map.find(7), 2);
    EXPECT_TRUE(map.erase(7));
    EXPECT_FALSE(map.erase(7));
    EXPECT_TRUE(map.empty());
    EXPECT_TRUE(map.validate());
}

TEST(OrderedMapTest, MergeSweep) {
    OrderedMap<std::int64_t, std::string> lhs;
    OrderedMap<std::int64_t, std::string> rhs;
    lhs.insert(1, "a");
    lhs.insert(3, "c");
    rhs.insert(2, "b");
    rhs.insert(3, "C");
    auto merged = lhs.merge(rhs, std::plus<>{});
    EXPECT_THAT(toPairs(merged),
                ElementsAre(Pair(1, "a"), Pair(2, "b"), Pair(3, "cC")));
    EXPECT_THAT(toPairs(lhs), ElementsAre(Pair(1, "a"), Pair(3, "c")));
}

TEST(OrderedMapTest, MapValuesAndFold) {
    OrderedMap<std::int64_t, int> map;
    map.insert(1, 1);
    map.insert(2, 2);
    auto doubled = map.mapValues([](int v) { return v * 2; });
    EXPECT_EQ(doubled.fold(std::plus<>{}, 0), 6);
}

TEST(OrdKeyTest, DoubleKeysThroughOrdKey) {
    Trie<OrdKey<double>, std::string> weights;
    weights.insert(OrdKey<double>{0.5}, "half");
    weights.insert(OrdKey<double>{-1.25}, "neg");
    weights.insert(OrdKey<double>{0.5}, "again");
    EXPECT_EQ(weights.size(), 2U);
    ASSERT_NE(weights.find(OrdKey<double>{0.5}), nullptr);
    EXPECT_EQ(*weights.find(OrdKey<double>{0.5}), "again");
    auto ordered = keys(weights);
    ASSERT_EQ(ordered.size(), 2U);
    EXPECT_EQ(ordered[0].value, -1.25);
    EXPECT_EQ(ordered[1].value, 0.5);
}

TEST(OrdKeyTest, CustomComparator) {
    Trie<OrdKey<std::string, std::greater<>>, int> reversed;
    reversed.insert({"apple"}, 1);
    reversed.insert({"pear"}, 2);
    auto ordered = keys(reversed);
    ASSERT_EQ(ordered.size(), 2U);
    EXPECT_EQ(ordered[0].value, "pear");
    EXPECT_EQ(ordered[1].value, "apple");
}
