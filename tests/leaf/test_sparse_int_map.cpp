#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>

#include "gentrie/leaf/sparse_int_map.hpp"
#include "gentrie/trie/trie_key.hpp"

using namespace gentrie;
using ::testing::ElementsAre;
using ::testing::Pair;

namespace {
enum class Color : std::uint8_t { Red, Green, Blue };
}

class SparseIntMapTest : public ::testing::Test {
protected:
    SparseIntMap<int, std::string> map;
};

TEST_F(SparseIntMapTest, StartsEmpty) {
    EXPECT_TRUE(map.empty());
    EXPECT_EQ(map.size(), 0U);
    EXPECT_EQ(map.find(0), nullptr);
    EXPECT_TRUE(map.validate());
}

TEST_F(SparseIntMapTest, InsertAndFind) {
    map.insert(42, "answer");
    map.insert(-7, "negative");
    ASSERT_NE(map.find(42), nullptr);
    EXPECT_EQ(*map.find(42), "answer");
    EXPECT_EQ(map.lookup(-7), std::optional<std::string>("negative"));
    EXPECT_FALSE(map.contains(41));
    EXPECT_EQ(map.size(), 2U);
    EXPECT_TRUE(map.validate());
}

TEST_F(SparseIntMapTest, InsertOverwrites) {
    map.insert(5, "first");
    map.insert(5, "second");
    EXPECT_EQ(map.size(), 1U);
    EXPECT_EQ(*map.find(5), "second");
}

TEST_F(SparseIntMapTest, ExtremeKeys) {
    map.insert(std::numeric_limits<int>::min(), "min");
    map.insert(std::numeric_limits<int>::max(), "max");
    map.insert(0, "zero");
    EXPECT_THAT(toPairs(map),
                ElementsAre(Pair(std::numeric_limits<int>::min(), "min"),
                            Pair(0, "zero"),
                            Pair(std::numeric_limits<int>::max(), "max")));
}

TEST_F(SparseIntMapTest, IteratesInAscendingOrder) {
    for (int key : {300, -1, 64, 2, -4096, 63}) {
        map.insert(key, std::to_string(key));
    }
    EXPECT_THAT(keys(map), ElementsAre(-4096, -1, 2, 63, 64, 300));
}

TEST_F(SparseIntMapTest, EraseUnlinksEmptyBranches) {
    SparseIntMap<int, std::string> before = map;
    map.insert(1 << 20, "far");
    EXPECT_TRUE(map.erase(1 << 20));
    EXPECT_FALSE(map.erase(1 << 20));
    EXPECT_TRUE(map.empty());
    EXPECT_TRUE(map.validate());
    EXPECT_EQ(map, before);
}

TEST_F(SparseIntMapTest, EraseKeepsSiblings) {
    map.insert(10, "a");
    map.insert(11, "b");
    SparseIntMap<int, std::string> before = map;
    map.insert(1000000, "c");
    EXPECT_TRUE(map.erase(1000000));
    EXPECT_EQ(map, before);
    EXPECT_EQ(*map.find(11), "b");
}

TEST_F(SparseIntMapTest, MapValuesKeepsKeys) {
    map.insert(1, "a");
    map.insert(2, "bb");
    auto lengths = map.mapValues([](const std::string& s) { return s.size(); });
    EXPECT_THAT(toPairs(lengths), ElementsAre(Pair(1, 1U), Pair(2, 2U)));
    EXPECT_TRUE(lengths.validate());
}

TEST_F(SparseIntMapTest, FoldIsLeftToRight) {
    map.insert(3, "c");
    map.insert(1, "a");
    map.insert(2, "b");
    auto joined = map.fold(
        [](std::string acc, const std::string& v) { return acc + v; },
        std::string{});
    EXPECT_EQ(joined, "abc");
}

TEST_F(SparseIntMapTest, MergeCombinesSharedKeys) {
    SparseIntMap<int, int> lhs;
    SparseIntMap<int, int> rhs;
    lhs.insert(1, 10);
    lhs.insert(2, 20);
    rhs.insert(2, 2);
    rhs.insert(3, 3);
    auto merged = lhs.merge(rhs, [](int a, int b) { return a - b; });
    EXPECT_THAT(toPairs(merged), ElementsAre(Pair(1, 10), Pair(2, 18), Pair(3, 3)));
    EXPECT_EQ(merged.size(), 3U);
    EXPECT_TRUE(merged.validate());
}

TEST(SparseIntMapKeyTest, EnumAndNarrowKeys) {
    SparseIntMap<Color, int> colors;
    colors.insert(Color::Blue, 3);
    colors.insert(Color::Red, 1);
    EXPECT_THAT(keys(colors), ElementsAre(Color::Red, Color::Blue));

    SparseIntMap<std::int8_t, int> bytes;
    bytes.insert(-128, 0);
    bytes.insert(127, 1);
    EXPECT_THAT(keys(bytes), ElementsAre(std::int8_t{-128}, std::int8_t{127}));

    SparseIntMap<std::uint32_t, int> wide;
    wide.insert(std::numeric_limits<std::uint32_t>::max(), 1);
    wide.insert(0U, 0);
    EXPECT_THAT(keys(wide),
                ElementsAre(0U, std::numeric_limits<std::uint32_t>::max()));
}

TEST(SparseIntMapKeyTest, SatisfiesTrieMap) {
    static_assert(TrieMap<SparseIntMap<int, int>>);
    static_assert(std::is_same_v<Trie<int, int>, SparseIntMap<int, int>>);
    static_assert(std::is_same_v<Trie<char, int>, SparseIntMap<char, int>>);
    SUCCEED();
}
