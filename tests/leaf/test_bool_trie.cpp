#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

#include "gentrie/leaf/bool_trie.hpp"
#include "gentrie/trie/trie_key.hpp"

using namespace gentrie;
using ::testing::ElementsAre;
using ::testing::Pair;

class BoolTrieTest : public ::testing::Test {
protected:
    BoolTrie<std::string> trie;
};

TEST_F(BoolTrieTest, TwoIndependentSlots) {
    static_assert(std::is_same_v<Trie<bool, std::string>, BoolTrie<std::string>>);
    trie.insert(true, "yes");
    EXPECT_EQ(trie.lookup(true), std::optional<std::string>("yes"));
    EXPECT_FALSE(trie.lookup(false).has_value());
    trie.insert(false, "no");
    EXPECT_EQ(trie.size(), 2U);
    EXPECT_EQ(*trie.find(false), "no");
}

TEST_F(BoolTrieTest, VisitsFalseFirst) {
    trie.insert(true, "t");
    trie.insert(false, "f");
    EXPECT_THAT(toPairs(trie), ElementsAre(Pair(false, "f"), Pair(true, "t")));
}

TEST_F(BoolTrieTest, EraseRestoresEquality) {
    trie.insert(false, "f");
    BoolTrie<std::string> before = trie;
    trie.insert(true, "t");
    EXPECT_TRUE(trie.erase(true));
    EXPECT_FALSE(trie.erase(true));
    EXPECT_EQ(trie, before);
}

TEST_F(BoolTrieTest, MergeAndMapValues) {
    BoolTrie<std::string> other;
    trie.insert(true, "a");
    other.insert(true, "b");
    other.insert(false, "c");
    auto merged = trie.merge(other, [](const std::string& x, const std::string& y) {
        return x + y;
    });
    EXPECT_THAT(toPairs(merged), ElementsAre(Pair(false, "c"), Pair(true, "ab")));
    auto sizes = merged.mapValues([](const std::string& s) { return s.size(); });
    EXPECT_EQ(sizes.fold([](std::size_t acc, std::size_t n) { return acc + n; },
                         std::size_t{0}),
              3U);
}

TEST_F(BoolTrieTest, ClearEmpties) {
    trie.insert(true, "x");
    trie.clear();
    EXPECT_TRUE(trie.empty());
    EXPECT_TRUE(trie.validate());
}
