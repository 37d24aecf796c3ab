/*
 * trie_key.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-20

Description: Selection of the trie type used for each key type, and the
             operations shared by every trie.

**************************************************/

#ifndef GENTRIE_TRIE_TRIE_KEY_HPP
#define GENTRIE_TRIE_TRIE_KEY_HPP

#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <ranges>
#include <type_traits>
#include <utility>
#include <vector>

#include "gentrie/leaf/bool_trie.hpp"
#include "gentrie/leaf/ordered_map.hpp"
#include "gentrie/leaf/sparse_int_map.hpp"
#include "gentrie/shape/key_shape.hpp"

namespace gentrie {

template <ShapedKey K, typename V>
class DerivedMap;

/**
 * @brief Integral keys too wide for a SparseIntMap.
 */
template <typename K>
concept OrderedIntKey =
    std::integral<K> && !std::same_as<K, bool> && (sizeof(K) > 4);

/**
 * @brief Associates every key type with the trie that stores it.
 *
 * Leaf types get a dedicated map; any other type must provide a KeyShape
 * and is stored in a DerivedMap.
 */
template <typename K>
struct TrieKey {
    static_assert(ShapedKey<K>,
                  "key type has neither a leaf map nor a KeyShape");

    template <typename V>
    using trie_type = DerivedMap<K, V>;
};

template <SparseIntKey K>
struct TrieKey<K> {
    template <typename V>
    using trie_type = SparseIntMap<K, V>;
};

template <OrderedIntKey K>
struct TrieKey<K> {
    template <typename V>
    using trie_type = OrderedMap<K, V>;
};

template <>
struct TrieKey<bool> {
    template <typename V>
    using trie_type = BoolTrie<V>;
};

template <typename T, typename Compare>
struct TrieKey<OrdKey<T, Compare>> {
    template <typename V>
    using trie_type =
        OrderedMap<OrdKey<T, Compare>, V, typename OrdKey<T, Compare>::Less>;
};

/**
 * @brief The trie indexed by K holding values of V.
 */
template <typename K, typename V>
using Trie = typename TrieKey<K>::template trie_type<V>;

template <typename F, typename V>
using mapped_result_t = std::remove_cvref_t<std::invoke_result_t<F&, const V&>>;

/**
 * @brief Operations every trie provides, leaf maps and derived maps alike.
 */
template <typename M>
concept TrieMap = requires(M& trie, const M& ctrie,
                           const typename M::key_type& key,
                           typename M::mapped_type value) {
    { ctrie.empty() } -> std::same_as<bool>;
    { ctrie.size() } -> std::convertible_to<std::size_t>;
    { ctrie.find(key) } -> std::same_as<const typename M::mapped_type*>;
    { trie.find(key) } -> std::same_as<typename M::mapped_type*>;
    { ctrie.contains(key) } -> std::same_as<bool>;
    trie.insert(key, std::move(value));
    { trie.erase(key) } -> std::same_as<bool>;
    { ctrie.validate() } -> std::same_as<bool>;
    { ctrie == ctrie } -> std::convertible_to<bool>;
};

/**
 * @brief Build a trie by inserting the pairs in order; a later pair
 * overwrites an earlier one with the same key.
 */
template <typename K, typename V, std::ranges::input_range R>
auto fromPairs(R&& pairs) -> Trie<K, V> {
    Trie<K, V> trie;
    for (auto&& [key, value] : pairs) {
        trie.insert(key, value);
    }
    return trie;
}

template <typename K, typename V>
auto fromPairs(std::initializer_list<std::pair<K, V>> pairs) -> Trie<K, V> {
    return fromPairs<K, V>(std::views::all(pairs));
}

/**
 * @brief All (key, value) pairs of a trie in its traversal order.
 */
template <TrieMap M>
auto toPairs(const M& trie)
    -> std::vector<std::pair<typename M::key_type, typename M::mapped_type>> {
    using Pairs =
        std::vector<std::pair<typename M::key_type, typename M::mapped_type>>;
    return trie.foldWithKey(
        [](Pairs acc, const typename M::key_type& key,
           const typename M::mapped_type& value) {
            acc.emplace_back(key, value);
            return acc;
        },
        Pairs{});
}

/**
 * @brief All keys of a trie in its traversal order.
 */
template <TrieMap M>
auto keys(const M& trie) -> std::vector<typename M::key_type> {
    using Keys = std::vector<typename M::key_type>;
    return trie.foldWithKey(
        [](Keys acc, const typename M::key_type& key,
           const typename M::mapped_type&) {
            acc.push_back(key);
            return acc;
        },
        Keys{});
}

}  // namespace gentrie

#endif  // GENTRIE_TRIE_TRIE_KEY_HPP
