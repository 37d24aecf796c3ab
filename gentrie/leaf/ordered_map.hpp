/*
 * ordered_map.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-20

Description: Balanced ordered map for wide integers and any totally
             ordered key.

**************************************************/

#ifndef GENTRIE_LEAF_ORDERED_MAP_HPP
#define GENTRIE_LEAF_ORDERED_MAP_HPP

#include <cstddef>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

#include <boost/container/map.hpp>

namespace gentrie {

/**
 * @brief Map from an ordered key to V, backed by a red-black tree.
 *
 * Boost.Container is used rather than std::map because it is specified to
 * accept an incomplete mapped type, which nested tries rely on.
 *
 * @tparam K Key type.
 * @tparam V Mapped type.
 * @tparam Compare Strict weak order on K.
 */
template <typename K, typename V, typename Compare = std::less<K>>
class OrderedMap {
public:
    using key_type = K;
    using mapped_type = V;
    using key_compare = Compare;
    using size_type = std::size_t;

    template <typename W>
    using rebind = OrderedMap<K, W, Compare>;

    OrderedMap() = default;

    [[nodiscard]] auto empty() const noexcept -> bool { return map_.empty(); }
    [[nodiscard]] auto size() const noexcept -> size_type {
        return map_.size();
    }

    [[nodiscard]] auto find(const K& key) const -> const V* {
        auto it = map_.find(key);
        return it == map_.end() ? nullptr : &it->second;
    }

    [[nodiscard]] auto find(const K& key) -> V* {
        auto it = map_.find(key);
        return it == map_.end() ? nullptr : &it->second;
    }

    [[nodiscard]] auto lookup(const K& key) const -> std::optional<V> {
        if (const V* value = find(key)) {
            return *value;
        }
        return std::nullopt;
    }

    [[nodiscard]] auto contains(const K& key) const -> bool {
        return map_.find(key) != map_.end();
    }

    void insert(const K& key, V value) {
        map_.insert_or_assign(key, std::move(value));
    }

    auto erase(const K& key) -> bool { return map_.erase(key) != 0; }

    void clear() noexcept { map_.clear(); }

    template <typename F>
    [[nodiscard]] auto mapValues(F&& f) const
        -> rebind<std::remove_cvref_t<std::invoke_result_t<F&, const V&>>> {
        rebind<std::remove_cvref_t<std::invoke_result_t<F&, const V&>>> out;
        for (const auto& [key, value] : map_) {
            out.map_.emplace_hint(out.map_.end(), key, std::invoke(f, value));
        }
        return out;
    }

    template <typename F, typename Z>
    [[nodiscard]] auto fold(F&& f, Z init) const -> Z {
        for (const auto& entry : map_) {
            init = std::invoke(f, std::move(init), entry.second);
        }
        return init;
    }

    template <typename F, typename Z>
    [[nodiscard]] auto foldWithKey(F&& f, Z init) const -> Z {
        for (const auto& [key, value] : map_) {
            init = std::invoke(f, std::move(init), key, value);
        }
        return init;
    }

    /**
     * @brief Union of both maps in one ordered sweep; values under a shared
     * key are combined as combine(mine, theirs).
     */
    template <typename C>
    [[nodiscard]] auto merge(const OrderedMap& other, C&& combine) const
        -> OrderedMap {
        OrderedMap out;
        const Compare& less = map_.key_comp();
        auto lhs = map_.begin();
        auto rhs = other.map_.begin();
        while (lhs != map_.end() || rhs != other.map_.end()) {
            if (rhs == other.map_.end() ||
                (lhs != map_.end() && less(lhs->first, rhs->first))) {
                out.map_.emplace_hint(out.map_.end(), *lhs++);
            } else if (lhs == map_.end() || less(rhs->first, lhs->first)) {
                out.map_.emplace_hint(out.map_.end(), *rhs++);
            } else {
                out.map_.emplace_hint(out.map_.end(), lhs->first,
                                      std::invoke(combine, lhs->second,
                                                  rhs->second));
                ++lhs;
                ++rhs;
            }
        }
        return out;
    }

    /**
     * @brief A balanced tree has no interior placeholders; always true.
     */
    [[nodiscard]] auto validate() const noexcept -> bool { return true; }

    friend auto operator==(const OrderedMap& lhs, const OrderedMap& rhs)
        -> bool {
        return lhs.map_ == rhs.map_;
    }

private:
    template <typename, typename, typename>
    friend class OrderedMap;

    boost::container::map<K, V, Compare> map_;
};

/**
 * @brief Opt-in wrapper storing any totally ordered type in an OrderedMap.
 *
 * @code
 * gentrie::Trie<gentrie::OrdKey<double>, int> byWeight;
 * byWeight.insert(gentrie::OrdKey<double>{0.5}, 1);
 * @endcode
 */
template <typename T, typename Compare = std::less<T>>
struct OrdKey {
    T value;

    struct Less {
        [[no_unique_address]] Compare compare{};

        auto operator()(const OrdKey& lhs, const OrdKey& rhs) const -> bool {
            return compare(lhs.value, rhs.value);
        }
    };

    friend auto operator==(const OrdKey& lhs, const OrdKey& rhs) -> bool {
        return !Compare{}(lhs.value, rhs.value) &&
               !Compare{}(rhs.value, lhs.value);
    }
};

}  // namespace gentrie

#endif  // GENTRIE_LEAF_ORDERED_MAP_HPP
