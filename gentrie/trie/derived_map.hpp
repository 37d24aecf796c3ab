/*
 * derived_map.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-21

Description: Map over any key type with a KeyShape, stored as a trie
             following the shape of the key.

**************************************************/

#ifndef GENTRIE_TRIE_DERIVED_MAP_HPP
#define GENTRIE_TRIE_DERIVED_MAP_HPP

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <ranges>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "gentrie/shape/key_shape.hpp"
#include "gentrie/trie/gtrie.hpp"
#include "gentrie/trie/instances.hpp"
#include "gentrie/trie/trie_key.hpp"

namespace gentrie {

/**
 * @brief Associative container keyed by a type with a KeyShape.
 *
 * The container is either empty or owns exactly one non-empty GTrie node,
 * so an empty map never carries placeholder nodes. Copies are deep;
 * mutating a copy never affects the map it was copied from.
 *
 * @code
 * gentrie::DerivedMap<std::vector<int>, std::string> routes;
 * routes.insert({1, 2, 3}, "a");
 * routes.insert({1, 2, 4}, "b");  // shares the path for 1, 2
 * routes.contains({1, 2});         // false
 * @endcode
 *
 * Not synchronized; concurrent readers are safe only while nobody
 * mutates the map.
 *
 * @tparam K Key type.
 * @tparam V Mapped type.
 */
template <ShapedKey K, typename V>
class DerivedMap {
public:
    using key_type = K;
    using mapped_type = V;
    using size_type = std::size_t;
    using shape_type = ShapeOf<K>;
    using node_type = GTrie<shape_type, V>;

    template <typename W>
    using rebind = DerivedMap<K, W>;

    DerivedMap() = default;

    DerivedMap(const DerivedMap& other)
        : root_(other.root_ ? std::make_unique<node_type>(*other.root_)
                            : nullptr) {}

    DerivedMap(DerivedMap&& other) noexcept = default;

    auto operator=(const DerivedMap& other) -> DerivedMap& {
        if (this != &other) {
            DerivedMap copy(other);
            swap(copy);
        }
        return *this;
    }

    auto operator=(DerivedMap&& other) noexcept -> DerivedMap& = default;

    ~DerivedMap() = default;

    /**
     * @brief Build a map from (key, value) pairs; a later pair overwrites an
     * earlier pair with the same key.
     */
    template <std::ranges::input_range R>
    static auto fromPairs(R&& pairs) -> DerivedMap {
        DerivedMap map;
        std::size_t count = 0;
        for (auto&& [key, value] : pairs) {
            map.insert(key, value);
            ++count;
        }
        spdlog::debug("Built trie from {} pairs", count);
        return map;
    }

    static auto fromPairs(std::initializer_list<std::pair<K, V>> pairs)
        -> DerivedMap {
        return fromPairs(std::views::all(pairs));
    }

    [[nodiscard]] auto empty() const noexcept -> bool { return !root_; }

    /**
     * @brief Number of keys. Counted on demand in O(n).
     */
    [[nodiscard]] auto size() const -> size_type {
        return fold([](size_type count, const V&) { return count + 1; },
                    size_type{0});
    }

    /**
     * @brief Value bound to key, or nullptr. A key too long to have been
     * inserted is simply absent.
     */
    [[nodiscard]] auto find(const K& key) const -> const V* {
        if (!root_ || !gentrie::withinDepthLimit(key)) {
            return nullptr;
        }
        return std::as_const(*root_).find(KeyShape<K>::toShape(key));
    }

    [[nodiscard]] auto find(const K& key) -> V* {
        if (!root_ || !gentrie::withinDepthLimit(key)) {
            return nullptr;
        }
        return root_->find(KeyShape<K>::toShape(key));
    }

    [[nodiscard]] auto lookup(const K& key) const -> std::optional<V> {
        if (const V* value = find(key)) {
            return *value;
        }
        return std::nullopt;
    }

    [[nodiscard]] auto contains(const K& key) const -> bool {
        return find(key) != nullptr;
    }

    /**
     * @brief Associate key with value, replacing any previous value.
     *
     * @throws KeyDepthError if the key holds a sequence longer than
     *         GENTRIE_MAX_SEQUENCE_DEPTH; the map is unchanged. Only insert
     *         rejects such keys.
     */
    void insert(const K& key, V value) {
        shape_type shape = KeyShape<K>::toShape(key);
        if (root_) {
            root_->insert(shape, std::move(value));
        } else {
            root_ = std::make_unique<node_type>(
                node_type::singleton(shape, std::move(value)));
        }
    }

    /**
     * @brief Remove key. Nodes left without entries are unlinked on the way
     * back up.
     *
     * @return Whether the key was present.
     */
    auto erase(const K& key) -> bool {
        if (!root_ || !gentrie::withinDepthLimit(key)) {
            return false;
        }
        switch (root_->erase(KeyShape<K>::toShape(key))) {
            case EraseResult::NotFound:
                return false;
            case EraseResult::Emptied:
                root_.reset();
                return true;
            case EraseResult::Erased:
                break;
        }
        return true;
    }

    void clear() noexcept { root_.reset(); }

    /**
     * @brief Same keys, each value replaced by f(value).
     */
    template <typename F>
    [[nodiscard]] auto mapValues(F&& f) const
        -> rebind<mapped_result_t<F, V>> {
        using Out = rebind<mapped_result_t<F, V>>;
        Out out;
        if (root_) {
            out.root_ = std::make_unique<typename Out::node_type>(
                root_->mapValues(f));
        }
        return out;
    }

    /**
     * @brief Left fold f(acc, value) over the values in traversal order.
     *
     * Traversal order is deterministic for a given set of keys: left before
     * right at every Sum, ascending for integral leaves, false before true.
     */
    template <typename F, typename Z>
    [[nodiscard]] auto fold(F&& f, Z init) const -> Z {
        if (!root_) {
            return init;
        }
        return root_->fold(f, std::move(init));
    }

    /**
     * @brief Left fold f(acc, key, value), rebuilding each key from its path.
     */
    template <typename F, typename Z>
    [[nodiscard]] auto foldWithKey(F&& f, Z init) const -> Z {
        if (!root_) {
            return init;
        }
        return foldKeyed<Z>(KeyedStep<Z>(std::ref(f)), std::move(init));
    }

    /**
     * @brief Call f(key, value) for every entry in traversal order.
     */
    template <typename F>
    void forEach(F&& f) const {
        auto visit = [&f](bool, const K& key, const V& value) {
            std::invoke(f, key, value);
            return true;
        };
        (void)foldWithKey(visit, true);
    }

    [[nodiscard]] auto toPairs() const -> std::vector<std::pair<K, V>> {
        return gentrie::toPairs(*this);
    }

    [[nodiscard]] auto keys() const -> std::vector<K> {
        return gentrie::keys(*this);
    }

    /**
     * @brief Union of two maps. A key present in both is bound to
     * combine(mine, theirs). Neither input is modified, so an exception
     * from combine leaves both intact.
     */
    template <typename C>
    [[nodiscard]] auto merge(const DerivedMap& other, C&& combine) const
        -> DerivedMap {
        if (!root_) {
            return other;
        }
        if (!other.root_) {
            return *this;
        }
        DerivedMap out;
        out.root_ = std::make_unique<node_type>(
            node_type::merge(*root_, *other.root_, combine));
        return out;
    }

    /**
     * @brief Check that no node below the root is empty.
     */
    [[nodiscard]] auto validate() const -> bool {
        return !root_ || root_->validate();
    }

    void swap(DerivedMap& other) noexcept { root_.swap(other.root_); }

    friend void swap(DerivedMap& lhs, DerivedMap& rhs) noexcept {
        lhs.swap(rhs);
    }

    friend auto operator==(const DerivedMap& lhs, const DerivedMap& rhs)
        -> bool {
        if (!lhs.root_ || !rhs.root_) {
            return !lhs.root_ && !rhs.root_;
        }
        return *lhs.root_ == *rhs.root_;
    }

private:
    template <ShapedKey, typename>
    friend class DerivedMap;

    // A recursive key reaches a nested map of the same type, so the step
    // is erased to one type per accumulator and the instantiation closes.
    template <typename Z>
    using KeyedStep = std::function<Z(Z, const K&, const V&)>;

    template <typename Z>
    auto foldKeyed(const KeyedStep<Z>& step, Z init) const -> Z {
        auto withKey = [&step](Z acc, const shape_type& shape,
                               const V& value) -> Z {
            return step(std::move(acc), KeyShape<K>::fromShape(shape), value);
        };
        return root_->foldWithKey(withKey, std::move(init));
    }

    std::unique_ptr<node_type> root_;
};

}  // namespace gentrie

#endif  // GENTRIE_TRIE_DERIVED_MAP_HPP
