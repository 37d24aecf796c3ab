/*
 * gtrie.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-21

Description: Trie nodes for every shape constructor. A key's shape type
             selects the node type that stores it.

**************************************************/

#ifndef GENTRIE_TRIE_GTRIE_HPP
#define GENTRIE_TRIE_GTRIE_HPP

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <spdlog/spdlog.h>

#include "gentrie/shape/shape.hpp"
#include "gentrie/trie/error.hpp"
#include "gentrie/trie/trie_key.hpp"

namespace gentrie {

/**
 * @brief Outcome of removing a key from a node.
 *
 * Emptied tells the parent the node holds nothing any more and must be
 * unlinked; the node itself is left as it was.
 */
enum class EraseResult { NotFound, Erased, Emptied };

namespace detail {
[[noreturn]] inline void trieFault(std::string_view operation,
                                   const std::string& position) {
    spdlog::critical("Trie invariant violated: {} reached {}", operation,
                     position);
    THROW_TRIE_INVARIANT_ERROR("{} reached {}", operation, position);
}
}  // namespace detail

/**
 * @brief Non-empty trie over keys of shape S with values V.
 *
 * Every specialization provides the same members:
 *   - static singleton(key, value)
 *   - find(key) (const and mutable), insert(key, value)
 *   - erase(key) -> EraseResult
 *   - mapValues(f), fold(f, z), foldWithKey(f, z)
 *   - static merge(a, b, combine), validate(), operator==
 *
 * A node never holds zero entries; emptiness is represented by the owner
 * not holding a node at all.
 */
template <typename S, typename V>
class GTrie;

/**
 * @brief Void has no values, so a node for it can never be populated.
 */
template <typename V>
class GTrie<shape::Void, V> {
public:
    using key_type = shape::Void;
    using mapped_type = V;

    template <typename W>
    using rebind = GTrie<shape::Void, W>;

    [[noreturn]] static auto singleton(const key_type&, V) -> GTrie {
        detail::trieFault("singleton", "a Void position");
    }

    [[noreturn]] auto find(const key_type&) const -> const V* {
        detail::trieFault("find", "a Void position");
    }

    [[noreturn]] auto find(const key_type&) -> V* {
        detail::trieFault("find", "a Void position");
    }

    [[noreturn]] void insert(const key_type&, V) {
        detail::trieFault("insert", "a Void position");
    }

    [[noreturn]] auto erase(const key_type&) -> EraseResult {
        detail::trieFault("erase", "a Void position");
    }

    template <typename F>
    auto mapValues(F&) const -> rebind<mapped_result_t<F, V>> {
        return {};
    }

    template <typename F, typename Z>
    auto fold(F&, Z acc) const -> Z {
        return acc;
    }

    template <typename F, typename Z>
    auto foldWithKey(F&, Z acc) const -> Z {
        return acc;
    }

    template <typename C>
    static auto merge(const GTrie&, const GTrie&, C&) -> GTrie {
        return {};
    }

    [[nodiscard]] auto validate() const -> bool { return false; }

    friend auto operator==(const GTrie&, const GTrie&) -> bool { return true; }

private:
    template <typename, typename>
    friend class GTrie;

    GTrie() = default;
};

template <typename V>
class GTrie<shape::Unit, V> {
public:
    using key_type = shape::Unit;
    using mapped_type = V;

    template <typename W>
    using rebind = GTrie<shape::Unit, W>;

    static auto singleton(const key_type&, V value) -> GTrie {
        return GTrie(std::move(value));
    }

    auto find(const key_type&) const -> const V* { return &value_; }
    auto find(const key_type&) -> V* { return &value_; }

    void insert(const key_type&, V value) { value_ = std::move(value); }

    auto erase(const key_type&) -> EraseResult { return EraseResult::Emptied; }

    template <typename F>
    auto mapValues(F& f) const -> rebind<mapped_result_t<F, V>> {
        return rebind<mapped_result_t<F, V>>(std::invoke(f, value_));
    }

    template <typename F, typename Z>
    auto fold(F& f, Z acc) const -> Z {
        return std::invoke(f, std::move(acc), value_);
    }

    template <typename F, typename Z>
    auto foldWithKey(F& f, Z acc) const -> Z {
        return std::invoke(f, std::move(acc), key_type{}, value_);
    }

    template <typename C>
    static auto merge(const GTrie& lhs, const GTrie& rhs, C& combine)
        -> GTrie {
        return GTrie(std::invoke(combine, lhs.value_, rhs.value_));
    }

    [[nodiscard]] auto validate() const -> bool { return true; }

    friend auto operator==(const GTrie& lhs, const GTrie& rhs) -> bool {
        return lhs.value_ == rhs.value_;
    }

private:
    template <typename, typename>
    friend class GTrie;

    explicit GTrie(V value) : value_(std::move(value)) {}

    V value_;
};

/**
 * @brief A Field position delegates to the trie of its key type, which is
 * a leaf map or, for recursive keys, another DerivedMap.
 */
template <typename T, typename V>
class GTrie<shape::Field<T>, V> {
public:
    using key_type = shape::Field<T>;
    using mapped_type = V;
    using trie_type = Trie<T, V>;

    template <typename W>
    using rebind = GTrie<shape::Field<T>, W>;

    static auto singleton(const key_type& key, V value) -> GTrie {
        trie_type trie;
        trie.insert(key.value, std::move(value));
        return GTrie(std::move(trie));
    }

    auto find(const key_type& key) const -> const V* {
        return trie_.find(key.value);
    }

    auto find(const key_type& key) -> V* { return trie_.find(key.value); }

    void insert(const key_type& key, V value) {
        trie_.insert(key.value, std::move(value));
    }

    auto erase(const key_type& key) -> EraseResult {
        if (!trie_.erase(key.value)) {
            return EraseResult::NotFound;
        }
        return trie_.empty() ? EraseResult::Emptied : EraseResult::Erased;
    }

    template <typename F>
    auto mapValues(F& f) const -> rebind<mapped_result_t<F, V>> {
        return rebind<mapped_result_t<F, V>>(trie_.mapValues(f));
    }

    template <typename F, typename Z>
    auto fold(F& f, Z acc) const -> Z {
        return trie_.fold(f, std::move(acc));
    }

    template <typename F, typename Z>
    auto foldWithKey(F& f, Z acc) const -> Z {
        return trie_.foldWithKey(
            [&f](Z inner, const T& key, const V& value) -> Z {
                return std::invoke(f, std::move(inner), key_type{key}, value);
            },
            std::move(acc));
    }

    template <typename C>
    static auto merge(const GTrie& lhs, const GTrie& rhs, C& combine)
        -> GTrie {
        return GTrie(lhs.trie_.merge(rhs.trie_, combine));
    }

    [[nodiscard]] auto validate() const -> bool {
        return !trie_.empty() && trie_.validate();
    }

    friend auto operator==(const GTrie& lhs, const GTrie& rhs) -> bool {
        return lhs.trie_ == rhs.trie_;
    }

private:
    template <typename, typename>
    friend class GTrie;

    explicit GTrie(trie_type trie) : trie_(std::move(trie)) {}

    trie_type trie_;
};

/**
 * @brief Product(L, R) is stored curried: a trie over L whose values are
 * tries over R. Keys with a common first component share its path.
 */
template <typename L, typename R, typename V>
class GTrie<shape::Product<L, R>, V> {
public:
    using key_type = shape::Product<L, R>;
    using mapped_type = V;
    using inner_type = GTrie<R, V>;
    using outer_type = GTrie<L, inner_type>;

    template <typename W>
    using rebind = GTrie<shape::Product<L, R>, W>;

    static auto singleton(const key_type& key, V value) -> GTrie {
        return GTrie(outer_type::singleton(
            key.first, inner_type::singleton(key.second, std::move(value))));
    }

    auto find(const key_type& key) const -> const V* {
        if (const inner_type* inner = outer_.find(key.first)) {
            return inner->find(key.second);
        }
        return nullptr;
    }

    auto find(const key_type& key) -> V* {
        if (inner_type* inner = outer_.find(key.first)) {
            return inner->find(key.second);
        }
        return nullptr;
    }

    void insert(const key_type& key, V value) {
        if (inner_type* inner = outer_.find(key.first)) {
            inner->insert(key.second, std::move(value));
            return;
        }
        outer_.insert(key.first,
                      inner_type::singleton(key.second, std::move(value)));
    }

    auto erase(const key_type& key) -> EraseResult {
        inner_type* inner = outer_.find(key.first);
        if (inner == nullptr) {
            return EraseResult::NotFound;
        }
        const EraseResult result = inner->erase(key.second);
        if (result != EraseResult::Emptied) {
            return result;
        }
        return outer_.erase(key.first);
    }

    template <typename F>
    auto mapValues(F& f) const -> rebind<mapped_result_t<F, V>> {
        auto step = [&f](const inner_type& inner) {
            return inner.mapValues(f);
        };
        return rebind<mapped_result_t<F, V>>(outer_.mapValues(step));
    }

    template <typename F, typename Z>
    auto fold(F& f, Z acc) const -> Z {
        auto step = [&f](Z outer, const inner_type& inner) -> Z {
            return inner.fold(f, std::move(outer));
        };
        return outer_.fold(step, std::move(acc));
    }

    template <typename F, typename Z>
    auto foldWithKey(F& f, Z acc) const -> Z {
        auto step = [&f](Z outer, const L& first, const inner_type& inner) -> Z {
            auto withFirst = [&f, &first](Z state, const R& second,
                                          const V& value) -> Z {
                return std::invoke(f, std::move(state),
                                   key_type{first, second}, value);
            };
            return inner.foldWithKey(withFirst, std::move(outer));
        };
        return outer_.foldWithKey(step, std::move(acc));
    }

    template <typename C>
    static auto merge(const GTrie& lhs, const GTrie& rhs, C& combine)
        -> GTrie {
        auto step = [&combine](const inner_type& x, const inner_type& y) {
            return inner_type::merge(x, y, combine);
        };
        return GTrie(outer_type::merge(lhs.outer_, rhs.outer_, step));
    }

    [[nodiscard]] auto validate() const -> bool {
        auto innerValid = [](bool ok, const inner_type& inner) {
            return ok && inner.validate();
        };
        return outer_.validate() && outer_.fold(innerValid, true);
    }

    friend auto operator==(const GTrie& lhs, const GTrie& rhs) -> bool {
        return lhs.outer_ == rhs.outer_;
    }

private:
    template <typename, typename>
    friend class GTrie;

    explicit GTrie(outer_type outer) : outer_(std::move(outer)) {}

    outer_type outer_;
};

/**
 * @brief Sum(L, R) holds a trie for each side that has entries. A side
 * with no entries has no node, so the three states below are exhaustive.
 */
template <typename L, typename R, typename V>
class GTrie<shape::Sum<L, R>, V> {
public:
    using key_type = shape::Sum<L, R>;
    using mapped_type = V;
    using left_type = GTrie<L, V>;
    using right_type = GTrie<R, V>;

    template <typename W>
    using rebind = GTrie<shape::Sum<L, R>, W>;

    static auto singleton(const key_type& key, V value) -> GTrie {
        if (key.isLeft()) {
            return GTrie(
                LeftOnly{left_type::singleton(key.leftValue(), std::move(value))});
        }
        return GTrie(
            RightOnly{right_type::singleton(key.rightValue(), std::move(value))});
    }

    auto find(const key_type& key) const -> const V* {
        if (key.isLeft()) {
            const left_type* left = leftSide();
            return left ? left->find(key.leftValue()) : nullptr;
        }
        const right_type* right = rightSide();
        return right ? right->find(key.rightValue()) : nullptr;
    }

    auto find(const key_type& key) -> V* {
        if (key.isLeft()) {
            left_type* left = leftSide();
            return left ? left->find(key.leftValue()) : nullptr;
        }
        right_type* right = rightSide();
        return right ? right->find(key.rightValue()) : nullptr;
    }

    void insert(const key_type& key, V value) {
        if (key.isLeft()) {
            if (left_type* left = leftSide()) {
                left->insert(key.leftValue(), std::move(value));
                return;
            }
            auto* only = std::get_if<RightOnly>(&node_);
            if (only == nullptr) {
                detail::trieFault("insert", "a Sum node without entries");
            }
            left_type left =
                left_type::singleton(key.leftValue(), std::move(value));
            node_ = Both{std::move(left), std::move(only->right)};
            return;
        }
        if (right_type* right = rightSide()) {
            right->insert(key.rightValue(), std::move(value));
            return;
        }
        auto* only = std::get_if<LeftOnly>(&node_);
        if (only == nullptr) {
            detail::trieFault("insert", "a Sum node without entries");
        }
        right_type right =
            right_type::singleton(key.rightValue(), std::move(value));
        node_ = Both{std::move(only->left), std::move(right)};
    }

    /**
     * @brief Removing the last key of one side of a Both node leaves the
     * other side alone. Only the side the key selects is inspected.
     */
    auto erase(const key_type& key) -> EraseResult {
        if (key.isLeft()) {
            left_type* left = leftSide();
            if (left == nullptr) {
                return EraseResult::NotFound;
            }
            const EraseResult result = left->erase(key.leftValue());
            if (result != EraseResult::Emptied) {
                return result;
            }
            if (auto* both = std::get_if<Both>(&node_)) {
                right_type right = std::move(both->right);
                node_ = RightOnly{std::move(right)};
                return EraseResult::Erased;
            }
            return EraseResult::Emptied;
        }
        right_type* right = rightSide();
        if (right == nullptr) {
            return EraseResult::NotFound;
        }
        const EraseResult result = right->erase(key.rightValue());
        if (result != EraseResult::Emptied) {
            return result;
        }
        if (auto* both = std::get_if<Both>(&node_)) {
            left_type left = std::move(both->left);
            node_ = LeftOnly{std::move(left)};
            return EraseResult::Erased;
        }
        return EraseResult::Emptied;
    }

    template <typename F>
    auto mapValues(F& f) const -> rebind<mapped_result_t<F, V>> {
        using Out = rebind<mapped_result_t<F, V>>;
        if (const auto* node = std::get_if<LeftOnly>(&node_)) {
            return Out(typename Out::LeftOnly{node->left.mapValues(f)});
        }
        if (const auto* node = std::get_if<RightOnly>(&node_)) {
            return Out(typename Out::RightOnly{node->right.mapValues(f)});
        }
        if (const auto* node = std::get_if<Both>(&node_)) {
            return Out(typename Out::Both{node->left.mapValues(f),
                                          node->right.mapValues(f)});
        }
        detail::trieFault("mapValues", "a Sum node without entries");
    }

    template <typename F, typename Z>
    auto fold(F& f, Z acc) const -> Z {
        if (const left_type* left = leftSide()) {
            acc = left->fold(f, std::move(acc));
        }
        if (const right_type* right = rightSide()) {
            acc = right->fold(f, std::move(acc));
        }
        return acc;
    }

    template <typename F, typename Z>
    auto foldWithKey(F& f, Z acc) const -> Z {
        if (const left_type* left = leftSide()) {
            auto onLeft = [&f](Z state, const L& key, const V& value) -> Z {
                return std::invoke(f, std::move(state), key_type::left(key),
                                   value);
            };
            acc = left->foldWithKey(onLeft, std::move(acc));
        }
        if (const right_type* right = rightSide()) {
            auto onRight = [&f](Z state, const R& key, const V& value) -> Z {
                return std::invoke(f, std::move(state), key_type::right(key),
                                   value);
            };
            acc = right->foldWithKey(onRight, std::move(acc));
        }
        return acc;
    }

    template <typename C>
    static auto merge(const GTrie& lhs, const GTrie& rhs, C& combine)
        -> GTrie {
        std::optional<left_type> left =
            mergeSide(lhs.leftSide(), rhs.leftSide(), combine);
        std::optional<right_type> right =
            mergeSide(lhs.rightSide(), rhs.rightSide(), combine);
        if (left && right) {
            return GTrie(Both{std::move(*left), std::move(*right)});
        }
        if (left) {
            return GTrie(LeftOnly{std::move(*left)});
        }
        if (right) {
            return GTrie(RightOnly{std::move(*right)});
        }
        detail::trieFault("merge", "two Sum nodes without entries");
    }

    [[nodiscard]] auto validate() const -> bool {
        if (node_.valueless_by_exception()) {
            return false;
        }
        const left_type* left = leftSide();
        const right_type* right = rightSide();
        return (left == nullptr || left->validate()) &&
               (right == nullptr || right->validate());
    }

    friend auto operator==(const GTrie& lhs, const GTrie& rhs) -> bool {
        return lhs.node_ == rhs.node_;
    }

private:
    template <typename, typename>
    friend class GTrie;

    struct LeftOnly {
        left_type left;

        friend auto operator==(const LeftOnly& lhs, const LeftOnly& rhs)
            -> bool {
            return lhs.left == rhs.left;
        }
    };

    struct RightOnly {
        right_type right;

        friend auto operator==(const RightOnly& lhs, const RightOnly& rhs)
            -> bool {
            return lhs.right == rhs.right;
        }
    };

    struct Both {
        left_type left;
        right_type right;

        friend auto operator==(const Both& lhs, const Both& rhs) -> bool {
            return lhs.left == rhs.left && lhs.right == rhs.right;
        }
    };

    using Node = std::variant<LeftOnly, RightOnly, Both>;

    explicit GTrie(Node node) : node_(std::move(node)) {}

    auto leftSide() const -> const left_type* {
        if (const auto* node = std::get_if<LeftOnly>(&node_)) {
            return &node->left;
        }
        if (const auto* node = std::get_if<Both>(&node_)) {
            return &node->left;
        }
        return nullptr;
    }

    auto leftSide() -> left_type* {
        return const_cast<left_type*>(std::as_const(*this).leftSide());
    }

    auto rightSide() const -> const right_type* {
        if (const auto* node = std::get_if<RightOnly>(&node_)) {
            return &node->right;
        }
        if (const auto* node = std::get_if<Both>(&node_)) {
            return &node->right;
        }
        return nullptr;
    }

    auto rightSide() -> right_type* {
        return const_cast<right_type*>(std::as_const(*this).rightSide());
    }

    template <typename Side, typename C>
    static auto mergeSide(const Side* lhs, const Side* rhs, C& combine)
        -> std::optional<Side> {
        if (lhs != nullptr && rhs != nullptr) {
            return Side::merge(*lhs, *rhs, combine);
        }
        if (lhs != nullptr) {
            return *lhs;
        }
        if (rhs != nullptr) {
            return *rhs;
        }
        return std::nullopt;
    }

    Node node_;
};

/**
 * @brief Wrap carries no structure of its own.
 */
template <typename S, shape::FixedName Name, typename V>
class GTrie<shape::Wrap<S, Name>, V> {
public:
    using key_type = shape::Wrap<S, Name>;
    using mapped_type = V;
    using inner_type = GTrie<S, V>;

    template <typename W>
    using rebind = GTrie<shape::Wrap<S, Name>, W>;

    static auto singleton(const key_type& key, V value) -> GTrie {
        return GTrie(inner_type::singleton(key.inner, std::move(value)));
    }

    auto find(const key_type& key) const -> const V* {
        return inner_.find(key.inner);
    }

    auto find(const key_type& key) -> V* { return inner_.find(key.inner); }

    void insert(const key_type& key, V value) {
        inner_.insert(key.inner, std::move(value));
    }

    auto erase(const key_type& key) -> EraseResult {
        return inner_.erase(key.inner);
    }

    template <typename F>
    auto mapValues(F& f) const -> rebind<mapped_result_t<F, V>> {
        return rebind<mapped_result_t<F, V>>(inner_.mapValues(f));
    }

    template <typename F, typename Z>
    auto fold(F& f, Z acc) const -> Z {
        return inner_.fold(f, std::move(acc));
    }

    template <typename F, typename Z>
    auto foldWithKey(F& f, Z acc) const -> Z {
        auto wrapped = [&f](Z state, const S& key, const V& value) -> Z {
            return std::invoke(f, std::move(state), key_type{key}, value);
        };
        return inner_.foldWithKey(wrapped, std::move(acc));
    }

    template <typename C>
    static auto merge(const GTrie& lhs, const GTrie& rhs, C& combine)
        -> GTrie {
        return GTrie(inner_type::merge(lhs.inner_, rhs.inner_, combine));
    }

    [[nodiscard]] auto validate() const -> bool { return inner_.validate(); }

    friend auto operator==(const GTrie& lhs, const GTrie& rhs) -> bool {
        return lhs.inner_ == rhs.inner_;
    }

private:
    template <typename, typename>
    friend class GTrie;

    explicit GTrie(inner_type inner) : inner_(std::move(inner)) {}

    inner_type inner_;
};

}  // namespace gentrie

#endif  // GENTRIE_TRIE_GTRIE_HPP
