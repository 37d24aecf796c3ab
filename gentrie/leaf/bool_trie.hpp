/*
 * bool_trie.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-20

Description: Two-slot map keyed by bool

**************************************************/

#ifndef GENTRIE_LEAF_BOOL_TRIE_HPP
#define GENTRIE_LEAF_BOOL_TRIE_HPP

#include <cstddef>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

namespace gentrie {

/**
 * @brief Map from bool to V: one optional slot per key, no map overhead.
 *
 * Iteration visits false before true.
 */
template <typename V>
class BoolTrie {
public:
    using key_type = bool;
    using mapped_type = V;
    using size_type = std::size_t;

    template <typename W>
    using rebind = BoolTrie<W>;

    BoolTrie() = default;

    [[nodiscard]] auto empty() const noexcept -> bool {
        return !falseSlot_ && !trueSlot_;
    }

    [[nodiscard]] auto size() const noexcept -> size_type {
        return (falseSlot_ ? 1U : 0U) + (trueSlot_ ? 1U : 0U);
    }

    [[nodiscard]] auto find(bool key) const -> const V* {
        const auto& slot = key ? trueSlot_ : falseSlot_;
        return slot ? &*slot : nullptr;
    }

    [[nodiscard]] auto find(bool key) -> V* {
        auto& slot = key ? trueSlot_ : falseSlot_;
        return slot ? &*slot : nullptr;
    }

    [[nodiscard]] auto lookup(bool key) const -> std::optional<V> {
        return key ? trueSlot_ : falseSlot_;
    }

    [[nodiscard]] auto contains(bool key) const -> bool {
        return find(key) != nullptr;
    }

    void insert(bool key, V value) {
        (key ? trueSlot_ : falseSlot_) = std::move(value);
    }

    auto erase(bool key) -> bool {
        auto& slot = key ? trueSlot_ : falseSlot_;
        const bool present = slot.has_value();
        slot.reset();
        return present;
    }

    void clear() noexcept {
        falseSlot_.reset();
        trueSlot_.reset();
    }

    template <typename F>
    [[nodiscard]] auto mapValues(F&& f) const
        -> rebind<std::remove_cvref_t<std::invoke_result_t<F&, const V&>>> {
        rebind<std::remove_cvref_t<std::invoke_result_t<F&, const V&>>> out;
        if (falseSlot_) {
            out.falseSlot_ = std::invoke(f, *falseSlot_);
        }
        if (trueSlot_) {
            out.trueSlot_ = std::invoke(f, *trueSlot_);
        }
        return out;
    }

    template <typename F, typename Z>
    [[nodiscard]] auto fold(F&& f, Z init) const -> Z {
        if (falseSlot_) {
            init = std::invoke(f, std::move(init), *falseSlot_);
        }
        if (trueSlot_) {
            init = std::invoke(f, std::move(init), *trueSlot_);
        }
        return init;
    }

    template <typename F, typename Z>
    [[nodiscard]] auto foldWithKey(F&& f, Z init) const -> Z {
        if (falseSlot_) {
            init = std::invoke(f, std::move(init), false, *falseSlot_);
        }
        if (trueSlot_) {
            init = std::invoke(f, std::move(init), true, *trueSlot_);
        }
        return init;
    }

    template <typename C>
    [[nodiscard]] auto merge(const BoolTrie& other, C&& combine) const
        -> BoolTrie {
        BoolTrie out;
        out.falseSlot_ = mergeSlot(falseSlot_, other.falseSlot_, combine);
        out.trueSlot_ = mergeSlot(trueSlot_, other.trueSlot_, combine);
        return out;
    }

    [[nodiscard]] auto validate() const noexcept -> bool { return true; }

    friend auto operator==(const BoolTrie& lhs, const BoolTrie& rhs) -> bool {
        return lhs.falseSlot_ == rhs.falseSlot_ &&
               lhs.trueSlot_ == rhs.trueSlot_;
    }

private:
    template <typename>
    friend class BoolTrie;

    template <typename C>
    static auto mergeSlot(const std::optional<V>& lhs,
                          const std::optional<V>& rhs, C& combine)
        -> std::optional<V> {
        if (lhs && rhs) {
            return std::invoke(combine, *lhs, *rhs);
        }
        return lhs ? lhs : rhs;
    }

    std::optional<V> falseSlot_;
    std::optional<V> trueSlot_;
};

}  // namespace gentrie

#endif  // GENTRIE_LEAF_BOOL_TRIE_HPP
