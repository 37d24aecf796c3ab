/*
 * sparse_int_map.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-20

Description: Sparse map for small integral keys and code points, stored as
             a 64-way bitmap radix tree.

**************************************************/

#ifndef GENTRIE_LEAF_SPARSE_INT_MAP_HPP
#define GENTRIE_LEAF_SPARSE_INT_MAP_HPP

#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

#include <boost/container/vector.hpp>

namespace gentrie {

/**
 * @brief Keys stored in a SparseIntMap: integral types and enumerations of
 * at most 32 bits, bool excluded.
 */
template <typename K>
concept SparseIntKey =
    (std::integral<K> && !std::same_as<K, bool> && sizeof(K) <= 4) ||
    (std::is_enum_v<K> && sizeof(K) <= 4);

/**
 * @brief Map from a small integral key to V.
 *
 * Keys are biased to 32-bit codes whose unsigned order equals the key
 * order, then split into one 2-bit and five 6-bit chunks. Every level is a
 * node holding a 64-bit occupancy bitmap and a dense array of the occupied
 * slots, so a lookup costs six popcounts whatever the number of keys.
 *
 * Interior nodes only exist while something is stored beneath them.
 * Iteration is in ascending key order.
 *
 * @tparam K Key type, see SparseIntKey.
 * @tparam V Mapped type.
 */
template <typename K, typename V>
class SparseIntMap {
    static_assert(SparseIntKey<K>,
                  "SparseIntMap keys must be integral or enum, 32 bits max");

public:
    using key_type = K;
    using mapped_type = V;
    using size_type = std::size_t;

    template <typename W>
    using rebind = SparseIntMap<K, W>;

    SparseIntMap() = default;

    [[nodiscard]] auto empty() const noexcept -> bool { return size_ == 0; }
    [[nodiscard]] auto size() const noexcept -> size_type { return size_; }

    [[nodiscard]] auto find(const K& key) const -> const V* {
        const std::uint32_t code = encode(key);
        const Node* node = &root_;
        for (unsigned shift = TOP_SHIFT;; shift -= BITS_PER_LEVEL) {
            const unsigned chunk = chunkOf(code, shift);
            if ((node->bitmap & bitOf(chunk)) == 0) {
                return nullptr;
            }
            const std::size_t slot = slotOf(node->bitmap, chunk);
            if (shift == 0) {
                return &node->values[slot];
            }
            node = &node->children[slot];
        }
    }

    [[nodiscard]] auto find(const K& key) -> V* {
        return const_cast<V*>(std::as_const(*this).find(key));
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
     * @brief Insert or overwrite the value stored under key.
     *
     * A missing branch is built completely before it is linked in, so a
     * throwing allocation leaves the map unchanged.
     */
    void insert(const K& key, V value) {
        const std::uint32_t code = encode(key);
        Node* node = &root_;
        for (unsigned shift = TOP_SHIFT;; shift -= BITS_PER_LEVEL) {
            const unsigned chunk = chunkOf(code, shift);
            const std::size_t slot = slotOf(node->bitmap, chunk);
            const bool present = (node->bitmap & bitOf(chunk)) != 0;
            if (shift == 0) {
                if (present) {
                    node->values[slot] = std::move(value);
                } else {
                    node->values.insert(node->values.begin() + slot,
                                        std::move(value));
                    node->bitmap |= bitOf(chunk);
                    ++size_;
                }
                return;
            }
            if (!present) {
                node->children.insert(
                    node->children.begin() + slot,
                    makeBranch(code, shift - BITS_PER_LEVEL, std::move(value)));
                node->bitmap |= bitOf(chunk);
                ++size_;
                return;
            }
            node = &node->children[slot];
        }
    }

    /**
     * @brief Remove key. Interior nodes emptied by the removal are
     * unlinked.
     *
     * @return true if the key was present.
     */
    auto erase(const K& key) -> bool {
        if (!eraseFrom(root_, encode(key), TOP_SHIFT)) {
            return false;
        }
        --size_;
        return true;
    }

    void clear() noexcept {
        root_ = Node{};
        size_ = 0;
    }

    template <typename F>
    [[nodiscard]] auto mapValues(F&& f) const
        -> rebind<std::remove_cvref_t<std::invoke_result_t<F&, const V&>>> {
        using W = std::remove_cvref_t<std::invoke_result_t<F&, const V&>>;
        rebind<W> out;
        out.root_ = mapNode<W>(root_, f);
        out.size_ = size_;
        return out;
    }

    /**
     * @brief Left fold over the values in ascending key order.
     */
    template <typename F, typename Z>
    [[nodiscard]] auto fold(F&& f, Z init) const -> Z {
        return foldNode<false>(root_, 0, TOP_SHIFT, f, std::move(init));
    }

    /**
     * @brief Left fold over (key, value) pairs in ascending key order.
     */
    template <typename F, typename Z>
    [[nodiscard]] auto foldWithKey(F&& f, Z init) const -> Z {
        return foldNode<true>(root_, 0, TOP_SHIFT, f, std::move(init));
    }

    /**
     * @brief Union of both maps; values under a shared key are combined as
     * combine(mine, theirs).
     */
    template <typename C>
    [[nodiscard]] auto merge(const SparseIntMap& other, C&& combine) const
        -> SparseIntMap {
        SparseIntMap out;
        std::size_t shared = 0;
        out.root_ = mergeNodes(root_, other.root_, TOP_SHIFT, combine, shared);
        out.size_ = size_ + other.size_ - shared;
        return out;
    }

    /**
     * @brief Check the structure: no empty interior node, slot arrays match
     * their bitmaps, and the cached size matches the stored values.
     */
    [[nodiscard]] auto validate() const -> bool {
        std::size_t counted = 0;
        return validNode(root_, TOP_SHIFT, true, counted) && counted == size_;
    }

    friend auto operator==(const SparseIntMap& lhs, const SparseIntMap& rhs)
        -> bool {
        return lhs.size_ == rhs.size_ && lhs.root_ == rhs.root_;
    }

private:
    template <typename, typename>
    friend class SparseIntMap;

    static constexpr unsigned BITS_PER_LEVEL = 6;
    static constexpr std::uint32_t CHUNK_MASK = (1U << BITS_PER_LEVEL) - 1;
    static constexpr unsigned TOP_SHIFT = 30;  // 2 + 5 * 6 = 32 key bits
    static constexpr std::uint32_t SIGN_BIT = 0x80000000U;

    struct Node {
        std::uint64_t bitmap = 0;
        boost::container::vector<Node> children;
        boost::container::vector<V> values;

        friend auto operator==(const Node& lhs, const Node& rhs) -> bool {
            return lhs.bitmap == rhs.bitmap && lhs.values == rhs.values &&
                   lhs.children == rhs.children;
        }
    };

    using raw_key_type = typename std::conditional_t<std::is_enum_v<K>,
                                                     std::underlying_type<K>,
                                                     std::type_identity<K>>::type;

    static constexpr auto encode(K key) noexcept -> std::uint32_t {
        const auto raw = static_cast<raw_key_type>(key);
        if constexpr (std::is_signed_v<raw_key_type>) {
            return static_cast<std::uint32_t>(static_cast<std::int32_t>(raw)) ^
                   SIGN_BIT;
        } else {
            return static_cast<std::uint32_t>(raw);
        }
    }

    static constexpr auto decode(std::uint32_t code) noexcept -> K {
        if constexpr (std::is_signed_v<raw_key_type>) {
            return static_cast<K>(static_cast<raw_key_type>(
                static_cast<std::int32_t>(code ^ SIGN_BIT)));
        } else {
            return static_cast<K>(static_cast<raw_key_type>(code));
        }
    }

    static constexpr auto chunkOf(std::uint32_t code, unsigned shift) noexcept
        -> unsigned {
        return (code >> shift) & CHUNK_MASK;
    }

    static constexpr auto bitOf(unsigned chunk) noexcept -> std::uint64_t {
        return std::uint64_t{1} << chunk;
    }

    static constexpr auto slotOf(std::uint64_t bitmap, unsigned chunk) noexcept
        -> std::size_t {
        return static_cast<std::size_t>(
            std::popcount(bitmap & (bitOf(chunk) - 1)));
    }

    // Single path from level `shift` down to the value.
    static auto makeBranch(std::uint32_t code, unsigned shift, V value)
        -> Node {
        Node node;
        node.bitmap = bitOf(chunkOf(code, shift));
        if (shift == 0) {
            node.values.push_back(std::move(value));
        } else {
            node.children.push_back(
                makeBranch(code, shift - BITS_PER_LEVEL, std::move(value)));
        }
        return node;
    }

    static auto eraseFrom(Node& node, std::uint32_t code, unsigned shift)
        -> bool {
        const unsigned chunk = chunkOf(code, shift);
        if ((node.bitmap & bitOf(chunk)) == 0) {
            return false;
        }
        const std::size_t slot = slotOf(node.bitmap, chunk);
        if (shift == 0) {
            node.values.erase(node.values.begin() + slot);
            node.bitmap &= ~bitOf(chunk);
            return true;
        }
        Node& child = node.children[slot];
        if (!eraseFrom(child, code, shift - BITS_PER_LEVEL)) {
            return false;
        }
        if (child.bitmap == 0) {
            node.children.erase(node.children.begin() + slot);
            node.bitmap &= ~bitOf(chunk);
        }
        return true;
    }

    template <typename W, typename F>
    static auto mapNode(const Node& node, F& f) ->
        typename rebind<W>::Node {
        typename rebind<W>::Node out;
        out.bitmap = node.bitmap;
        out.children.reserve(node.children.size());
        for (const Node& child : node.children) {
            out.children.push_back(mapNode<W>(child, f));
        }
        out.values.reserve(node.values.size());
        for (const V& value : node.values) {
            out.values.push_back(std::invoke(f, value));
        }
        return out;
    }

    template <bool WithKey, typename F, typename Z>
    static auto foldNode(const Node& node, std::uint32_t prefix,
                         unsigned shift, F& f, Z acc) -> Z {
        std::size_t slot = 0;
        for (std::uint64_t bits = node.bitmap; bits != 0;
             bits &= bits - 1, ++slot) {
            const auto chunk = static_cast<std::uint32_t>(std::countr_zero(bits));
            const std::uint32_t code = prefix | (chunk << shift);
            if (shift != 0) {
                acc = foldNode<WithKey>(node.children[slot], code,
                                        shift - BITS_PER_LEVEL, f,
                                        std::move(acc));
            } else if constexpr (WithKey) {
                acc = std::invoke(f, std::move(acc), decode(code),
                                  node.values[slot]);
            } else {
                acc = std::invoke(f, std::move(acc), node.values[slot]);
            }
        }
        return acc;
    }

    template <typename C>
    static auto mergeNodes(const Node& lhs, const Node& rhs, unsigned shift,
                           C& combine, std::size_t& shared) -> Node {
        Node out;
        out.bitmap = lhs.bitmap | rhs.bitmap;
        std::size_t li = 0;
        std::size_t ri = 0;
        for (std::uint64_t bits = out.bitmap; bits != 0; bits &= bits - 1) {
            const std::uint64_t bit = bits & (~bits + 1);
            const bool inLhs = (lhs.bitmap & bit) != 0;
            const bool inRhs = (rhs.bitmap & bit) != 0;
            if (shift == 0) {
                if (inLhs && inRhs) {
                    out.values.push_back(
                        std::invoke(combine, lhs.values[li], rhs.values[ri]));
                    ++shared;
                } else {
                    out.values.push_back(inLhs ? lhs.values[li]
                                               : rhs.values[ri]);
                }
            } else {
                if (inLhs && inRhs) {
                    out.children.push_back(
                        mergeNodes(lhs.children[li], rhs.children[ri],
                                   shift - BITS_PER_LEVEL, combine, shared));
                } else {
                    out.children.push_back(inLhs ? lhs.children[li]
                                                 : rhs.children[ri]);
                }
            }
            li += inLhs ? 1 : 0;
            ri += inRhs ? 1 : 0;
        }
        return out;
    }

    static auto validNode(const Node& node, unsigned shift, bool isRoot,
                          std::size_t& counted) -> bool {
        if (!isRoot && node.bitmap == 0) {
            return false;
        }
        const auto occupied = static_cast<std::size_t>(std::popcount(node.bitmap));
        if (shift == 0) {
            counted += node.values.size();
            return node.children.empty() && node.values.size() == occupied;
        }
        if (!node.values.empty() || node.children.size() != occupied) {
            return false;
        }
        for (const Node& child : node.children) {
            if (!validNode(child, shift - BITS_PER_LEVEL, false, counted)) {
                return false;
            }
        }
        return true;
    }

    Node root_;
    size_type size_ = 0;
};

}  // namespace gentrie

#endif  // GENTRIE_LEAF_SPARSE_INT_MAP_HPP
