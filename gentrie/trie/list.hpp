/*
 * list.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-21

Description: Immutable singly linked list with shared tails, used as the
             recursive form of sequence keys.

**************************************************/

#ifndef GENTRIE_TRIE_LIST_HPP
#define GENTRIE_TRIE_LIST_HPP

#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <ranges>
#include <utility>
#include <vector>

#include "gentrie/error/exception.hpp"

namespace gentrie {

/**
 * @brief Persistent cons list.
 *
 * tail() and copies share cells, so peeling one element off a key costs
 * O(1) regardless of its length. Cells are never modified once linked.
 *
 * @tparam E Element type.
 */
template <typename E>
class List {
    struct Cell {
        E head;
        std::shared_ptr<Cell> tail;
    };

public:
    using value_type = E;
    using size_type = std::size_t;

    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = E;
        using difference_type = std::ptrdiff_t;
        using pointer = const E*;
        using reference = const E&;

        const_iterator() = default;

        auto operator*() const -> reference { return cell_->head; }
        auto operator->() const -> pointer { return &cell_->head; }

        auto operator++() -> const_iterator& {
            cell_ = cell_->tail.get();
            return *this;
        }

        auto operator++(int) -> const_iterator {
            const_iterator copy = *this;
            ++*this;
            return copy;
        }

        friend auto operator==(const const_iterator& lhs,
                               const const_iterator& rhs) -> bool {
            return lhs.cell_ == rhs.cell_;
        }

    private:
        friend class List;

        explicit const_iterator(const Cell* cell) : cell_(cell) {}

        const Cell* cell_ = nullptr;
    };

    List() = default;

    List(std::initializer_list<E> elements)
        : List(fromRange(std::views::all(elements))) {}

    List(const List&) = default;

    auto operator=(const List& other) -> List& {
        List copy(other);
        swap(copy);
        return *this;
    }

    List(List&& other) noexcept
        : cells_(std::move(other.cells_)),
          size_(std::exchange(other.size_, 0)) {}

    auto operator=(List&& other) noexcept -> List& {
        List moved(std::move(other));
        swap(moved);
        return *this;
    }

    void swap(List& other) noexcept {
        cells_.swap(other.cells_);
        std::swap(size_, other.size_);
    }

    /**
     * @brief Releases uniquely owned cells one by one so long lists do not
     * recurse through shared_ptr destructors.
     */
    ~List() {
        std::shared_ptr<Cell> cell = std::move(cells_);
        while (cell && cell.use_count() == 1) {
            cell = std::move(cell->tail);
        }
    }

    /**
     * @brief Build a list holding the elements of a range, in order.
     */
    template <std::ranges::input_range R>
    static auto fromRange(R&& elements) -> List {
        std::vector<E> buffer(std::ranges::begin(elements),
                              std::ranges::end(elements));
        List out;
        for (auto it = buffer.rbegin(); it != buffer.rend(); ++it) {
            out = cons(std::move(*it), std::move(out));
        }
        return out;
    }

    static auto cons(E head, List tail) -> List {
        List out;
        out.size_ = tail.size_ + 1;
        out.cells_ = std::make_shared<Cell>(
            Cell{std::move(head), std::move(tail.cells_)});
        return out;
    }

    [[nodiscard]] auto empty() const noexcept -> bool { return !cells_; }
    [[nodiscard]] auto size() const noexcept -> size_type { return size_; }

    [[nodiscard]] auto head() const -> const E& {
        if (!cells_) {
            THROW_OUT_OF_RANGE("head of an empty list");
        }
        return cells_->head;
    }

    [[nodiscard]] auto tail() const -> List {
        if (!cells_) {
            THROW_OUT_OF_RANGE("tail of an empty list");
        }
        List out;
        out.cells_ = cells_->tail;
        out.size_ = size_ - 1;
        return out;
    }

    [[nodiscard]] auto begin() const -> const_iterator {
        return const_iterator(cells_.get());
    }
    [[nodiscard]] auto end() const -> const_iterator {
        return const_iterator();
    }

    [[nodiscard]] auto toVector() const -> std::vector<E> {
        return std::vector<E>(begin(), end());
    }

    friend auto operator==(const List& lhs, const List& rhs) -> bool {
        if (lhs.size_ != rhs.size_) {
            return false;
        }
        const Cell* left = lhs.cells_.get();
        const Cell* right = rhs.cells_.get();
        // Shared suffixes are equal without walking them.
        while (left != right) {
            if (!(left->head == right->head)) {
                return false;
            }
            left = left->tail.get();
            right = right->tail.get();
        }
        return true;
    }

private:
    std::shared_ptr<Cell> cells_;
    size_type size_ = 0;
};

}  // namespace gentrie

#endif  // GENTRIE_TRIE_LIST_HPP
