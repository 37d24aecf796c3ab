/*
 * instances.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-21

Description: KeyShape specializations for standard library types and
             sequence keys.

**************************************************/

#ifndef GENTRIE_TRIE_INSTANCES_HPP
#define GENTRIE_TRIE_INSTANCES_HPP

#include <compare>
#include <cstddef>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

#include "gentrie/config.hpp"
#include "gentrie/error/exception.hpp"
#include "gentrie/shape/key_shape.hpp"
#include "gentrie/shape/shape.hpp"
#include "gentrie/trie/error.hpp"
#include "gentrie/trie/list.hpp"

namespace gentrie {

namespace detail {
inline auto fitsSequenceDepth(std::size_t length) noexcept -> bool {
    return length <= config::MAX_SEQUENCE_DEPTH;
}

inline void checkSequenceDepth(std::size_t length) {
    if (!fitsSequenceDepth(length)) {
        spdlog::warn("Rejecting sequence key of length {} (limit {})", length,
                     config::MAX_SEQUENCE_DEPTH);
        THROW_KEY_DEPTH_ERROR("sequence key of length {} exceeds the limit of {}",
                              length, config::MAX_SEQUENCE_DEPTH);
    }
}
}  // namespace detail

template <>
struct KeyShape<std::monostate> {
    using shape_type = shape::Unit;

    static auto toShape(const std::monostate&) -> shape_type { return {}; }
    static auto fromShape(const shape_type&) -> std::monostate { return {}; }
};

template <>
struct KeyShape<std::strong_ordering> {
    using shape_type = shape::Choice<shape::Wrap<shape::Unit, "less">,
                                     shape::Wrap<shape::Unit, "equal">,
                                     shape::Wrap<shape::Unit, "greater">>;

    static auto toShape(const std::strong_ordering& order) -> shape_type {
        if (order < 0) {
            return shape_type::left({});
        }
        if (order == 0) {
            return shape_type::right(shape_type::right_type::left({}));
        }
        return shape_type::right(shape_type::right_type::right({}));
    }

    static auto fromShape(const shape_type& shape) -> std::strong_ordering {
        if (shape.isLeft()) {
            return std::strong_ordering::less;
        }
        return shape.rightValue().isLeft() ? std::strong_ordering::equal
                                           : std::strong_ordering::greater;
    }
};

template <typename T>
struct KeyShape<std::optional<T>> {
    using shape_type =
        shape::Sum<shape::Wrap<shape::Unit, "nullopt">, shape::Field<T>>;

    static auto toShape(const std::optional<T>& value) -> shape_type {
        if (!value) {
            return shape_type::left({});
        }
        return shape_type::right(shape::Field<T>{*value});
    }

    static auto fromShape(const shape_type& shape) -> std::optional<T> {
        if (shape.isLeft()) {
            return std::nullopt;
        }
        return shape.rightValue().value;
    }
};

/**
 * @brief Alternative I of a variant is constructor I of the Choice.
 */
template <typename... Ts>
struct KeyShape<std::variant<Ts...>> {
    static_assert(sizeof...(Ts) > 0);

    using shape_type = shape::Choice<shape::Field<Ts>...>;

    static auto toShape(const std::variant<Ts...>& value) -> shape_type {
        if (value.valueless_by_exception()) {
            THROW_INVALID_ARGUMENT("a valueless variant has no key shape");
        }
        return toShapeAt<0>(value);
    }

    static auto fromShape(const shape_type& shape) -> std::variant<Ts...> {
        return shape::match<shape::Field<Ts>...>(
            shape, [](auto index, const auto& field) {
                return std::variant<Ts...>(
                    std::in_place_index<decltype(index)::value>, field.value);
            });
    }

private:
    template <std::size_t I>
    static auto toShapeAt(const std::variant<Ts...>& value) -> shape_type {
        if constexpr (I + 1 < sizeof...(Ts)) {
            if (value.index() != I) {
                return toShapeAt<I + 1>(value);
            }
        }
        using Alternative = std::variant_alternative_t<I, std::variant<Ts...>>;
        return shape::inject<I, shape::Field<Ts>...>(
            shape::Field<Alternative>{std::get<I>(value)});
    }
};

template <typename A, typename B>
struct KeyShape<std::pair<A, B>> {
    using shape_type = shape::Fields<A, B>;

    static auto toShape(const std::pair<A, B>& value) -> shape_type {
        return shape::makeFields<A, B>(value.first, value.second);
    }

    static auto fromShape(const shape_type& shape) -> std::pair<A, B> {
        return std::make_from_tuple<std::pair<A, B>>(
            shape::takeFields<A, B>(shape));
    }
};

template <typename... Ts>
struct KeyShape<std::tuple<Ts...>> {
    using shape_type = shape::Fields<Ts...>;

    static auto toShape(const std::tuple<Ts...>& value) -> shape_type {
        return std::apply(
            [](const Ts&... fields) {
                return shape::makeFields<Ts...>(fields...);
            },
            value);
    }

    static auto fromShape(const shape_type& shape) -> std::tuple<Ts...> {
        return shape::takeFields<Ts...>(shape);
    }
};

/**
 * @brief A list is empty, or an element followed by a list. Lists sharing
 * a prefix share the trie path for it.
 */
template <typename E>
struct KeyShape<List<E>> {
    using shape_type =
        shape::Sum<shape::Wrap<shape::Unit, "nil">,
                   shape::Wrap<shape::Fields<E, List<E>>, "cons">>;

    static auto withinDepthLimit(const List<E>& list) -> bool {
        return detail::fitsSequenceDepth(list.size());
    }

    static auto toShape(const List<E>& list) -> shape_type {
        detail::checkSequenceDepth(list.size());
        if (list.empty()) {
            return shape_type::left({});
        }
        return shape_type::right(
            {shape::makeFields<E, List<E>>(list.head(), list.tail())});
    }

    static auto fromShape(const shape_type& shape) -> List<E> {
        if (shape.isLeft()) {
            return {};
        }
        const auto& cell = shape.rightValue().inner;
        return List<E>::cons(cell.first.value, cell.second.value);
    }
};

template <typename E, typename Alloc>
struct KeyShape<std::vector<E, Alloc>> {
    using shape_type = shape::Wrap<shape::Field<List<E>>, "vector">;

    static auto withinDepthLimit(const std::vector<E, Alloc>& value) -> bool {
        return detail::fitsSequenceDepth(value.size());
    }

    static auto toShape(const std::vector<E, Alloc>& value) -> shape_type {
        detail::checkSequenceDepth(value.size());
        return {{List<E>::fromRange(value)}};
    }

    static auto fromShape(const shape_type& shape) -> std::vector<E, Alloc> {
        const List<E>& list = shape.inner.value;
        return std::vector<E, Alloc>(list.begin(), list.end());
    }
};

template <typename C, typename Traits, typename Alloc>
struct KeyShape<std::basic_string<C, Traits, Alloc>> {
    using shape_type = shape::Wrap<shape::Field<List<C>>, "string">;

    static auto withinDepthLimit(
        const std::basic_string<C, Traits, Alloc>& value) -> bool {
        return detail::fitsSequenceDepth(value.size());
    }

    static auto toShape(const std::basic_string<C, Traits, Alloc>& value)
        -> shape_type {
        detail::checkSequenceDepth(value.size());
        return {{List<C>::fromRange(value)}};
    }

    static auto fromShape(const shape_type& shape)
        -> std::basic_string<C, Traits, Alloc> {
        const List<C>& list = shape.inner.value;
        return std::basic_string<C, Traits, Alloc>(list.begin(), list.end());
    }
};

}  // namespace gentrie

#endif  // GENTRIE_TRIE_INSTANCES_HPP
