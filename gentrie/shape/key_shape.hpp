/*
 * key_shape.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-20

Description: The bijection between a key type and its shape value.

**************************************************/

#ifndef GENTRIE_SHAPE_KEY_SHAPE_HPP
#define GENTRIE_SHAPE_KEY_SHAPE_HPP

#include <concepts>
#include <type_traits>
#include <utility>

#include "gentrie/shape/shape.hpp"

namespace gentrie {

/**
 * @brief Shape descriptor of a key type.
 *
 * Specialize for every key type that should be stored in a DerivedMap:
 *
 * @code
 * struct Point { int x; int y; };
 *
 * template <>
 * struct gentrie::KeyShape<Point> {
 *     using shape_type = shape::Fields<int, int>;
 *     static auto toShape(const Point& p) -> shape_type {
 *         return shape::makeFields(p.x, p.y);
 *     }
 *     static auto fromShape(const shape_type& s) -> Point {
 *         auto [x, y] = shape::takeFields<int, int>(s);
 *         return {x, y};
 *     }
 * };
 * @endcode
 *
 * fromShape(toShape(k)) must equal k for every k. The library trusts the
 * pair and never checks it.
 *
 * A recursive key type may only refer to itself in the last field of a
 * constructor, the way a list tail follows its head.
 */
template <typename K>
struct KeyShape;

/**
 * @brief Satisfied by key types with a usable KeyShape specialization.
 */
template <typename K>
concept ShapedKey = requires(const K& key) {
    typename KeyShape<K>::shape_type;
    requires shape::ShapeType<typename KeyShape<K>::shape_type>;
    {
        KeyShape<K>::toShape(key)
    } -> std::convertible_to<typename KeyShape<K>::shape_type>;
    {
        KeyShape<K>::fromShape(
            std::declval<const typename KeyShape<K>::shape_type&>())
    } -> std::convertible_to<K>;
};

template <ShapedKey K>
using ShapeOf = typename KeyShape<K>::shape_type;

/**
 * @brief Whether key is short enough to be stored.
 *
 * A KeyShape whose toShape() rejects long keys also provides a static
 * withinDepthLimit(key) that answers the same question without throwing.
 * Keys of any other type always fit.
 */
template <ShapedKey K>
auto withinDepthLimit(const K& key) -> bool {
    if constexpr (requires {
                      {
                          KeyShape<K>::withinDepthLimit(std::declval<const K&>())
                      } -> std::convertible_to<bool>;
                  }) {
        return KeyShape<K>::withinDepthLimit(key);
    } else {
        return true;
    }
}

}  // namespace gentrie

#endif  // GENTRIE_SHAPE_KEY_SHAPE_HPP
