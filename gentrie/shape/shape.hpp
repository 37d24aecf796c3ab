/*
 * shape.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-20

Description: The structural vocabulary every trie key decomposes into:
             Void, Unit, Field, Product, Sum and Wrap.

**************************************************/

#ifndef GENTRIE_SHAPE_SHAPE_HPP
#define GENTRIE_SHAPE_SHAPE_HPP

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace gentrie::shape {

/**
 * @brief Compile-time string used to tag Wrap positions.
 *
 * @tparam N Size of the literal including the terminator.
 */
template <std::size_t N>
struct FixedName {
    char data[N]{};

    constexpr FixedName(const char (&str)[N]) {
        std::copy_n(str, N, data);
    }

    [[nodiscard]] constexpr auto view() const -> std::string_view {
        return {data, N - 1};
    }
};

/**
 * @brief Position of a type without constructors.
 *
 * A correct key bijection never produces a Void value; the trie engine
 * treats reaching one as an internal-invariant violation.
 */
struct Void {
    friend constexpr bool operator==(const Void&, const Void&) noexcept {
        return true;
    }
};

/**
 * @brief Nullary constructor: exactly one value, no payload.
 */
struct Unit {
    friend constexpr bool operator==(const Unit&, const Unit&) noexcept {
        return true;
    }
};

/**
 * @brief A single value of a leaf or recursive key type.
 */
template <typename T>
struct Field {
    using value_type = T;

    T value;

    friend bool operator==(const Field& lhs, const Field& rhs) {
        return lhs.value == rhs.value;
    }
};

/**
 * @brief Both an L and an R sub-value. Constructors with more than two
 * fields nest to the right.
 */
template <typename L, typename R>
struct Product {
    using first_type = L;
    using second_type = R;

    L first;
    R second;

    friend bool operator==(const Product& lhs, const Product& rhs) {
        return lhs.first == rhs.first && lhs.second == rhs.second;
    }
};

/**
 * @brief Either an L or an R sub-value.
 *
 * The side is tracked by index, so L and R may be the same type.
 */
template <typename L, typename R>
class Sum {
public:
    using left_type = L;
    using right_type = R;

    static auto left(L value) -> Sum {
        return Sum(std::in_place_index<0>, std::move(value));
    }

    static auto right(R value) -> Sum {
        return Sum(std::in_place_index<1>, std::move(value));
    }

    [[nodiscard]] auto isLeft() const noexcept -> bool {
        return alt_.index() == 0;
    }

    [[nodiscard]] auto leftValue() const -> const L& {
        return std::get<0>(alt_);
    }

    [[nodiscard]] auto rightValue() const -> const R& {
        return std::get<1>(alt_);
    }

    friend bool operator==(const Sum& lhs, const Sum& rhs) {
        return lhs.alt_ == rhs.alt_;
    }

private:
    template <std::size_t I, typename U>
    Sum(std::in_place_index_t<I> tag, U&& value)
        : alt_(tag, std::forward<U>(value)) {}

    std::variant<L, R> alt_;
};

/**
 * @brief Transparent metadata around S. The name is only a diagnostic.
 */
template <typename S, FixedName Name = "">
struct Wrap {
    using inner_type = S;
    static constexpr std::string_view name = Name.view();

    S inner;

    friend bool operator==(const Wrap& lhs, const Wrap& rhs) {
        return lhs.inner == rhs.inner;
    }
};

// ---------------------------------------------------------------------------
// Shape traits
// ---------------------------------------------------------------------------

namespace detail {
template <typename S>
struct IsShape : std::false_type {};
template <>
struct IsShape<Void> : std::true_type {};
template <>
struct IsShape<Unit> : std::true_type {};
template <typename T>
struct IsShape<Field<T>> : std::true_type {};
template <typename L, typename R>
struct IsShape<Product<L, R>>
    : std::bool_constant<IsShape<L>::value && IsShape<R>::value> {};
template <typename L, typename R>
struct IsShape<Sum<L, R>>
    : std::bool_constant<IsShape<L>::value && IsShape<R>::value> {};
template <typename S, FixedName Name>
struct IsShape<Wrap<S, Name>> : IsShape<S> {};
}  // namespace detail

/**
 * @brief Satisfied by types built only from the shape vocabulary.
 */
template <typename S>
concept ShapeType = detail::IsShape<std::remove_cvref_t<S>>::value;

/**
 * @brief Human-readable rendering of a shape type, for diagnostics.
 *
 * Field positions print as `Field`; the key type they hold is not spelled
 * out.
 */
template <ShapeType S>
auto describe() -> std::string {
    if constexpr (std::is_same_v<S, Void>) {
        return "Void";
    } else if constexpr (std::is_same_v<S, Unit>) {
        return "Unit";
    } else if constexpr (requires { typename S::value_type; }) {
        return "Field";
    } else if constexpr (requires { typename S::first_type; }) {
        return "Product(" + describe<typename S::first_type>() + ", " +
               describe<typename S::second_type>() + ")";
    } else if constexpr (requires { typename S::left_type; }) {
        return "Sum(" + describe<typename S::left_type>() + ", " +
               describe<typename S::right_type>() + ")";
    } else {
        std::string inner = describe<typename S::inner_type>();
        if (S::name.empty()) {
            return inner;
        }
        return std::string(S::name) + ":" + inner;
    }
}

// ---------------------------------------------------------------------------
// Record helpers: a constructor with fields Ts... is Unit, Field<T> or a
// right-nested Product chain of Fields.
// ---------------------------------------------------------------------------

namespace detail {
template <typename... Ts>
struct FieldsOf;

template <>
struct FieldsOf<> {
    using type = Unit;
};

template <typename T>
struct FieldsOf<T> {
    using type = Field<T>;
};

template <typename T, typename U, typename... Rest>
struct FieldsOf<T, U, Rest...> {
    using type = Product<Field<T>, typename FieldsOf<U, Rest...>::type>;
};
}  // namespace detail

template <typename... Ts>
using Fields = typename detail::FieldsOf<Ts...>::type;

namespace detail {
template <typename... Ts>
struct FieldOps;

template <>
struct FieldOps<> {
    static auto make() -> Unit { return {}; }
    static auto take(const Unit&) -> std::tuple<> { return {}; }
};

template <typename T>
struct FieldOps<T> {
    static auto make(T value) -> Field<T> { return {std::move(value)}; }
    static auto take(const Field<T>& shape) -> std::tuple<T> {
        return std::tuple<T>{shape.value};
    }
};

template <typename T, typename U, typename... Rest>
struct FieldOps<T, U, Rest...> {
    static auto make(T head, U next, Rest... rest) -> Fields<T, U, Rest...> {
        return {Field<T>{std::move(head)},
                FieldOps<U, Rest...>::make(std::move(next),
                                           std::move(rest)...)};
    }
    static auto take(const Fields<T, U, Rest...>& shape)
        -> std::tuple<T, U, Rest...> {
        return std::tuple_cat(std::tuple<T>{shape.first.value},
                              FieldOps<U, Rest...>::take(shape.second));
    }
};
}  // namespace detail

/**
 * @brief Build the shape value of a constructor from its field values.
 */
template <typename... Ts>
auto makeFields(Ts... values) -> Fields<Ts...> {
    return detail::FieldOps<Ts...>::make(std::move(values)...);
}

/**
 * @brief Recover the field values of a constructor as a tuple.
 */
template <typename... Ts>
auto takeFields(const Fields<Ts...>& shape) -> std::tuple<Ts...> {
    return detail::FieldOps<Ts...>::take(shape);
}

// ---------------------------------------------------------------------------
// Choice helpers: a type with constructors S0..Sn is a right-nested Sum
// chain of their shapes.
// ---------------------------------------------------------------------------

namespace detail {
template <typename... Ss>
struct ChoiceOf;

template <typename S>
struct ChoiceOf<S> {
    using type = S;
};

template <typename S, typename T, typename... Rest>
struct ChoiceOf<S, T, Rest...> {
    using type = Sum<S, typename ChoiceOf<T, Rest...>::type>;
};
}  // namespace detail

template <typename... Ss>
using Choice = typename detail::ChoiceOf<Ss...>::type;

namespace detail {
template <std::size_t Offset, typename... Ss>
struct ChoiceOps;

template <std::size_t Offset, typename S>
struct ChoiceOps<Offset, S> {
    template <std::size_t I>
    static auto inject(S value) -> S {
        static_assert(I == 0, "constructor index out of range");
        return value;
    }

    template <typename Visitor>
    static auto match(const S& value, Visitor& visitor) {
        return visitor(std::integral_constant<std::size_t, Offset>{}, value);
    }
};

template <std::size_t Offset, typename S, typename T, typename... Rest>
struct ChoiceOps<Offset, S, T, Rest...> {
    using choice_type = Choice<S, T, Rest...>;
    using next = ChoiceOps<Offset + 1, T, Rest...>;

    template <std::size_t I>
    static auto inject(std::tuple_element_t<I, std::tuple<S, T, Rest...>> value)
        -> choice_type {
        if constexpr (I == 0) {
            return choice_type::left(std::move(value));
        } else {
            return choice_type::right(
                next::template inject<I - 1>(std::move(value)));
        }
    }

    template <typename Visitor>
    static auto match(const choice_type& value, Visitor& visitor) {
        if (value.isLeft()) {
            return visitor(std::integral_constant<std::size_t, Offset>{},
                           value.leftValue());
        }
        return next::match(value.rightValue(), visitor);
    }
};
}  // namespace detail

/**
 * @brief Inject the shape of the I-th constructor into its Choice.
 */
template <std::size_t I, typename... Ss>
auto inject(std::tuple_element_t<I, std::tuple<Ss...>> value)
    -> Choice<Ss...> {
    return detail::ChoiceOps<0, Ss...>::template inject<I>(std::move(value));
}

/**
 * @brief Call visitor(std::integral_constant<std::size_t, I>{}, shape_I)
 * for the constructor held by a Choice value. Every call must return the
 * same type.
 */
template <typename... Ss, typename Visitor>
auto match(const Choice<Ss...>& choice, Visitor&& visitor) {
    return detail::ChoiceOps<0, Ss...>::match(choice, visitor);
}

}  // namespace gentrie::shape

#endif  // GENTRIE_SHAPE_SHAPE_HPP
