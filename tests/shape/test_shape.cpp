#include <gtest/gtest.h>

#include <string>
#include <tuple>
#include <type_traits>

#include "gentrie/shape/key_shape.hpp"
#include "gentrie/shape/shape.hpp"

using namespace gentrie;
using namespace gentrie::shape;

namespace {
struct Point {
    int x;
    int y;
};
}  // namespace

template <>
struct gentrie::KeyShape<Point> {
    using shape_type = shape::Fields<int, int>;
    static auto toShape(const Point& p) -> shape_type {
        return shape::makeFields(p.x, p.y);
    }
    static auto fromShape(const shape_type& s) -> Point {
        auto [x, y] = shape::takeFields<int, int>(s);
        return {x, y};
    }
};

TEST(ShapeTest, FieldsNestToTheRight) {
    static_assert(std::is_same_v<Fields<>, Unit>);
    static_assert(std::is_same_v<Fields<int>, Field<int>>);
    static_assert(std::is_same_v<Fields<int, char, bool>,
                                 Product<Field<int>, Product<Field<char>, Field<bool>>>>);
    auto shape = makeFields(1, 'c', true);
    EXPECT_EQ(shape.first.value, 1);
    EXPECT_EQ(shape.second.first.value, 'c');
    EXPECT_EQ((takeFields<int, char, bool>(shape)), std::make_tuple(1, 'c', true));
}

TEST(ShapeTest, SumTracksSideWithEqualTypes) {
    using Coin = Sum<Unit, Unit>;
    Coin heads = Coin::left({});
    Coin tails = Coin::right({});
    EXPECT_TRUE(heads.isLeft());
    EXPECT_FALSE(tails.isLeft());
    EXPECT_FALSE(heads == tails);
    EXPECT_TRUE(heads == Coin::left({}));
}

TEST(ShapeTest, ChoiceInjectAndMatch) {
    using Three = Choice<Field<int>, Unit, Field<std::string>>;
    static_assert(std::is_same_v<Three, Sum<Field<int>, Sum<Unit, Field<std::string>>>>);
    Three value = inject<2, Field<int>, Unit, Field<std::string>>(Field<std::string>{"x"});
    EXPECT_FALSE(value.isLeft());
    std::size_t seen = match<Field<int>, Unit, Field<std::string>>(
        value, [](auto index, const auto&) { return decltype(index)::value; });
    EXPECT_EQ(seen, 2U);
    Three first = inject<0, Field<int>, Unit, Field<std::string>>(Field<int>{5});
    EXPECT_TRUE(first.isLeft());
    EXPECT_EQ(first.leftValue().value, 5);
}

TEST(ShapeTest, WrapIsTransparentForEquality) {
    using Tagged = Wrap<Field<int>, "tag">;
    EXPECT_EQ(Tagged::name, "tag");
    EXPECT_TRUE(Tagged{{1}} == Tagged{{1}});
    EXPECT_FALSE(Tagged{{1}} == Tagged{{2}});
}

TEST(ShapeTest, DescribeRendersStructure) {
    EXPECT_EQ((describe<Sum<Unit, Product<Field<int>, Void>>>()),
              "Sum(Unit, Product(Field, Void))");
    EXPECT_EQ((describe<Wrap<Unit, "nil">>()), "nil:Unit");
}

TEST(KeyShapeTest, UserKeyRoundTrips) {
    static_assert(ShapedKey<Point>);
    static_assert(!ShapedKey<double>);
    Point p{3, -4};
    Point back = KeyShape<Point>::fromShape(KeyShape<Point>::toShape(p));
    EXPECT_EQ(back.x, 3);
    EXPECT_EQ(back.y, -4);
}
