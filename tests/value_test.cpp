#include <bimcollab/value.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

using namespace bimcollab;

// -- Null ---------------------------------------------------------------------

TEST(Null, all_nulls_are_equal) {
    EXPECT_EQ(Null{}, Null{});
}

// -- PropertyValue ------------------------------------------------------------

TEST(PropertyValue, holds_each_alternative) {
    auto v = PropertyValue{};
    EXPECT_TRUE(std::holds_alternative<Null>(v));

    v = true;
    EXPECT_TRUE(std::holds_alternative<bool>(v));
    v = std::int64_t{10};
    EXPECT_EQ(std::get<std::int64_t>(v), 10);
    v = 2.5;
    EXPECT_DOUBLE_EQ(std::get<double>(v), 2.5);
    v = std::string{"concrete"};
    EXPECT_EQ(std::get<std::string>(v), "concrete");
}

TEST(PropertyValue, overload_visitor_dispatches_by_type) {
    const auto v = PropertyValue{std::string{"brick"}};
    auto name = std::visit(overload{
        [](const std::string&) { return std::string{"string"}; },
        [](auto&&) { return std::string{"other"}; },
    }, v);
    EXPECT_EQ(name, "string");
}

// -- get_property -------------------------------------------------------------

TEST(GetProperty, returns_typed_value) {
    const auto props = PropertyMap{{"height", std::int64_t{10}}, {"material", std::string{"oak"}}};

    EXPECT_EQ(get_property<std::int64_t>(props, "height"), 10);
    EXPECT_EQ(get_property<std::string>(props, "material"), "oak");
}

TEST(GetProperty, missing_key_or_wrong_type_is_nullopt) {
    const auto props = PropertyMap{{"height", std::int64_t{10}}};

    EXPECT_FALSE(get_property<std::int64_t>(props, "width").has_value());
    EXPECT_FALSE(get_property<double>(props, "height").has_value());
}

// -- shallow_merge ------------------------------------------------------------

TEST(ShallowMerge, overlay_wins_on_collision) {
    const auto base = PropertyMap{{"height", std::int64_t{10}}, {"width", std::int64_t{4}}};
    const auto overlay = PropertyMap{{"height", std::int64_t{12}}, {"color", std::string{"red"}}};

    const auto merged = shallow_merge(base, overlay);

    ASSERT_EQ(merged.size(), 3u);
    EXPECT_EQ(get_property<std::int64_t>(merged, "height"), 12);
    EXPECT_EQ(get_property<std::int64_t>(merged, "width"), 4);
    EXPECT_EQ(get_property<std::string>(merged, "color"), "red");
}

TEST(ShallowMerge, empty_overlay_keeps_base) {
    const auto base = PropertyMap{{"height", std::int64_t{10}}};
    EXPECT_EQ(shallow_merge(base, {}), base);
}
