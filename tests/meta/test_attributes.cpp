/*!
 * \file test_attributes.cpp
 * \brief Unit tests for member attributes
 * \author Max Qian <lightapt.com>
 * \date 2024-6-12
 * \copyright Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include "enumkit/meta/attributes.hpp"

#include <string>
#include <utility>
#include <vector>

#include "enumkit/error/exception.hpp"

namespace enumkit::test {

using namespace enumkit::meta;

// User-defined attribute carrying a unit symbol
class UnitAttribute final : public Attribute {
public:
    explicit UnitAttribute(std::string symbol) : symbol_(std::move(symbol)) {}

    [[nodiscard]] auto kind() const -> std::string_view override {
        return "Unit";
    }
    [[nodiscard]] auto symbol() const -> const std::string& { return symbol_; }

private:
    std::string symbol_;
};

class AttributesTest : public ::testing::Test {
protected:
    AttributeCollection attributes_{description("Metres per second"),
                                    makeAttribute<UnitAttribute>("m/s"),
                                    display("Speed", 2),
                                    makeAttribute<UnitAttribute>("km/h")};
};

TEST_F(AttributesTest, TypedLookup) {
    const auto* unit = attributes_.get<UnitAttribute>();
    ASSERT_NE(unit, nullptr);
    EXPECT_EQ(unit->symbol(), "m/s");
    EXPECT_EQ(unit->kind(), "Unit");

    const auto units = attributes_.getAll<UnitAttribute>();
    ASSERT_EQ(units.size(), 2U);
    EXPECT_EQ(units[1]->symbol(), "km/h");

    EXPECT_TRUE(attributes_.has<DisplayAttribute>());
    EXPECT_FALSE(attributes_.has<PrimaryEnumMemberAttribute>());
    EXPECT_EQ(attributes_.get<EnumMemberAttribute>(), nullptr);
}

TEST_F(AttributesTest, BuiltinAccessors) {
    EXPECT_EQ(attributes_.description(), "Metres per second");
    EXPECT_EQ(attributes_.displayName(), "Speed");
    EXPECT_EQ(attributes_.displayOrder(), 2);
    EXPECT_EQ(attributes_.enumMemberValue(), std::nullopt);
    EXPECT_FALSE(attributes_.isPrimary());
}

TEST_F(AttributesTest, IterationKeepsDeclarationOrder) {
    std::vector<std::string> kinds;
    for (const auto& attribute : attributes_) {
        kinds.emplace_back(attribute->kind());
    }
    EXPECT_EQ(kinds, (std::vector<std::string>{"Description", "Unit",
                                               "Display", "Unit"}));
    EXPECT_EQ(attributes_.size(), 4U);
    EXPECT_FALSE(attributes_.empty());
}

TEST_F(AttributesTest, EmptyCollection) {
    AttributeCollection empty;
    EXPECT_TRUE(empty.empty());
    EXPECT_EQ(empty.description(), std::nullopt);
    EXPECT_EQ(empty.displayOrder(), std::nullopt);
    EXPECT_FALSE(empty.isPrimary());
}

TEST_F(AttributesTest, PrimaryMarkerAndDisplayWithoutOrder) {
    AttributeCollection attributes{primary(), display("Shown"),
                                   enumMember("shown_value")};
    EXPECT_TRUE(attributes.isPrimary());
    EXPECT_EQ(attributes.displayName(), "Shown");
    EXPECT_EQ(attributes.displayOrder(), std::nullopt);
    EXPECT_EQ(attributes.enumMemberValue(), "shown_value");
}

TEST_F(AttributesTest, NullAttributeIsRejected) {
    EXPECT_THROW((AttributeCollection{description("x"), nullptr}),
                 error::InvalidArgument);
    EXPECT_THROW(AttributeCollection(std::vector<AttributePtr>{nullptr}),
                 error::InvalidArgument);
}

}  // namespace enumkit::test
