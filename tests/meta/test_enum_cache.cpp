/*!
 * \file test_enum_cache.cpp
 * \brief Unit tests for EnumCache
 * \author Max Qian <lightapt.com>
 * \date 2024-6-12
 * \copyright Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include "enumkit/meta/enum_cache.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace enumkit::test {

using meta::EnumCache;
using meta::EnumFormat;
using meta::EnumMemberSelection;
using meta::EnumValidation;

namespace {
template <typename Cache>
auto namesOf(typename Cache::member_span members) -> std::vector<std::string> {
    std::vector<std::string> names;
    for (const auto* member : members) {
        names.push_back(member->name());
    }
    return names;
}

// Validator accepting multiples of three only
class MultipleOfThree final : public meta::IEnumBridge<int> {
public:
    [[nodiscard]] auto hasCustomValidator() const noexcept -> bool override {
        return true;
    }
    [[nodiscard]] auto customValidate(int value) const -> bool override {
        return value % 3 == 0;
    }
};
}  // namespace

class EnumCacheTest : public ::testing::Test {
protected:
    using IntCache = EnumCache<int>;
    using ByteCache = EnumCache<std::uint8_t>;

    void SetUp() override {
        sparse_ = std::make_unique<IntCache>(
            "Sparse", false,
            std::vector<IntCache::Field>{{100, "Hundred", {}},
                                         {-10, "MinusTen", {}},
                                         {5, "Five", {}},
                                         {0, "Zero", {}}});
        level_ = std::make_unique<ByteCache>(
            "Level", false,
            std::vector<ByteCache::Field>{{0, "Zero", {}},
                                          {1, "One", {}},
                                          {2, "Two", {}},
                                          {3, "Three", {}}});
    }

    std::unique_ptr<IntCache> sparse_;
    std::unique_ptr<ByteCache> level_;
};

TEST_F(EnumCacheTest, DistinctMembersAreSortedByValue) {
    EXPECT_EQ(namesOf<IntCache>(sparse_->distinctMembers()),
              (std::vector<std::string>{"MinusTen", "Zero", "Five", "Hundred"}));
    EXPECT_TRUE(sparse_->duplicateMembers().empty());
    EXPECT_EQ(sparse_->minDefined(), -10);
    EXPECT_EQ(sparse_->maxDefined(), 100);
    EXPECT_FALSE(sparse_->isContiguous());
    EXPECT_TRUE(level_->isContiguous());
}

TEST_F(EnumCacheTest, AliasesFollowTheirCanonicalMember) {
    IntCache cache("Alias", false,
                   {{2, "Two", {}},
                    {1, "A", {}},
                    {1, "B", {}},
                    {2, "Deux", {}},
                    {1, "C", {}}});
    EXPECT_EQ(namesOf<IntCache>(cache.distinctMembers()),
              (std::vector<std::string>{"A", "Two"}));
    EXPECT_EQ(namesOf<IntCache>(cache.duplicateMembers()),
              (std::vector<std::string>{"B", "C", "Deux"}));
    EXPECT_EQ(namesOf<IntCache>(cache.allMembers()),
              (std::vector<std::string>{"A", "B", "C", "Two", "Deux"}));
    EXPECT_EQ(cache.getMemberCount(), 5U);
    EXPECT_EQ(cache.getMemberCount(EnumMemberSelection::Distinct), 2U);
    EXPECT_EQ(cache.getName(1), "A");
    EXPECT_EQ(cache.getMember("B")->value(), 1);
}

TEST_F(EnumCacheTest, PrimaryMarkerChoosesCanonicalMember) {
    IntCache cache("Alias", false,
                   {{1, "A", {}}, {1, "B", {meta::primary()}}, {1, "C", {}}});
    EXPECT_EQ(cache.getName(1), "B");
    EXPECT_EQ(cache.asString(1), "B");
    EXPECT_EQ(namesOf<IntCache>(cache.duplicateMembers()),
              (std::vector<std::string>{"A", "C"}));
}

TEST_F(EnumCacheTest, FirstPrimaryMarkerWins) {
    IntCache cache("Alias", false,
                   {{1, "A", {}},
                    {1, "B", {meta::primary()}},
                    {1, "C", {meta::primary()}}});
    EXPECT_EQ(cache.getName(1), "B");
}

TEST_F(EnumCacheTest, IsDefinedMatchesMemberLookup) {
    for (int value = -20; value <= 120; ++value) {
        EXPECT_EQ(sparse_->isDefined(value), sparse_->getMember(value) != nullptr)
            << value;
    }
    for (int value = 0; value <= 255; ++value) {
        const auto byte = static_cast<std::uint8_t>(value);
        EXPECT_EQ(level_->isDefined(byte), value <= 3) << value;
        EXPECT_EQ(level_->getMember(byte) != nullptr, value <= 3) << value;
    }
}

TEST_F(EnumCacheTest, EmptyCache) {
    IntCache cache("Empty", false, {});
    EXPECT_EQ(cache.getMemberCount(), 0U);
    EXPECT_FALSE(cache.isContiguous());
    EXPECT_FALSE(cache.isDefined(0));
    EXPECT_EQ(cache.getMember(0), nullptr);
    EXPECT_EQ(cache.getAllFlags(), 0);
    EXPECT_EQ(cache.asString(0), "0");
    EXPECT_FALSE(cache.tryParse("Anything"));
    EXPECT_EQ(cache.parse("12"), 12);
}

TEST_F(EnumCacheTest, SingleMemberIsContiguous) {
    IntCache cache("Single", false, {{42, "Answer", {}}});
    EXPECT_TRUE(cache.isContiguous());
    EXPECT_TRUE(cache.isDefined(42));
    EXPECT_FALSE(cache.isDefined(41));
    EXPECT_FALSE(cache.isDefined(43));
}

TEST_F(EnumCacheTest, ContiguityAcrossTheSignBoundary) {
    EnumCache<std::int8_t> cache("Signed", false,
                                 {{-1, "MinusOne", {}},
                                  {0, "Zero", {}},
                                  {1, "One", {}}});
    EXPECT_TRUE(cache.isContiguous());
    EXPECT_EQ(cache.getName(-1), "MinusOne");
    EXPECT_FALSE(cache.isDefined(2));
    EXPECT_FALSE(cache.isDefined(-128));
}

TEST_F(EnumCacheTest, FullRangeEnumIsContiguous) {
    EnumCache<std::uint8_t>::Field field{0, "", {}};
    std::vector<EnumCache<std::uint8_t>::Field> fields;
    for (int value = 0; value <= 255; ++value) {
        field.value = static_cast<std::uint8_t>(value);
        field.name = "V" + std::to_string(value);
        fields.push_back(field);
    }
    EnumCache<std::uint8_t> cache("Byte", false, std::move(fields));
    EXPECT_TRUE(cache.isContiguous());
    EXPECT_EQ(cache.getName(255), "V255");
}

TEST_F(EnumCacheTest, ValidationModes) {
    EXPECT_TRUE(sparse_->isValid(7, EnumValidation::None));
    EXPECT_FALSE(sparse_->isValid(7));
    EXPECT_TRUE(sparse_->isValid(5, EnumValidation::IsDefined));
    EXPECT_THROW(static_cast<void>(
                     sparse_->isValid(5, static_cast<EnumValidation>(9))),
                 error::InvalidArgument);
    EXPECT_EQ(sparse_->validate(5, "shape"), 5);
    EXPECT_THROW(static_cast<void>(sparse_->validate(6, "shape")),
                 error::InvalidArgument);
}

TEST_F(EnumCacheTest, CustomValidatorOverridesDefaultValidation) {
    IntCache cache("Triple", false, {{3, "Three", {}}, {6, "Six", {}}},
                   std::make_unique<MultipleOfThree>());
    EXPECT_TRUE(cache.isValid(9));
    EXPECT_FALSE(cache.isValid(4));
    EXPECT_FALSE(cache.isValid(9, EnumValidation::IsDefined));
}

TEST_F(EnumCacheTest, ToObjectChecksRangeAndValidation) {
    EXPECT_EQ(level_->toObject(3), 3);
    EXPECT_EQ(level_->toObject(200u), 200);
    EXPECT_THROW(static_cast<void>(level_->toObject(256)), error::Overflow);
    EXPECT_THROW(static_cast<void>(level_->toObject(-1)), error::Overflow);
    EXPECT_THROW(
        static_cast<void>(level_->toObject(4, EnumValidation::IsDefined)),
        error::InvalidArgument);
    EXPECT_EQ(level_->tryToObject(std::int64_t{2}, EnumValidation::Default), 2);
    EXPECT_FALSE(level_->tryToObject(300));
    EXPECT_FALSE(level_->tryToObject(4, EnumValidation::IsDefined));
}

TEST_F(EnumCacheTest, FormatCodes) {
    EXPECT_EQ(sparse_->format(5, "G"), "Five");
    EXPECT_EQ(sparse_->format(5, "g"), "Five");
    EXPECT_EQ(sparse_->format(-10, "D"), "-10");
    EXPECT_EQ(sparse_->format(-10, "X"), "FFFFFFF6");
    EXPECT_EQ(sparse_->format(7, "G"), "7");
    EXPECT_EQ(sparse_->format(7, "F"), "7");
    EXPECT_EQ(level_->format(2, "x"), "02");
    EXPECT_THROW(static_cast<void>(sparse_->format(5, "Q")),
                 error::InvalidFormat);
    EXPECT_THROW(static_cast<void>(sparse_->format(5, "GG")),
                 error::InvalidFormat);
    EXPECT_THROW(static_cast<void>(sparse_->format(5, "")),
                 error::InvalidFormat);
    EXPECT_EQ(sparse_->asString(5, ""), "Five");
}

TEST_F(EnumCacheTest, FormatOrderReturnsFirstRendering) {
    IntCache cache("Described", false,
                   {{1, "Plain", {}}, {2, "Fancy", {meta::description("A fancy one")}}});
    const std::array order{EnumFormat::Description, EnumFormat::Name};
    EXPECT_EQ(cache.format(1, order), "Plain");
    EXPECT_EQ(cache.format(2, order), "A fancy one");
    EXPECT_EQ(cache.format(1, EnumFormat::Description), std::nullopt);
    EXPECT_EQ(cache.format(3, order), std::nullopt);
    const std::array withValue{EnumFormat::Description,
                               EnumFormat::DecimalValue};
    EXPECT_EQ(cache.format(3, withValue), "3");
    EXPECT_EQ(cache.format(2, EnumFormat::HexadecimalValue), "00000002");
}

TEST_F(EnumCacheTest, FormatRejectsBadFormatLists) {
    EXPECT_THROW(static_cast<void>(sparse_->format(
                     5, std::span<const EnumFormat>{})),
                 error::InvalidArgument);
    const std::array bad{EnumFormat::Name, static_cast<EnumFormat>(55)};
    EXPECT_THROW(static_cast<void>(sparse_->format(5, bad)),
                 error::InvalidArgument);
    EXPECT_EQ(sparse_->asString(5, std::span<const EnumFormat>{}), "Five");
}

TEST_F(EnumCacheTest, ParseNamesAndNumbers) {
    EXPECT_EQ(sparse_->parse("Five"), 5);
    EXPECT_EQ(sparse_->parse("  Hundred\t"), 100);
    EXPECT_EQ(sparse_->parse("-10"), -10);
    EXPECT_EQ(sparse_->parse("7"), 7);
    EXPECT_EQ(sparse_->parse("five", true), 5);
    EXPECT_THROW(static_cast<void>(sparse_->parse("five")),
                 error::ParserError);
    EXPECT_THROW(static_cast<void>(sparse_->parse("")), error::ParserError);
    EXPECT_THROW(static_cast<void>(sparse_->parse("99999999999")),
                 error::Overflow);
    EXPECT_FALSE(sparse_->tryParse("Six"));
    EXPECT_EQ(sparse_->tryParse(" MinusTen "), -10);
}

TEST_F(EnumCacheTest, ParseOutOfRangeNumberOverflows) {
    EXPECT_THROW(static_cast<void>(level_->parse("999")), error::Overflow);
    EXPECT_THROW(static_cast<void>(level_->parse("-1")), error::Overflow);
    EXPECT_FALSE(level_->tryParse("999"));
    EXPECT_EQ(level_->parse("255"), 255);
}

TEST_F(EnumCacheTest, ParseInGivenFormats) {
    const std::array hex{EnumFormat::HexadecimalValue};
    EXPECT_EQ(sparse_->parse("FFFFFFF6", false, hex), -10);
    EXPECT_FALSE(sparse_->tryParse("Five", false, hex));
    const std::array nameOnly{EnumFormat::Name};
    EXPECT_FALSE(sparse_->tryParse("5", false, nameOnly));
    const std::array bad{static_cast<EnumFormat>(77)};
    EXPECT_THROW(static_cast<void>(sparse_->tryParse("Five", false, bad)),
                 error::InvalidArgument);
}

TEST_F(EnumCacheTest, ParseMemberReturnsNullForUndefinedNumber) {
    EXPECT_EQ(sparse_->parseMember("5")->name(), "Five");
    EXPECT_EQ(sparse_->parseMember("Zero")->value(), 0);
    EXPECT_EQ(sparse_->parseMember("6"), nullptr);
    EXPECT_EQ(sparse_->tryParseMember("Six"), nullptr);
    EXPECT_THROW(static_cast<void>(sparse_->parseMember("Six")),
                 error::ParserError);
    EXPECT_THROW(static_cast<void>(level_->parseMember("300")),
                 error::Overflow);
}

TEST_F(EnumCacheTest, SelectionsFilterAndOrder) {
    IntCache cache("Display", false,
                   {{1, "First", {meta::display("one", 3)}},
                    {2, "Second", {}},
                    {3, "Third", {meta::display("three", 1)}},
                    {4, "Fourth", {meta::display("four", 2)}},
                    {3, "ThirdAlias", {}}});
    EXPECT_EQ(cache.getNames(EnumMemberSelection::DisplayOrder),
              (std::vector<std::string>{"Third", "Fourth", "First", "Second",
                                        "ThirdAlias"}));
    EXPECT_EQ(cache.getNames(EnumMemberSelection::Distinct |
                             EnumMemberSelection::DisplayOrder),
              (std::vector<std::string>{"Third", "Fourth", "First", "Second"}));
    EXPECT_EQ(cache.getValues(EnumMemberSelection::Flags),
              (std::vector<int>{1, 2, 4}));
    EXPECT_EQ(cache.getMemberCount(EnumMemberSelection::Flags), 3U);
    EXPECT_FALSE(cache.membersView(EnumMemberSelection::DisplayOrder));
    EXPECT_EQ(cache.membersView(EnumMemberSelection::Distinct)->size(), 4U);
    EXPECT_THROW(static_cast<void>(
                     cache.getMembers(static_cast<EnumMemberSelection>(8))),
                 error::InvalidArgument);
}

TEST_F(EnumCacheTest, AttributesOfValue) {
    IntCache cache("Described", false,
                   {{1, "Plain", {}},
                    {2, "Fancy", {meta::description("A fancy one")}}});
    ASSERT_NE(cache.getAttributes(2), nullptr);
    EXPECT_EQ(cache.getAttributes(2)->description(), "A fancy one");
    EXPECT_TRUE(cache.getAttributes(1)->empty());
    EXPECT_EQ(cache.getAttributes(3), nullptr);
}

}  // namespace enumkit::test
