/*!
 * \file test_flag_enums.cpp
 * \brief Unit tests for FlagEnums
 * \author Max Qian <lightapt.com>
 * \date 2024-6-12
 * \copyright Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include "enumkit/meta/enums.hpp"

#include <ranges>
#include <string>
#include <utility>
#include <vector>

#include "enum_fixtures.hpp"

namespace enumkit::test {

using meta::EnumFormat;
using meta::Enums;
using meta::FlagEnums;

namespace {
constexpr auto operator|(Color lhs, Color rhs) -> Color {
    return static_cast<Color>(static_cast<int>(lhs) | static_cast<int>(rhs));
}

template <typename E>
auto flagsOf(E value) -> std::vector<E> {
    std::vector<E> flags;
    for (auto flag : FlagEnums<E>::getFlags(value)) {
        flags.push_back(flag);
    }
    return flags;
}
}  // namespace

class FlagEnumsTest : public ::testing::Test {
protected:
    using Colors = FlagEnums<Color>;
};

TEST_F(FlagEnumsTest, ColorScenario) {
    EXPECT_TRUE(Colors::isFlagEnum());
    EXPECT_EQ(Colors::getAllFlags(), static_cast<Color>(7));
    EXPECT_EQ(Colors::formatFlags(Color::Red | Color::Blue), "Red, Blue");
    EXPECT_EQ(Colors::parseFlags("Red, Blue"), static_cast<Color>(5));
    EXPECT_EQ(flagsOf(static_cast<Color>(5)),
              (std::vector<Color>{Color::Red, Color::Blue}));
    EXPECT_FALSE(Colors::isValidFlagCombination(static_cast<Color>(8)));
    EXPECT_TRUE(Colors::hasAllFlags(static_cast<Color>(7)));
}

TEST_F(FlagEnumsTest, AsStringDecomposesFlags) {
    EXPECT_EQ(Enums<Color>::asString(Color::Red | Color::Green), "Red, Green");
    EXPECT_EQ(Enums<Color>::asString(Color::Blue), "Blue");
    EXPECT_EQ(Enums<Color>::asString(static_cast<Color>(0)), "0");
    EXPECT_EQ(Enums<Color>::asString(static_cast<Color>(8)), "8");
    EXPECT_EQ(Enums<Color>::asString(static_cast<Color>(9)), "9");
    EXPECT_EQ(Enums<Color>::format(static_cast<Color>(5), "F"), "Red, Blue");
    EXPECT_EQ(Enums<Color>::format(static_cast<Color>(5), "D"), "5");
    EXPECT_EQ(Enums<Color>::format(static_cast<Color>(5), "X"), "00000005");
}

TEST_F(FlagEnumsTest, FormatThenParseRoundTrips) {
    for (int raw = 0; raw <= 7; ++raw) {
        const auto value = static_cast<Color>(raw);
        const auto text = Colors::formatFlags(value);
        ASSERT_TRUE(text.has_value());
        EXPECT_EQ(Colors::parseFlags(*text), value) << *text;
        EXPECT_EQ(Enums<Color>::parse(Enums<Color>::asString(value)), value);
    }
}

TEST_F(FlagEnumsTest, FlagsRecombineToMaskedValue) {
    for (int raw = 0; raw < 32; ++raw) {
        const auto value = static_cast<Color>(raw);
        int combined = 0;
        int count = 0;
        for (auto flag : Colors::getFlags(value)) {
            combined |= static_cast<int>(flag);
            ++count;
        }
        EXPECT_EQ(combined, raw & 7) << raw;
        EXPECT_EQ(count, Colors::getFlagCount(value)) << raw;
    }
}

TEST_F(FlagEnumsTest, ToggleIsAnInvolution) {
    for (int raw = 0; raw <= 7; ++raw) {
        const auto value = static_cast<Color>(raw);
        EXPECT_EQ(Colors::toggleFlags(Colors::toggleFlags(value)), value);
        EXPECT_EQ(Colors::toggleFlags(
                      Colors::toggleFlags(value, Color::Green), Color::Green),
                  value);
    }
    EXPECT_EQ(Colors::toggleFlags(Color::Red), Color::Green | Color::Blue);
}

TEST_F(FlagEnumsTest, FlagAlgebra) {
    const auto all = static_cast<Color>(7);
    const auto redBlue = Color::Red | Color::Blue;
    EXPECT_FALSE(Colors::hasAnyFlags(static_cast<Color>(0)));
    EXPECT_TRUE(Colors::hasAnyFlags(static_cast<Color>(8)));
    EXPECT_FALSE(Colors::hasAnyFlags(redBlue, Color::Green));
    EXPECT_TRUE(Colors::hasAnyFlags(redBlue, Color::Blue));
    EXPECT_FALSE(Colors::hasAllFlags(redBlue));
    EXPECT_TRUE(Colors::hasAllFlags(redBlue, Color::Blue));
    EXPECT_EQ(Colors::commonFlags(all, redBlue), redBlue);
    EXPECT_EQ(Colors::removeFlags(all, Color::Red), Color::Green | Color::Blue);
    EXPECT_EQ(Colors::combineFlags(Color::Red, Color::Blue), redBlue);
    EXPECT_EQ(Colors::combineFlags(Color::Red, Color::Green, Color::Blue), all);
    EXPECT_EQ(Colors::combineFlags({Color::Green}), Color::Green);
    const std::vector<Color> flags{Color::Blue, Color::Red};
    EXPECT_EQ(Colors::combineFlags(std::span<const Color>(flags)), redBlue);
}

TEST_F(FlagEnumsTest, FlagCounts) {
    EXPECT_EQ(Colors::getFlagCount(), 3);
    EXPECT_EQ(Colors::getFlagCount(static_cast<Color>(5)), 2);
    EXPECT_EQ(Colors::getFlagCount(static_cast<Color>(8)), 0);
    EXPECT_EQ(Colors::getFlagCount(static_cast<Color>(7), Color::Red | Color::Blue),
              2);
}

TEST_F(FlagEnumsTest, FlagMembers) {
    const auto members = Colors::getFlagMembers(static_cast<Color>(6));
    ASSERT_EQ(members.size(), 2U);
    EXPECT_EQ(members[0].name(), "Green");
    EXPECT_EQ(members[1].name(), "Blue");
    EXPECT_TRUE(Colors::getFlagMembers(static_cast<Color>(0)).empty());
}

TEST_F(FlagEnumsTest, ParseFlagsTokens) {
    EXPECT_EQ(Colors::parseFlags(""), static_cast<Color>(0));
    EXPECT_EQ(Colors::parseFlags("   "), static_cast<Color>(0));
    EXPECT_EQ(Colors::parseFlags("Red,Blue"), Color::Red | Color::Blue);
    EXPECT_EQ(Colors::parseFlags("  Red ,   Green  "), Color::Red | Color::Green);
    EXPECT_EQ(Colors::parseFlags("1, 4"), Color::Red | Color::Blue);
    EXPECT_EQ(Colors::parseFlags("Red, 8"), static_cast<Color>(9));
    EXPECT_EQ(Colors::parseFlags("red, BLUE", true), Color::Red | Color::Blue);
    EXPECT_THROW(static_cast<void>(Colors::parseFlags("red, Blue")),
                 error::ParserError);
    EXPECT_THROW(static_cast<void>(Colors::parseFlags("Red, Purple")),
                 error::ParserError);
    EXPECT_THROW(static_cast<void>(Colors::parseFlags("Red,,Blue")),
                 error::ParserError);
    EXPECT_THROW(static_cast<void>(Colors::parseFlags("Red, 99999999999")),
                 error::Overflow);
    EXPECT_FALSE(Colors::tryParseFlags("Red, Purple"));
    EXPECT_EQ(Colors::tryParseFlags("Green"), Color::Green);
}

TEST_F(FlagEnumsTest, CustomDelimiters) {
    EXPECT_EQ(Colors::formatFlags(static_cast<Color>(7), " | "),
              "Red | Green | Blue");
    EXPECT_EQ(Colors::parseFlags("Red | Blue", false, " | "),
              Color::Red | Color::Blue);
    EXPECT_EQ(Colors::parseFlags("Red|Blue", false, " | "),
              Color::Red | Color::Blue);
    EXPECT_EQ(Colors::parseFlags("Red Blue", false, " "),
              Color::Red | Color::Blue);
    EXPECT_THROW(static_cast<void>(Colors::formatFlags(Color::Red, "")),
                 error::InvalidArgument);
    EXPECT_THROW(static_cast<void>(Colors::parseFlags("Red", false, "")),
                 error::InvalidArgument);
    EXPECT_THROW(static_cast<void>(Colors::tryParseFlags("Red", false, "")),
                 error::InvalidArgument);
}

TEST_F(FlagEnumsTest, FormatFlagsInOtherFormats) {
    EXPECT_EQ(Colors::formatFlags(static_cast<Color>(3), std::nullopt,
                                  {EnumFormat::DecimalValue}),
              "1, 2");
    EXPECT_EQ(Colors::formatFlags(static_cast<Color>(3), "+",
                                  {EnumFormat::Description, EnumFormat::Name}),
              "Red+Green");
}

TEST_F(FlagEnumsTest, NamedCombinationsAndZeroMember) {
    using AccessFlags = FlagEnums<Access>;
    EXPECT_EQ(AccessFlags::getAllFlags(), Access::All);
    EXPECT_EQ(Enums<Access>::asString(Access::ReadWrite), "ReadWrite");
    EXPECT_EQ(Enums<Access>::asString(Access::None), "None");
    EXPECT_EQ(Enums<Access>::asString(static_cast<Access>(5)), "Read, Execute");
    EXPECT_EQ(Enums<Access>::parse("ReadWrite, Execute"), Access::All);
    EXPECT_EQ(AccessFlags::parseFlags("None"), Access::None);
    EXPECT_EQ(flagsOf(Access::ReadWrite),
              (std::vector<Access>{Access::Read, Access::Write}));
    EXPECT_EQ(Enums<Access>::getMemberCount(meta::EnumMemberSelection::Flags),
              3U);
    EXPECT_TRUE(Enums<Access>::isValid(static_cast<Access>(6)));
    EXPECT_FALSE(Enums<Access>::isValid(static_cast<Access>(8)));
}

TEST_F(FlagEnumsTest, SignBitFlag) {
    using Signed = FlagEnums<SignedFlags>;
    const auto lowAndSign = static_cast<SignedFlags>(
        static_cast<std::int8_t>(0x81));
    EXPECT_EQ(flagsOf(lowAndSign),
              (std::vector<SignedFlags>{SignedFlags::Low, SignedFlags::Sign}));
    EXPECT_EQ(Signed::formatFlags(lowAndSign), "Low, Sign");
    EXPECT_EQ(Signed::parseFlags("Sign, Low"), lowAndSign);
    EXPECT_EQ(Signed::getFlagCount(), 3);
    EXPECT_TRUE(Signed::isValidFlagCombination(lowAndSign));
    EXPECT_EQ(Enums<SignedFlags>::format(SignedFlags::Sign, "X"), "80");
    EXPECT_EQ(Enums<SignedFlags>::format(SignedFlags::Sign, "D"), "-128");
    EXPECT_EQ(flagsOf(static_cast<SignedFlags>(-1)),
              (std::vector<SignedFlags>{SignedFlags::Low, SignedFlags::Mid,
                                        SignedFlags::Sign}));
}

TEST_F(FlagEnumsTest, GetFlagsIsALazyRange) {
    auto flags = Colors::getFlags(static_cast<Color>(7));
    static_assert(std::ranges::input_range<decltype(flags)>);
    auto names = flags | std::views::transform([](Color flag) {
                     return std::string(*Enums<Color>::getName(flag));
                 });
    std::vector<std::string> collected;
    for (auto name : names) {
        collected.push_back(std::move(name));
    }
    EXPECT_EQ(collected, (std::vector<std::string>{"Red", "Green", "Blue"}));
}

}  // namespace enumkit::test
