/*!
 * \file test_raw_name.cpp
 * \brief Unit tests for compile-time type names
 * \author Max Qian <lightapt.com>
 * \date 2024-6-12
 * \copyright Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include "enumkit/meta/raw_name.hpp"

#include <string_view>

namespace enumkit::test {

enum class Shade { Light, Dark };

namespace nested {
enum class Tone { Warm, Cold };
}  // namespace nested

enum Plain { PlainValue };

TEST(RawNameTest, QualifiedName) {
    EXPECT_EQ(meta::raw_name_of<Shade>(), "enumkit::test::Shade");
    EXPECT_EQ(meta::raw_name_of<nested::Tone>(), "enumkit::test::nested::Tone");
    EXPECT_EQ(meta::raw_name_of<int>(), "int");
}

TEST(RawNameTest, ShortName) {
    EXPECT_EQ(meta::short_name_of<Shade>(), "Shade");
    EXPECT_EQ(meta::short_name_of<nested::Tone>(), "Tone");
    EXPECT_EQ(meta::short_name_of<Plain>(), "Plain");
    EXPECT_EQ(meta::short_name_of<int>(), "int");
}

TEST(RawNameTest, UnqualifiedName) {
    EXPECT_EQ(meta::detail::unqualified_name("a::b::C"), "C");
    EXPECT_EQ(meta::detail::unqualified_name("C"), "C");
}

TEST(RawNameTest, UsableAtCompileTime) {
    constexpr std::string_view NAME = meta::short_name_of<Shade>();
    static_assert(!NAME.empty());
    EXPECT_EQ(NAME, "Shade");
}

}  // namespace enumkit::test
