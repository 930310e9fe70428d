/*
 * string.cpp
 *
 * Copyright (C) 2023-2024 Max Q. <contact@lightapt.com>
 */

/*************************************************

Date: 2024-6-3

Description: String helpers for member name lookup

**************************************************/

#include "string.hpp"

#include <algorithm>
#include <cstdint>

namespace enumkit::utils {

namespace {
constexpr std::uint64_t FNV_OFFSET_BASIS = 14695981039346656037ULL;
constexpr std::uint64_t FNV_PRIME = 1099511628211ULL;
}  // namespace

auto trim(std::string_view line, std::string_view symbols) noexcept
    -> std::string_view {
    const auto start = line.find_first_not_of(symbols);
    if (start == std::string_view::npos) {
        return {};
    }
    const auto end = line.find_last_not_of(symbols);
    return line.substr(start, end - start + 1);
}

auto equalsIgnoreCase(std::string_view lhs, std::string_view rhs) noexcept
    -> bool {
    return std::ranges::equal(lhs, rhs, [](char a, char b) {
        return toLowerAscii(a) == toLowerAscii(b);
    });
}

auto ordinalHash(std::string_view str) noexcept -> std::size_t {
    std::uint64_t hash = FNV_OFFSET_BASIS;
    for (const char c : str) {
        hash ^= static_cast<unsigned char>(c);
        hash *= FNV_PRIME;
    }
    return static_cast<std::size_t>(hash);
}

auto ordinalIgnoreCaseHash(std::string_view str) noexcept -> std::size_t {
    std::uint64_t hash = FNV_OFFSET_BASIS;
    for (const char c : str) {
        hash ^= static_cast<unsigned char>(toLowerAscii(c));
        hash *= FNV_PRIME;
    }
    return static_cast<std::size_t>(hash);
}

auto joinStrings(const std::vector<std::string>& strings,
                 std::string_view delimiter) -> std::string {
    std::string result;
    std::size_t totalSize = 0;
    for (const auto& str : strings) {
        totalSize += str.size() + delimiter.size();
    }
    result.reserve(totalSize);

    for (std::size_t i = 0; i < strings.size(); ++i) {
        if (i > 0) {
            result.append(delimiter);
        }
        result.append(strings[i]);
    }
    return result;
}

}  // namespace enumkit::utils
