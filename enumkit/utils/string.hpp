/*
 * string.hpp
 *
 * Copyright (C) 2023-2024 Max Q. <contact@lightapt.com>
 */

/*************************************************

Date: 2024-6-3

Description: String helpers for member name lookup

**************************************************/

#ifndef ENUMKIT_UTILS_STRING_HPP
#define ENUMKIT_UTILS_STRING_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace enumkit::utils {

inline constexpr std::string_view WHITESPACE = " \t\n\v\f\r";

/**
 * @brief Checks whether a character is ASCII whitespace.
 */
[[nodiscard]] constexpr auto isWhiteSpace(char c) noexcept -> bool {
    return WHITESPACE.find(c) != std::string_view::npos;
}

/**
 * @brief Checks whether a character is an ASCII decimal digit.
 */
[[nodiscard]] constexpr auto isDigit(char c) noexcept -> bool {
    return c >= '0' && c <= '9';
}

/**
 * @brief ASCII lower-case conversion of a single character.
 */
[[nodiscard]] constexpr auto toLowerAscii(char c) noexcept -> char {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

/**
 * @brief Removes leading and trailing characters found in `symbols`.
 *
 * @param line The string to trim.
 * @param symbols The characters to strip, whitespace by default.
 * @return A view into `line` without the stripped characters.
 */
[[nodiscard]] auto trim(std::string_view line,
                        std::string_view symbols = WHITESPACE) noexcept
    -> std::string_view;

/**
 * @brief Ordinal case-insensitive comparison (ASCII folding).
 */
[[nodiscard]] auto equalsIgnoreCase(std::string_view lhs,
                                    std::string_view rhs) noexcept -> bool;

/**
 * @brief FNV-1a hash of the exact bytes of `str`.
 */
[[nodiscard]] auto ordinalHash(std::string_view str) noexcept -> std::size_t;

/**
 * @brief FNV-1a hash of `str` after ASCII lower-case folding.
 *
 * Two strings that compare equal with equalsIgnoreCase() hash equal.
 */
[[nodiscard]] auto ordinalIgnoreCaseHash(std::string_view str) noexcept
    -> std::size_t;

/**
 * @brief Joins strings with a delimiter.
 */
[[nodiscard]] auto joinStrings(const std::vector<std::string>& strings,
                               std::string_view delimiter) -> std::string;

}  // namespace enumkit::utils

#endif  // ENUMKIT_UTILS_STRING_HPP
