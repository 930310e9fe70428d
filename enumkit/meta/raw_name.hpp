/*!
 * \file raw_name.hpp
 * \brief Get raw name of an enumeration type
 * \author Max Qian <lightapt.com>
 * \date 2024-5-25
 * \copyright Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef ENUMKIT_META_RAW_NAME_HPP
#define ENUMKIT_META_RAW_NAME_HPP

#include <string_view>

#include "enumkit/macro.hpp"

namespace enumkit::meta {

namespace detail {
/**
 * @brief Extract type name from compiler-specific function signature
 * @param name Function signature string
 * @return Extracted type name
 */
constexpr std::string_view extract_type_name(std::string_view name) noexcept {
#if defined(__clang__)
    constexpr auto prefix = std::string_view("T = ");
    if (auto pos = name.find(prefix); pos != std::string_view::npos) {
        auto start = pos + prefix.size();
        auto end = name.find_last_of(']');
        if (end != std::string_view::npos && end > start) {
            return name.substr(start, end - start);
        }
    }
    return name;
#elif defined(__GNUC__)
    constexpr auto prefix = std::string_view("[with T = ");
    if (auto pos = name.find(prefix); pos != std::string_view::npos) {
        auto start = pos + prefix.size();
        auto end = name.find_first_of(";]", start);
        if (end != std::string_view::npos && end > start) {
            return name.substr(start, end - start);
        }
    }
    return name;
#elif defined(_MSC_VER)
    constexpr auto start_marker = std::string_view("raw_name_of<");
    constexpr auto end_marker = std::string_view(">(");
    if (auto start_pos = name.find(start_marker);
        start_pos != std::string_view::npos) {
        start_pos += start_marker.size();
        if (auto end_pos = name.rfind(end_marker);
            end_pos != std::string_view::npos && end_pos > start_pos) {
            auto extracted = name.substr(start_pos, end_pos - start_pos);
            if (auto space_pos = extracted.find(' ');
                space_pos != std::string_view::npos) {
                return extracted.substr(space_pos + 1);
            }
            return extracted;
        }
    }
    return name;
#endif
}

/**
 * @brief Drop the enclosing namespaces and classes of a qualified name
 */
constexpr std::string_view unqualified_name(std::string_view name) noexcept {
    if (auto pos = name.rfind("::"); pos != std::string_view::npos) {
        return name.substr(pos + 2);
    }
    return name;
}
}  // namespace detail

/**
 * @brief Get raw name of a type at compile time
 * @tparam T Type to get the name of
 * @return String view containing the qualified type name
 */
template <typename T>
constexpr std::string_view raw_name_of() noexcept {
    return detail::extract_type_name(ENUMKIT_META_FUNCTION_NAME);
}

/**
 * @brief Get the unqualified name of a type at compile time
 */
template <typename T>
constexpr std::string_view short_name_of() noexcept {
    return detail::unqualified_name(raw_name_of<T>());
}

}  // namespace enumkit::meta

#endif  // ENUMKIT_META_RAW_NAME_HPP
