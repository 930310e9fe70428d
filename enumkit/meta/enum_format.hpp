/*!
 * \file enum_format.hpp
 * \brief Member string formats, validation modes and member selections
 * \author Max Qian <lightapt.com>
 * \date 2024-6-5
 * \copyright Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef ENUMKIT_META_ENUM_FORMAT_HPP
#define ENUMKIT_META_ENUM_FORMAT_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace enumkit::meta {

class EnumMemberBase;

/**
 * @brief String representations a member can be rendered in and parsed from.
 *
 * Values from CUSTOM_ENUM_FORMAT_START upward are handed out by
 * registerCustomEnumFormat().
 */
enum class EnumFormat : int {
    DecimalValue = 0,
    HexadecimalValue = 1,
    UnderlyingValue = 2,
    Name = 3,
    Description = 4,
    EnumMemberValue = 5,
    DisplayName = 6,
};

inline constexpr int CUSTOM_ENUM_FORMAT_START = 100;
inline constexpr std::size_t BUILTIN_ENUM_FORMAT_COUNT = 7;

/**
 * @brief How EnumCache::isValid() judges a value.
 */
enum class EnumValidation {
    None,
    Default,
    IsDefined,
    IsValidFlagCombination,
};

/**
 * @brief Selects and orders the members returned by the member queries.
 *
 * Distinct and Flags filter, DisplayOrder reorders; they may be combined.
 */
enum class EnumMemberSelection : unsigned {
    All = 0,
    Distinct = 1,
    Flags = 2,
    DisplayOrder = 4,
};

constexpr auto operator|(EnumMemberSelection lhs,
                         EnumMemberSelection rhs) noexcept
    -> EnumMemberSelection {
    return static_cast<EnumMemberSelection>(static_cast<unsigned>(lhs) |
                                            static_cast<unsigned>(rhs));
}

constexpr auto operator&(EnumMemberSelection lhs,
                         EnumMemberSelection rhs) noexcept
    -> EnumMemberSelection {
    return static_cast<EnumMemberSelection>(static_cast<unsigned>(lhs) &
                                            static_cast<unsigned>(rhs));
}

[[nodiscard]] constexpr auto hasSelection(EnumMemberSelection selection,
                                          EnumMemberSelection flag) noexcept
    -> bool {
    return (selection & flag) == flag;
}

using CustomEnumFormatter =
    std::function<std::optional<std::string>(const EnumMemberBase&)>;

/**
 * @brief Registers a process-wide custom format.
 *
 * @param formatter Renders a member, or returns nullopt when it has no
 * representation in this format.
 * @return The identifier of the new format.
 * @throws error::InvalidArgument if formatter is empty.
 */
auto registerCustomEnumFormat(CustomEnumFormatter formatter) -> EnumFormat;

/**
 * @brief Formatter registered for a custom format, or nullptr.
 */
[[nodiscard]] auto getCustomEnumFormatter(EnumFormat format)
    -> std::shared_ptr<const CustomEnumFormatter>;

[[nodiscard]] constexpr auto isBuiltinEnumFormat(EnumFormat format) noexcept
    -> bool {
    const auto id = static_cast<int>(format);
    return id >= 0 && id < static_cast<int>(BUILTIN_ENUM_FORMAT_COUNT);
}

[[nodiscard]] auto isValidEnumFormat(EnumFormat format) -> bool;

/**
 * @throws error::InvalidArgument for the first format that is neither
 * built-in nor registered.
 */
void validateEnumFormats(std::span<const EnumFormat> formats);

/**
 * @brief Dense index of a valid format: built-ins first, then custom formats
 * in registration order.
 */
[[nodiscard]] auto enumFormatSlot(EnumFormat format) -> std::size_t;

[[nodiscard]] auto isValidEnumValidation(EnumValidation validation) noexcept
    -> bool;

[[nodiscard]] auto isValidEnumMemberSelection(
    EnumMemberSelection selection) noexcept -> bool;

[[nodiscard]] auto toString(EnumFormat format) -> std::string;

}  // namespace enumkit::meta

#endif  // ENUMKIT_META_ENUM_FORMAT_HPP
