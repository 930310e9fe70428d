/*
 * underlying_operations.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Numeric capability set for every integral type that can back
an enumeration

**************************************************/

#ifndef ENUMKIT_ALGORITHM_UNDERLYING_OPERATIONS_HPP
#define ENUMKIT_ALGORITHM_UNDERLYING_OPERATIONS_HPP

#include <array>
#include <bit>
#include <charconv>
#include <concepts>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

#include "enumkit/error/exception.hpp"
#include "enumkit/utils/string.hpp"

namespace enumkit::algorithm {
using i8 = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using usize = std::size_t;

/**
 * @brief Styles accepted by UnderlyingOperations::tryParseNumber().
 */
enum class NumberStyle {
    Decimal,      ///< Optional leading '+' or '-', then decimal digits
    Hexadecimal,  ///< Hexadecimal digits only, no prefix and no sign
};

/**
 * @brief Integral types that may back an enumeration.
 */
template <typename T>
concept UnderlyingIntegral =
    std::integral<T> && !std::same_as<std::remove_cv_t<T>, bool>;

/**
 * @brief Stateless numeric capability table bound to one underlying type.
 *
 * Every method is static, so the enum cache is monomorphized per width and
 * nothing on the parse, format or flag paths goes through a virtual call.
 * Bitwise and arithmetic results are computed in the unsigned domain and
 * narrowed back, so they never hit signed overflow.
 */
template <UnderlyingIntegral Int>
class UnderlyingOperations {
public:
    using value_type = Int;
    using unsigned_type = std::make_unsigned_t<Int>;

    static constexpr Int ZERO = static_cast<Int>(0);
    static constexpr Int ONE = static_cast<Int>(1);
    static constexpr Int MIN = std::numeric_limits<Int>::min();
    static constexpr Int MAX = std::numeric_limits<Int>::max();

    // Number of hexadecimal digits of the zero-padded representation
    static constexpr usize HEX_DIGITS = sizeof(Int) * 2;

    static constexpr auto bitAnd(Int left, Int right) noexcept -> Int {
        return static_cast<Int>(toUnsigned(left) & toUnsigned(right));
    }

    static constexpr auto bitOr(Int left, Int right) noexcept -> Int {
        return static_cast<Int>(toUnsigned(left) | toUnsigned(right));
    }

    static constexpr auto bitXor(Int left, Int right) noexcept -> Int {
        return static_cast<Int>(toUnsigned(left) ^ toUnsigned(right));
    }

    static constexpr auto bitNot(Int value) noexcept -> Int {
        return static_cast<Int>(static_cast<unsigned_type>(~toUnsigned(value)));
    }

    static constexpr auto leftShift(Int value, int amount) noexcept -> Int {
        if (amount >= std::numeric_limits<unsigned_type>::digits) {
            return ZERO;
        }
        return static_cast<Int>(
            static_cast<unsigned_type>(toUnsigned(value) << amount));
    }

    static constexpr auto lessThan(Int left, Int right) noexcept -> bool {
        return left < right;
    }

    static constexpr auto equals(Int left, Int right) noexcept -> bool {
        return left == right;
    }

    // Wrapping subtraction
    static constexpr auto subtract(Int left, Int right) noexcept -> Int {
        return static_cast<Int>(
            static_cast<unsigned_type>(toUnsigned(left) - toUnsigned(right)));
    }

    static constexpr auto bitCount(Int value) noexcept -> int {
        return std::popcount(toUnsigned(value));
    }

    static constexpr auto inRange(Int value, Int minValue,
                                  Int maxValue) noexcept -> bool {
        return !(value < minValue || maxValue < value);
    }

    static constexpr auto isInValueRange(i64 value) noexcept -> bool {
        if constexpr (std::is_signed_v<Int>) {
            return value >= static_cast<i64>(MIN) &&
                   value <= static_cast<i64>(MAX);
        } else {
            return value >= 0 && static_cast<u64>(value) <= static_cast<u64>(MAX);
        }
    }

    static constexpr auto isInValueRange(u64 value) noexcept -> bool {
        return value <= static_cast<u64>(MAX);
    }

    /**
     * @brief Narrows a 64-bit signed value.
     * @throws error::Overflow if the value does not fit in Int.
     */
    static auto create(i64 value) -> Int {
        if (!isInValueRange(value)) {
            THROW_OVERFLOW(
                "value is outside the underlying type's value range");
        }
        return static_cast<Int>(value);
    }

    /**
     * @brief Narrows a 64-bit unsigned value.
     * @throws error::Overflow if the value does not fit in Int.
     */
    static auto create(u64 value) -> Int {
        if (!isInValueRange(value)) {
            THROW_OVERFLOW(
                "value is outside the underlying type's value range");
        }
        return static_cast<Int>(value);
    }

    static auto toDecimalString(Int value) -> std::string {
        std::array<char, std::numeric_limits<u64>::digits10 + 3> buffer{};
        const auto [ptr, ec] = std::to_chars(
            buffer.data(), buffer.data() + buffer.size(), widen(value));
        return std::string(buffer.data(), ptr);
    }

    // Upper-case, zero-padded to the full width of Int
    static auto toHexString(Int value) -> std::string {
        static constexpr std::string_view DIGITS = "0123456789ABCDEF";
        std::string result(HEX_DIGITS, '0');
        auto bits = toUnsigned(value);
        for (usize i = HEX_DIGITS; i > 0; --i) {
            result[i - 1] = DIGITS[static_cast<usize>(bits & 0xF)];
            bits = static_cast<unsigned_type>(bits >> 4);
        }
        return result;
    }

    /**
     * @brief Parses the natural textual form of the underlying type.
     *
     * Surrounding whitespace and a leading sign are accepted.
     */
    static auto tryParseNative(std::string_view text) -> std::optional<Int> {
        return tryParseNumber(utils::trim(text), NumberStyle::Decimal);
    }

    static auto tryParseNumber(std::string_view text,
                               NumberStyle style) -> std::optional<Int> {
        if (text.empty()) {
            return std::nullopt;
        }
        if (style == NumberStyle::Hexadecimal) {
            return parseHex(text);
        }
        return parseDecimal(text);
    }

private:
    static constexpr auto toUnsigned(Int value) noexcept -> unsigned_type {
        return static_cast<unsigned_type>(value);
    }

    // Character types print as numbers, not glyphs
    static constexpr auto widen(Int value) noexcept {
        if constexpr (std::is_signed_v<Int>) {
            return static_cast<i64>(value);
        } else {
            return static_cast<u64>(value);
        }
    }

    static auto parseHex(std::string_view text) -> std::optional<Int> {
        u64 bits = 0;
        const auto* first = text.data();
        const auto* last = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(first, last, bits, 16);
        if (ec != std::errc{} || ptr != last) {
            return std::nullopt;
        }
        if (bits > static_cast<u64>(std::numeric_limits<unsigned_type>::max())) {
            return std::nullopt;
        }
        return static_cast<Int>(static_cast<unsigned_type>(bits));
    }

    static auto parseDecimal(std::string_view text) -> std::optional<Int> {
        bool negative = false;
        if (text.front() == '+' || text.front() == '-') {
            negative = text.front() == '-';
            text.remove_prefix(1);
            if (text.empty() || !utils::isDigit(text.front())) {
                return std::nullopt;
            }
        }

        const auto* first = text.data();
        const auto* last = text.data() + text.size();
        if constexpr (std::is_signed_v<Int>) {
            // Parse the magnitude so that MIN stays representable
            u64 magnitude = 0;
            const auto [ptr, ec] = std::from_chars(first, last, magnitude);
            if (ec != std::errc{} || ptr != last) {
                return std::nullopt;
            }
            const auto limit =
                negative ? static_cast<u64>(MAX) + 1 : static_cast<u64>(MAX);
            if (magnitude > limit) {
                return std::nullopt;
            }
            const auto bits = negative ? (~magnitude + 1) : magnitude;
            return static_cast<Int>(static_cast<unsigned_type>(bits));
        } else {
            u64 magnitude = 0;
            const auto [ptr, ec] = std::from_chars(first, last, magnitude);
            if (ec != std::errc{} || ptr != last) {
                return std::nullopt;
            }
            // "-0" is the only negative text an unsigned type accepts
            if (negative && magnitude != 0) {
                return std::nullopt;
            }
            if (!isInValueRange(magnitude)) {
                return std::nullopt;
            }
            return static_cast<Int>(magnitude);
        }
    }
};

/**
 * @brief Requirements the enum cache places on its numeric strategy.
 */
template <typename Ops, typename T>
concept UnderlyingOperationsFor = requires(T a, T b, i64 s, u64 u,
                                           std::string_view text) {
    { Ops::ZERO } -> std::convertible_to<T>;
    { Ops::ONE } -> std::convertible_to<T>;
    { Ops::bitAnd(a, b) } -> std::same_as<T>;
    { Ops::bitOr(a, b) } -> std::same_as<T>;
    { Ops::bitXor(a, b) } -> std::same_as<T>;
    { Ops::bitNot(a) } -> std::same_as<T>;
    { Ops::leftShift(a, 1) } -> std::same_as<T>;
    { Ops::lessThan(a, b) } -> std::same_as<bool>;
    { Ops::equals(a, b) } -> std::same_as<bool>;
    { Ops::subtract(a, b) } -> std::same_as<T>;
    { Ops::bitCount(a) } -> std::same_as<int>;
    { Ops::isInValueRange(s) } -> std::same_as<bool>;
    { Ops::isInValueRange(u) } -> std::same_as<bool>;
    { Ops::create(s) } -> std::same_as<T>;
    { Ops::create(u) } -> std::same_as<T>;
    { Ops::toDecimalString(a) } -> std::same_as<std::string>;
    { Ops::toHexString(a) } -> std::same_as<std::string>;
    { Ops::tryParseNative(text) } -> std::same_as<std::optional<T>>;
    {
        Ops::tryParseNumber(text, NumberStyle::Decimal)
    } -> std::same_as<std::optional<T>>;
};

using I8Operations = UnderlyingOperations<i8>;
using I16Operations = UnderlyingOperations<i16>;
using I32Operations = UnderlyingOperations<i32>;
using I64Operations = UnderlyingOperations<i64>;
using U8Operations = UnderlyingOperations<u8>;
using U16Operations = UnderlyingOperations<u16>;
using U32Operations = UnderlyingOperations<u32>;
using U64Operations = UnderlyingOperations<u64>;

}  // namespace enumkit::algorithm

#endif  // ENUMKIT_ALGORITHM_UNDERLYING_OPERATIONS_HPP
