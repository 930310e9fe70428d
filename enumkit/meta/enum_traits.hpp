/*!
 * \file enum_traits.hpp
 * \brief Compile-time member tables describing an enumeration
 * \author Max Qian <lightapt.com>
 * \date 2024-6-8
 * \copyright Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef ENUMKIT_META_ENUM_TRAITS_HPP
#define ENUMKIT_META_ENUM_TRAITS_HPP

#include <concepts>
#include <initializer_list>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "enumkit/error/exception.hpp"
#include "enumkit/meta/attributes.hpp"
#include "enumkit/meta/raw_name.hpp"
#include "enumkit/utils/string.hpp"

namespace enumkit::meta {

template <typename T>
concept EnumerationType = std::is_enum_v<T>;

/**
 * @brief One declared member: its value, its name and its attributes.
 */
template <EnumerationType E>
struct EnumField {
    E value;
    std::string name;
    AttributeCollection attributes;
};

/**
 * @brief Describes the members of E. Must be specialized for every
 * enumeration used with enumkit.
 *
 * A specialization provides
 *   - `static auto fields()`, a range of EnumField<E> in declaration order;
 *   - optionally `static constexpr bool is_flags`;
 *   - optionally `static constexpr std::string_view type_name`;
 *   - optionally `static bool isValid(E)`, a custom validator.
 */
template <typename E>
struct EnumTraits;

template <typename E>
concept ReflectedEnum = EnumerationType<E> && requires {
    { EnumTraits<E>::fields() };
};

template <typename E>
concept HasCustomValidator = ReflectedEnum<E> && requires(E value) {
    { EnumTraits<E>::isValid(value) } -> std::convertible_to<bool>;
};

template <ReflectedEnum E>
[[nodiscard]] constexpr auto isFlagEnum() noexcept -> bool {
    if constexpr (requires { EnumTraits<E>::is_flags; }) {
        return static_cast<bool>(EnumTraits<E>::is_flags);
    } else {
        return false;
    }
}

template <ReflectedEnum E>
[[nodiscard]] constexpr auto enumTypeName() noexcept -> std::string_view {
    if constexpr (requires { EnumTraits<E>::type_name; }) {
        return EnumTraits<E>::type_name;
    } else {
        return short_name_of<E>();
    }
}

namespace detail {
/**
 * @brief Pairs enumerator values with the names of a stringized list.
 *
 * @param values The enumerators.
 * @param names "A, B, C", as produced by stringizing the enumerator list.
 * @throws error::InvalidArgument if the counts differ.
 */
template <EnumerationType E>
auto makeFields(std::initializer_list<E> values, std::string_view names)
    -> std::vector<EnumField<E>> {
    std::vector<EnumField<E>> fields;
    fields.reserve(values.size());
    auto value = values.begin();
    while (!names.empty()) {
        auto comma = names.find(',');
        auto name = utils::trim(names.substr(0, comma));
        names = comma == std::string_view::npos ? std::string_view{}
                                                : names.substr(comma + 1);
        if (name.empty()) {
            continue;
        }
        if (value == values.end()) {
            THROW_INVALID_ARGUMENT("more enumerator names than values");
        }
        fields.push_back(EnumField<E>{*value++, std::string(name), {}});
    }
    if (value != values.end()) {
        THROW_INVALID_ARGUMENT("more enumerator values than names");
    }
    return fields;
}
}  // namespace detail

}  // namespace enumkit::meta

/**
 * @brief Field table of plain enumerators: ENUMKIT_ENUM_FIELDS(Color, Red,
 * Green, Blue).
 */
#define ENUMKIT_ENUM_FIELDS(E, ...)                                    \
    [] {                                                               \
        using enum E;                                                  \
        return ::enumkit::meta::detail::makeFields<E>({__VA_ARGS__},   \
                                                      #__VA_ARGS__);   \
    }()

/**
 * @brief One field with attributes: ENUMKIT_FIELD(Color, Red,
 * enumkit::meta::description("red")).
 */
#define ENUMKIT_FIELD(E, Name, ...)            \
    ::enumkit::meta::EnumField<E> {            \
        E::Name, #Name,                        \
            ::enumkit::meta::AttributeCollection { __VA_ARGS__ } \
    }

/**
 * @brief Specializes EnumTraits for E. Use at global namespace scope.
 */
#define ENUMKIT_ENUM_TRAITS(E, IsFlags, ...)                           \
    template <>                                                        \
    struct enumkit::meta::EnumTraits<E> {                              \
        static constexpr bool is_flags = IsFlags;                      \
        static auto fields() -> std::vector<::enumkit::meta::EnumField<E>> { \
            return ENUMKIT_ENUM_FIELDS(E, __VA_ARGS__);                \
        }                                                              \
    }

#endif  // ENUMKIT_META_ENUM_TRAITS_HPP
