/*!
 * \file enum_bridge.hpp
 * \brief Conversions between an enumeration and its underlying cache
 * \author Max Qian <lightapt.com>
 * \date 2024-6-8
 * \copyright Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef ENUMKIT_META_ENUM_BRIDGE_HPP
#define ENUMKIT_META_ENUM_BRIDGE_HPP

#include <type_traits>

#include "enumkit/meta/enum_traits.hpp"

namespace enumkit::meta {

/**
 * @brief What a cache, which only knows the underlying type, needs from the
 * concrete enumeration.
 */
template <typename TU>
class IEnumBridge {
public:
    virtual ~IEnumBridge() = default;

    [[nodiscard]] virtual auto hasCustomValidator() const noexcept -> bool = 0;

    /**
     * @brief Runs the enumeration's own validator on an underlying value.
     */
    [[nodiscard]] virtual auto customValidate(TU value) const -> bool = 0;
};

template <ReflectedEnum E>
class EnumBridge final : public IEnumBridge<std::underlying_type_t<E>> {
public:
    using enum_type = E;
    using underlying_type = std::underlying_type_t<E>;

    static constexpr auto toEnum(underlying_type value) noexcept -> E {
        return static_cast<E>(value);
    }

    static constexpr auto toUnderlying(E value) noexcept -> underlying_type {
        return static_cast<underlying_type>(value);
    }

    [[nodiscard]] auto hasCustomValidator() const noexcept -> bool override {
        return HasCustomValidator<E>;
    }

    [[nodiscard]] auto customValidate(underlying_type value) const
        -> bool override {
        if constexpr (HasCustomValidator<E>) {
            return static_cast<bool>(EnumTraits<E>::isValid(toEnum(value)));
        } else {
            return true;
        }
    }
};

}  // namespace enumkit::meta

#endif  // ENUMKIT_META_ENUM_BRIDGE_HPP
