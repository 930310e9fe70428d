/*!
 * \file enum_registry.hpp
 * \brief Process-wide registry of enumerations addressed by type token
 * \author Max Qian <lightapt.com>
 * \date 2024-6-10
 * \copyright Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef ENUMKIT_META_ENUM_REGISTRY_HPP
#define ENUMKIT_META_ENUM_REGISTRY_HPP

#include <any>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include "enumkit/meta/enum_format.hpp"
#include "enumkit/meta/enum_member.hpp"
#include "enumkit/type/noncopyable.hpp"

namespace enumkit::meta {

/**
 * @brief Operations on an enumeration whose type is only known at runtime.
 *
 * Values are boxed in std::any holding the concrete enumeration type.
 * Passing a box of another type throws error::InvalidArgument.
 */
class NonGenericEnumInfo {
public:
    virtual ~NonGenericEnumInfo() = default;

    [[nodiscard]] virtual auto typeName() const -> std::string_view = 0;
    [[nodiscard]] virtual auto typeIndex() const -> std::type_index = 0;
    [[nodiscard]] virtual auto isFlagEnum() const -> bool = 0;

    [[nodiscard]] virtual auto getMemberCount(
        EnumMemberSelection selection) const -> std::size_t = 0;
    [[nodiscard]] virtual auto getNames(EnumMemberSelection selection) const
        -> std::vector<std::string> = 0;
    [[nodiscard]] virtual auto getValues(EnumMemberSelection selection) const
        -> std::vector<std::any> = 0;

    [[nodiscard]] virtual auto getMember(const std::any& value) const
        -> const EnumMemberBase* = 0;
    [[nodiscard]] virtual auto getMember(std::string_view name,
                                         bool ignoreCase) const
        -> const EnumMemberBase* = 0;

    // Boxed underlying value of a boxed enumeration value
    [[nodiscard]] virtual auto getUnderlyingValue(const std::any& value) const
        -> std::any = 0;

    [[nodiscard]] virtual auto toObject(std::int64_t value,
                                        EnumValidation validation) const
        -> std::any = 0;
    [[nodiscard]] virtual auto toObject(std::uint64_t value,
                                        EnumValidation validation) const
        -> std::any = 0;

    [[nodiscard]] virtual auto isDefined(const std::any& value) const
        -> bool = 0;
    [[nodiscard]] virtual auto isValid(const std::any& value,
                                       EnumValidation validation) const
        -> bool = 0;

    [[nodiscard]] virtual auto asString(const std::any& value) const
        -> std::string = 0;
    [[nodiscard]] virtual auto asString(const std::any& value,
                                        std::string_view code) const
        -> std::string = 0;
    [[nodiscard]] virtual auto format(const std::any& value,
                                      std::span<const EnumFormat> formats) const
        -> std::optional<std::string> = 0;

    [[nodiscard]] virtual auto parse(std::string_view text, bool ignoreCase,
                                     std::span<const EnumFormat> formats) const
        -> std::any = 0;
    [[nodiscard]] virtual auto tryParse(std::string_view text, bool ignoreCase,
                                        std::span<const EnumFormat> formats)
        const -> std::optional<std::any> = 0;

    [[nodiscard]] virtual auto getFlags(const std::any& value) const
        -> std::vector<std::any> = 0;
    [[nodiscard]] virtual auto combineFlags(const std::any& value,
                                            const std::any& mask) const
        -> std::any = 0;
    [[nodiscard]] virtual auto formatFlags(
        const std::any& value, std::optional<std::string_view> delimiter,
        std::span<const EnumFormat> formats) const
        -> std::optional<std::string> = 0;
    [[nodiscard]] virtual auto parseFlags(
        std::string_view text, bool ignoreCase,
        std::optional<std::string_view> delimiter,
        std::span<const EnumFormat> formats) const -> std::any = 0;
};

using NonGenericEnumInfoPtr = std::shared_ptr<const NonGenericEnumInfo>;

/**
 * @brief Thread-safe map from enumeration type to its non-generic info.
 */
class EnumRegistry : public type::NonCopyable {
public:
    static auto getInstance() -> EnumRegistry&;

    /**
     * @brief Get or insert.
     *
     * The factory runs outside the lock and may run more than once under a
     * race; the first inserted info is kept and returned to every caller.
     */
    auto getOrAdd(std::type_index type,
                  const std::function<NonGenericEnumInfoPtr()>& factory)
        -> NonGenericEnumInfoPtr;

    /**
     * @throws error::InvalidArgument if the type was never registered.
     */
    [[nodiscard]] auto get(std::type_index type) const -> NonGenericEnumInfoPtr;

    [[nodiscard]] auto find(std::type_index type) const
        -> NonGenericEnumInfoPtr;

    [[nodiscard]] auto contains(std::type_index type) const -> bool;
    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto typeNames() const -> std::vector<std::string>;

private:
    EnumRegistry() = default;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::type_index, NonGenericEnumInfoPtr> infos_;
};

/**
 * @brief Info of the enumeration boxed in value.
 * @throws error::InvalidArgument if value is empty or its type is not
 * registered.
 */
[[nodiscard]] auto getEnumInfo(const std::any& value) -> NonGenericEnumInfoPtr;

[[nodiscard]] auto getEnumInfo(std::type_index type) -> NonGenericEnumInfoPtr;

}  // namespace enumkit::meta

#endif  // ENUMKIT_META_ENUM_REGISTRY_HPP
