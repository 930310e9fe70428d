/*!
 * \file enums.hpp
 * \brief Typed entry points for enumerations described by EnumTraits
 * \author Max Qian <lightapt.com>
 * \date 2024-6-12
 * \copyright Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef ENUMKIT_META_ENUMS_HPP
#define ENUMKIT_META_ENUMS_HPP

#include <any>
#include <atomic>
#include <compare>
#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "enumkit/error/exception.hpp"
#include "enumkit/meta/attributes.hpp"
#include "enumkit/meta/enum_bridge.hpp"
#include "enumkit/meta/enum_cache.hpp"
#include "enumkit/meta/enum_format.hpp"
#include "enumkit/meta/enum_registry.hpp"
#include "enumkit/meta/enum_traits.hpp"
#include "enumkit/type/enum_containers.hpp"

namespace enumkit::meta {

template <ReflectedEnum E>
class Enums;

namespace detail {
inline auto formatList(std::initializer_list<EnumFormat> formats)
    -> std::span<const EnumFormat> {
    return {formats.begin(), formats.size()};
}
}  // namespace detail

/**
 * @brief A declared member of E.
 *
 * A lightweight handle; the member itself lives in the cache of E. Handles
 * are equal when they name the same member, and order by value, so two
 * aliases are equivalent without being equal.
 */
template <ReflectedEnum E>
class EnumMember {
public:
    using underlying_type = std::underlying_type_t<E>;
    using cache_type = EnumCache<underlying_type>;
    using internal_type = typename cache_type::member_type;

    explicit EnumMember(const internal_type& member) : member_(&member) {}

    [[nodiscard]] auto value() const noexcept -> E {
        return EnumBridge<E>::toEnum(member_->value());
    }
    [[nodiscard]] auto underlyingValue() const noexcept -> underlying_type {
        return member_->value();
    }
    [[nodiscard]] auto name() const noexcept -> const std::string& {
        return member_->name();
    }
    [[nodiscard]] auto attributes() const noexcept
        -> const AttributeCollection& {
        return member_->attributes();
    }

    [[nodiscard]] auto asString() const -> std::string {
        return cache().asString(member_->value());
    }
    [[nodiscard]] auto asString(std::string_view code) const -> std::string {
        return cache().asString(member_->value(), code);
    }
    [[nodiscard]] auto asString(EnumFormat format) const
        -> std::optional<std::string> {
        return member_->asString(format);
    }
    [[nodiscard]] auto format(std::span<const EnumFormat> formats) const
        -> std::optional<std::string> {
        return cache().format(member_->value(), formats);
    }
    [[nodiscard]] auto format(std::initializer_list<EnumFormat> formats) const
        -> std::optional<std::string> {
        return format(detail::formatList(formats));
    }

    [[nodiscard]] auto isValidFlagCombination() const -> bool {
        return cache().isValidFlagCombination(member_->value());
    }
    [[nodiscard]] auto hasAnyFlags() const -> bool {
        return cache().hasAnyFlags(member_->value());
    }
    [[nodiscard]] auto hasAllFlags() const -> bool {
        return cache().hasAllFlags(member_->value());
    }
    [[nodiscard]] auto getFlagCount() const -> int {
        return cache().getFlagCount(member_->value());
    }
    [[nodiscard]] auto getFlags() const -> std::vector<E> {
        std::vector<E> flags;
        for (auto flag : cache().getFlags(member_->value())) {
            flags.push_back(EnumBridge<E>::toEnum(flag));
        }
        return flags;
    }
    [[nodiscard]] auto getFlagMembers() const -> std::vector<EnumMember> {
        std::vector<EnumMember> members;
        for (const auto* member : cache().getFlagMembers(member_->value())) {
            members.emplace_back(*member);
        }
        return members;
    }

    [[nodiscard]] auto internal() const noexcept -> const internal_type& {
        return *member_;
    }

    friend auto operator==(const EnumMember& lhs, const EnumMember& rhs)
        -> bool {
        return lhs.member_ == rhs.member_;
    }

    friend auto operator<=>(const EnumMember& lhs, const EnumMember& rhs)
        -> std::weak_ordering {
        if (lhs.member_->value() < rhs.member_->value()) {
            return std::weak_ordering::less;
        }
        if (rhs.member_->value() < lhs.member_->value()) {
            return std::weak_ordering::greater;
        }
        return std::weak_ordering::equivalent;
    }

private:
    [[nodiscard]] auto cache() const -> const cache_type& {
        return member_->cache();
    }

    const internal_type* member_;
};

/**
 * @brief Runtime-dispatched view of Enums<E> stored in the EnumRegistry.
 */
template <ReflectedEnum E>
class NonGenericEnumInfoImpl final : public NonGenericEnumInfo {
public:
    using underlying_type = std::underlying_type_t<E>;

    [[nodiscard]] auto typeName() const -> std::string_view override {
        return Enums<E>::typeName();
    }
    [[nodiscard]] auto typeIndex() const -> std::type_index override {
        return typeid(E);
    }
    [[nodiscard]] auto isFlagEnum() const -> bool override {
        return Enums<E>::isFlagEnum();
    }

    [[nodiscard]] auto getMemberCount(EnumMemberSelection selection) const
        -> std::size_t override {
        return Enums<E>::getMemberCount(selection);
    }
    [[nodiscard]] auto getNames(EnumMemberSelection selection) const
        -> std::vector<std::string> override {
        return Enums<E>::cache().getNames(selection);
    }
    [[nodiscard]] auto getValues(EnumMemberSelection selection) const
        -> std::vector<std::any> override {
        return box(Enums<E>::getValues(selection));
    }

    [[nodiscard]] auto getMember(const std::any& value) const
        -> const EnumMemberBase* override {
        return Enums<E>::cache().getMember(underlying(value));
    }
    [[nodiscard]] auto getMember(std::string_view name, bool ignoreCase) const
        -> const EnumMemberBase* override {
        return Enums<E>::cache().getMember(name, ignoreCase);
    }

    [[nodiscard]] auto getUnderlyingValue(const std::any& value) const
        -> std::any override {
        return underlying(value);
    }

    [[nodiscard]] auto toObject(std::int64_t value,
                                EnumValidation validation) const
        -> std::any override {
        return Enums<E>::toObject(value, validation);
    }
    [[nodiscard]] auto toObject(std::uint64_t value,
                                EnumValidation validation) const
        -> std::any override {
        return Enums<E>::toObject(value, validation);
    }

    [[nodiscard]] auto isDefined(const std::any& value) const
        -> bool override {
        return Enums<E>::isDefined(unbox(value));
    }
    [[nodiscard]] auto isValid(const std::any& value,
                               EnumValidation validation) const
        -> bool override {
        return Enums<E>::isValid(unbox(value), validation);
    }

    [[nodiscard]] auto asString(const std::any& value) const
        -> std::string override {
        return Enums<E>::asString(unbox(value));
    }
    [[nodiscard]] auto asString(const std::any& value,
                                std::string_view code) const
        -> std::string override {
        return Enums<E>::asString(unbox(value), code);
    }
    [[nodiscard]] auto format(const std::any& value,
                              std::span<const EnumFormat> formats) const
        -> std::optional<std::string> override {
        return Enums<E>::format(unbox(value), formats);
    }

    [[nodiscard]] auto parse(std::string_view text, bool ignoreCase,
                             std::span<const EnumFormat> formats) const
        -> std::any override {
        return Enums<E>::parse(text, ignoreCase, formats);
    }
    [[nodiscard]] auto tryParse(std::string_view text, bool ignoreCase,
                                std::span<const EnumFormat> formats) const
        -> std::optional<std::any> override {
        if (auto result = Enums<E>::tryParse(text, ignoreCase, formats)) {
            return std::any(*result);
        }
        return std::nullopt;
    }

    [[nodiscard]] auto getFlags(const std::any& value) const
        -> std::vector<std::any> override {
        std::vector<std::any> flags;
        for (auto flag : Enums<E>::cache().getFlags(underlying(value))) {
            flags.emplace_back(EnumBridge<E>::toEnum(flag));
        }
        return flags;
    }
    [[nodiscard]] auto combineFlags(const std::any& value,
                                    const std::any& mask) const
        -> std::any override {
        return EnumBridge<E>::toEnum(Enums<E>::cache().combineFlags(
            underlying(value), underlying(mask)));
    }
    [[nodiscard]] auto formatFlags(const std::any& value,
                                   std::optional<std::string_view> delimiter,
                                   std::span<const EnumFormat> formats) const
        -> std::optional<std::string> override {
        return Enums<E>::cache().formatFlags(underlying(value), delimiter,
                                             formats);
    }
    [[nodiscard]] auto parseFlags(std::string_view text, bool ignoreCase,
                                  std::optional<std::string_view> delimiter,
                                  std::span<const EnumFormat> formats) const
        -> std::any override {
        return EnumBridge<E>::toEnum(Enums<E>::cache().parseFlags(
            text, ignoreCase, delimiter, formats));
    }

private:
    static auto unbox(const std::any& value) -> E {
        if (const auto* typed = std::any_cast<E>(&value)) {
            return *typed;
        }
        THROW_INVALID_ARGUMENT("expected a boxed {}", Enums<E>::typeName());
    }

    static auto underlying(const std::any& value) -> underlying_type {
        return EnumBridge<E>::toUnderlying(unbox(value));
    }

    template <typename Range>
    static auto box(const Range& values) -> std::vector<std::any> {
        std::vector<std::any> boxed;
        for (auto value : values) {
            boxed.emplace_back(value);
        }
        return boxed;
    }
};

/**
 * @brief Static entry points for the enumeration E.
 *
 * The cache of E is built on first use and lives until the process exits.
 * Concurrent first uses may each build a cache; only the first one published
 * is kept. Building the cache also registers E in the EnumRegistry.
 */
template <ReflectedEnum E>
class Enums {
public:
    using underlying_type = std::underlying_type_t<E>;
    using cache_type = EnumCache<underlying_type>;
    using member_type = EnumMember<E>;
    using bridge_type = EnumBridge<E>;
    using format_span = std::span<const EnumFormat>;
    using format_list = std::initializer_list<EnumFormat>;

    [[nodiscard]] static auto cache() -> const cache_type& {
        if (const auto* existing = instance_.load(std::memory_order_acquire)) {
            return *existing;
        }
        return publish();
    }

    [[nodiscard]] static auto typeName() -> std::string_view {
        return enumTypeName<E>();
    }
    [[nodiscard]] static auto isFlagEnum() -> bool {
        return cache().isFlagEnum();
    }
    [[nodiscard]] static auto isContiguous() -> bool {
        return cache().isContiguous();
    }
    [[nodiscard]] static constexpr auto getUnderlyingValue(E value) noexcept
        -> underlying_type {
        return bridge_type::toUnderlying(value);
    }

    // Members -------------------------------------------------------------

    [[nodiscard]] static auto getMemberCount(
        EnumMemberSelection selection = EnumMemberSelection::All)
        -> std::size_t {
        return cache().getMemberCount(selection);
    }
    [[nodiscard]] static auto getMembers(
        EnumMemberSelection selection = EnumMemberSelection::All)
        -> type::MembersContainer<E> {
        return {cache(), selection};
    }
    [[nodiscard]] static auto getNames(
        EnumMemberSelection selection = EnumMemberSelection::All)
        -> type::NamesContainer<E> {
        return {cache(), selection};
    }
    /**
     * @param cached Convert every value up front, for containers that are
     * iterated repeatedly.
     */
    [[nodiscard]] static auto getValues(
        EnumMemberSelection selection = EnumMemberSelection::All,
        bool cached = false) -> type::ValuesContainer<E> {
        return {cache(), selection, cached};
    }

    [[nodiscard]] static auto getMember(E value)
        -> std::optional<member_type> {
        return wrap(cache().getMember(getUnderlyingValue(value)));
    }
    [[nodiscard]] static auto getMember(std::string_view name,
                                        bool ignoreCase = false)
        -> std::optional<member_type> {
        return wrap(cache().getMember(name, ignoreCase));
    }
    [[nodiscard]] static auto getName(E value)
        -> std::optional<std::string_view> {
        return cache().getName(getUnderlyingValue(value));
    }
    [[nodiscard]] static auto getAttributes(E value)
        -> const AttributeCollection* {
        return cache().getAttributes(getUnderlyingValue(value));
    }

    // Validation ----------------------------------------------------------

    [[nodiscard]] static auto isDefined(E value) -> bool {
        return cache().isDefined(getUnderlyingValue(value));
    }
    [[nodiscard]] static auto isValid(
        E value, EnumValidation validation = EnumValidation::Default)
        -> bool {
        return cache().isValid(getUnderlyingValue(value), validation);
    }
    static auto validate(E value, std::string_view paramName = "value") -> E {
        cache().validate(getUnderlyingValue(value), paramName);
        return value;
    }

    template <std::integral Int>
        requires(!std::same_as<Int, bool>)
    [[nodiscard]] static auto toObject(
        Int value, EnumValidation validation = EnumValidation::None) -> E {
        return bridge_type::toEnum(cache().toObject(value, validation));
    }

    template <std::integral Int>
        requires(!std::same_as<Int, bool>)
    [[nodiscard]] static auto tryToObject(
        Int value, EnumValidation validation = EnumValidation::None)
        -> std::optional<E> {
        if (auto result = cache().tryToObject(value, validation)) {
            return bridge_type::toEnum(*result);
        }
        return std::nullopt;
    }

    // Formatting ----------------------------------------------------------

    [[nodiscard]] static auto asString(E value) -> std::string {
        return cache().asString(getUnderlyingValue(value));
    }
    [[nodiscard]] static auto asString(E value, std::string_view code)
        -> std::string {
        return cache().asString(getUnderlyingValue(value), code);
    }
    [[nodiscard]] static auto asString(E value, EnumFormat format)
        -> std::optional<std::string> {
        return cache().asString(getUnderlyingValue(value), format);
    }
    [[nodiscard]] static auto asString(E value, format_span formats)
        -> std::optional<std::string> {
        return cache().asString(getUnderlyingValue(value), formats);
    }
    [[nodiscard]] static auto asString(E value, format_list formats)
        -> std::optional<std::string> {
        return asString(value, detail::formatList(formats));
    }

    [[nodiscard]] static auto format(E value, std::string_view code)
        -> std::string {
        return cache().format(getUnderlyingValue(value), code);
    }
    [[nodiscard]] static auto format(E value, EnumFormat format)
        -> std::optional<std::string> {
        return cache().format(getUnderlyingValue(value), format);
    }
    [[nodiscard]] static auto format(E value, format_span formats)
        -> std::optional<std::string> {
        return cache().format(getUnderlyingValue(value), formats);
    }
    [[nodiscard]] static auto format(E value, format_list formats)
        -> std::optional<std::string> {
        return format(value, detail::formatList(formats));
    }

    // Parsing -------------------------------------------------------------

    [[nodiscard]] static auto parse(std::string_view text,
                                    bool ignoreCase = false,
                                    format_span formats = {}) -> E {
        return bridge_type::toEnum(cache().parse(text, ignoreCase, formats));
    }
    [[nodiscard]] static auto parse(std::string_view text, bool ignoreCase,
                                    format_list formats) -> E {
        return parse(text, ignoreCase, detail::formatList(formats));
    }

    [[nodiscard]] static auto tryParse(std::string_view text,
                                       bool ignoreCase = false,
                                       format_span formats = {})
        -> std::optional<E> {
        if (auto result = cache().tryParse(text, ignoreCase, formats)) {
            return bridge_type::toEnum(*result);
        }
        return std::nullopt;
    }
    [[nodiscard]] static auto tryParse(std::string_view text, bool ignoreCase,
                                       format_list formats)
        -> std::optional<E> {
        return tryParse(text, ignoreCase, detail::formatList(formats));
    }

    /**
     * @return The member, or nullopt when the text is an in-range number
     * that names no member.
     * @throws error::Overflow, error::ParserError as parse() does.
     */
    [[nodiscard]] static auto parseMember(std::string_view text,
                                          bool ignoreCase = false,
                                          format_span formats = {})
        -> std::optional<member_type> {
        return wrap(cache().parseMember(text, ignoreCase, formats));
    }
    [[nodiscard]] static auto tryParseMember(std::string_view text,
                                             bool ignoreCase = false,
                                             format_span formats = {})
        -> std::optional<member_type> {
        return wrap(cache().tryParseMember(text, ignoreCase, formats));
    }

    /**
     * @brief Registry entry of E; adds it if needed.
     */
    static auto registerInfo() -> NonGenericEnumInfoPtr {
        return EnumRegistry::getInstance().getOrAdd(typeid(E), [] {
            return std::make_shared<NonGenericEnumInfoImpl<E>>();
        });
    }

private:
    static auto wrap(const typename cache_type::member_type* member)
        -> std::optional<member_type> {
        if (member == nullptr) {
            return std::nullopt;
        }
        return member_type(*member);
    }

    static auto buildCache() -> std::unique_ptr<const cache_type> {
        std::vector<typename cache_type::Field> fields;
        for (auto&& field : EnumTraits<E>::fields()) {
            fields.push_back(typename cache_type::Field{
                bridge_type::toUnderlying(field.value), field.name,
                field.attributes});
        }
        return std::make_unique<const cache_type>(
            std::string(enumTypeName<E>()), meta::isFlagEnum<E>(),
            std::move(fields), std::make_unique<const bridge_type>());
    }

    // The registry entry only forwards to cache(), so it is added before the
    // cache is published and is visible to everyone who sees the cache.
    static auto publish() -> const cache_type& {
        registerInfo();
        auto built = buildCache();
        const cache_type* expected = nullptr;
        if (instance_.compare_exchange_strong(expected, built.get(),
                                              std::memory_order_acq_rel,
                                              std::memory_order_acquire)) {
            // Published caches live until the process exits
            return *built.release();
        }
        spdlog::trace("Discarded duplicate enum cache for {}",
                      enumTypeName<E>());
        return *expected;
    }

    inline static std::atomic<const cache_type*> instance_{nullptr};
};

/**
 * @brief Flag operations for the enumeration E.
 *
 * Every operation is a plain bitwise transform; values are not required to
 * be valid flag combinations.
 */
template <ReflectedEnum E>
class FlagEnums {
public:
    using underlying_type = std::underlying_type_t<E>;
    using bridge_type = EnumBridge<E>;
    using member_type = EnumMember<E>;
    using format_span = std::span<const EnumFormat>;

    [[nodiscard]] static auto isFlagEnum() -> bool {
        return Enums<E>::isFlagEnum();
    }
    [[nodiscard]] static auto getAllFlags() -> E {
        return bridge_type::toEnum(cache().getAllFlags());
    }
    [[nodiscard]] static auto isValidFlagCombination(E value) -> bool {
        return cache().isValidFlagCombination(raw(value));
    }

    [[nodiscard]] static auto formatFlags(
        E value, std::optional<std::string_view> delimiter = std::nullopt,
        format_span formats = {}) -> std::optional<std::string> {
        return cache().formatFlags(raw(value), delimiter, formats);
    }
    [[nodiscard]] static auto formatFlags(
        E value, std::optional<std::string_view> delimiter,
        std::initializer_list<EnumFormat> formats)
        -> std::optional<std::string> {
        return formatFlags(value, delimiter, detail::formatList(formats));
    }

    /**
     * @brief Lazy view of the defined flags of value, lowest first.
     */
    [[nodiscard]] static auto getFlags(E value) {
        return cache().getFlags(raw(value)) |
               std::views::transform(&bridge_type::toEnum);
    }
    [[nodiscard]] static auto getFlagMembers(E value)
        -> std::vector<member_type> {
        std::vector<member_type> members;
        for (const auto* member : cache().getFlagMembers(raw(value))) {
            members.emplace_back(*member);
        }
        return members;
    }

    [[nodiscard]] static auto getFlagCount() -> int {
        return cache().getFlagCount();
    }
    [[nodiscard]] static auto getFlagCount(E value) -> int {
        return cache().getFlagCount(raw(value));
    }
    [[nodiscard]] static auto getFlagCount(E value, E mask) -> int {
        return cache().getFlagCount(raw(value), raw(mask));
    }

    [[nodiscard]] static auto hasAnyFlags(E value) -> bool {
        return cache().hasAnyFlags(raw(value));
    }
    [[nodiscard]] static auto hasAnyFlags(E value, E mask) -> bool {
        return cache().hasAnyFlags(raw(value), raw(mask));
    }
    [[nodiscard]] static auto hasAllFlags(E value) -> bool {
        return cache().hasAllFlags(raw(value));
    }
    [[nodiscard]] static auto hasAllFlags(E value, E mask) -> bool {
        return cache().hasAllFlags(raw(value), raw(mask));
    }

    [[nodiscard]] static auto toggleFlags(E value) -> E {
        return bridge_type::toEnum(cache().toggleFlags(raw(value)));
    }
    [[nodiscard]] static auto toggleFlags(E value, E mask) -> E {
        return bridge_type::toEnum(cache().toggleFlags(raw(value), raw(mask)));
    }
    [[nodiscard]] static auto commonFlags(E value, E mask) -> E {
        return bridge_type::toEnum(cache().commonFlags(raw(value), raw(mask)));
    }
    [[nodiscard]] static auto combineFlags(E value, E mask) -> E {
        return bridge_type::toEnum(
            cache().combineFlags(raw(value), raw(mask)));
    }
    template <std::same_as<E>... Rest>
    [[nodiscard]] static auto combineFlags(E first, E second, E third,
                                           Rest... rest) -> E {
        return combineFlags({first, second, third, rest...});
    }
    [[nodiscard]] static auto combineFlags(std::initializer_list<E> flags)
        -> E {
        return combineFlags(std::span<const E>(flags.begin(), flags.size()));
    }
    [[nodiscard]] static auto combineFlags(std::span<const E> flags) -> E {
        std::vector<underlying_type> values;
        values.reserve(flags.size());
        for (auto flag : flags) {
            values.push_back(raw(flag));
        }
        return bridge_type::toEnum(cache().combineFlags(values));
    }
    [[nodiscard]] static auto removeFlags(E value, E mask) -> E {
        return bridge_type::toEnum(cache().removeFlags(raw(value), raw(mask)));
    }

    [[nodiscard]] static auto parseFlags(
        std::string_view text, bool ignoreCase = false,
        std::optional<std::string_view> delimiter = std::nullopt,
        format_span formats = {}) -> E {
        return bridge_type::toEnum(
            cache().parseFlags(text, ignoreCase, delimiter, formats));
    }
    [[nodiscard]] static auto tryParseFlags(
        std::string_view text, bool ignoreCase = false,
        std::optional<std::string_view> delimiter = std::nullopt,
        format_span formats = {}) -> std::optional<E> {
        if (auto result =
                cache().tryParseFlags(text, ignoreCase, delimiter, formats)) {
            return bridge_type::toEnum(*result);
        }
        return std::nullopt;
    }

private:
    static auto cache() -> const typename Enums<E>::cache_type& {
        return Enums<E>::cache();
    }

    static constexpr auto raw(E value) noexcept -> underlying_type {
        return bridge_type::toUnderlying(value);
    }
};

/**
 * @brief Builds the cache of E now and returns its registry entry.
 */
template <ReflectedEnum E>
auto registerEnum() -> NonGenericEnumInfoPtr {
    static_cast<void>(Enums<E>::cache());
    return Enums<E>::registerInfo();
}

}  // namespace enumkit::meta

#endif  // ENUMKIT_META_ENUMS_HPP
