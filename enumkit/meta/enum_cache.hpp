/*!
 * \file enum_cache.hpp
 * \brief Per-type enumeration metadata: validation, formatting, parsing and
 * flag algebra over the underlying type
 * \author Max Qian <lightapt.com>
 * \date 2024-6-9
 * \copyright Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef ENUMKIT_META_ENUM_CACHE_HPP
#define ENUMKIT_META_ENUM_CACHE_HPP

#include <algorithm>
#include <array>
#include <atomic>
#include <climits>
#include <concepts>
#include <cstddef>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "enumkit/algorithm/underlying_operations.hpp"
#include "enumkit/error/exception.hpp"
#include "enumkit/macro.hpp"
#include "enumkit/meta/attributes.hpp"
#include "enumkit/meta/enum_bridge.hpp"
#include "enumkit/meta/enum_format.hpp"
#include "enumkit/meta/enum_member.hpp"
#include "enumkit/meta/member_parser.hpp"
#include "enumkit/type/noncopyable.hpp"
#include "enumkit/utils/string.hpp"

namespace enumkit::meta {

inline constexpr std::string_view DEFAULT_FLAG_DELIMITER = ", ";

inline constexpr std::array<EnumFormat, 2> DEFAULT_FORMAT_ORDER{
    EnumFormat::Name, EnumFormat::UnderlyingValue};

/**
 * @brief Lazy decomposition of a flag combination into its single bits.
 *
 * Bits are produced from the lowest to the highest. A value with the sign bit
 * set is walked up to the top bit of the underlying type.
 */
template <typename TU, typename Ops>
class FlagSequence : public std::ranges::view_interface<FlagSequence<TU, Ops>> {
public:
    class iterator {
    public:
        using value_type = TU;
        using difference_type = std::ptrdiff_t;
        using iterator_concept = std::forward_iterator_tag;
        using iterator_category = std::forward_iterator_tag;

        iterator() = default;

        explicit iterator(TU value)
            : value_(value),
              isLessThanZero_(Ops::lessThan(value, Ops::ZERO)),
              current_(Ops::ONE) {
            seek();
        }

        auto operator*() const -> TU { return current_; }

        auto operator++() -> iterator& {
            current_ = Ops::leftShift(current_, 1);
            seek();
            return *this;
        }

        auto operator++(int) -> iterator {
            auto copy = *this;
            ++*this;
            return copy;
        }

        friend bool operator==(const iterator&, const iterator&) = default;

        friend auto operator==(const iterator& it, std::default_sentinel_t)
            -> bool {
            return Ops::equals(it.current_, Ops::ZERO);
        }

    private:
        void seek() {
            while (!Ops::equals(current_, Ops::ZERO)) {
                if (!isLessThanZero_ && Ops::lessThan(value_, current_)) {
                    current_ = Ops::ZERO;
                    return;
                }
                if (!Ops::equals(Ops::bitAnd(value_, current_), Ops::ZERO)) {
                    return;
                }
                current_ = Ops::leftShift(current_, 1);
            }
        }

        TU value_{};
        bool isLessThanZero_{false};
        TU current_{};
    };

    FlagSequence() = default;
    explicit FlagSequence(TU maskedValue) : value_(maskedValue) {}

    [[nodiscard]] auto begin() const -> iterator { return iterator(value_); }
    [[nodiscard]] auto end() const -> std::default_sentinel_t { return {}; }

private:
    TU value_{};
};

/**
 * @brief Metadata of one enumeration, keyed by its underlying type.
 *
 * Built once from the declared fields and immutable afterwards, except for
 * the parser indexes which are published lazily and lock-free. Members hold
 * a pointer back to their cache, so a cache is never copied or moved.
 *
 * @tparam TU The underlying integral type.
 * @tparam Ops The numeric strategy for TU.
 */
template <typename TU, typename Ops = algorithm::UnderlyingOperations<TU>>
class EnumCache : public type::NonCopyable {
    static_assert(algorithm::UnderlyingOperationsFor<Ops, TU>,
                  "Ops must provide the numeric operations for TU");

public:
    using underlying_type = TU;
    using operations = Ops;
    using member_type = EnumMemberInternal<TU, Ops>;
    using parser_type = EnumMemberParser<member_type>;
    using bridge_type = IEnumBridge<TU>;
    using member_span = std::span<const member_type* const>;
    using format_span = std::span<const EnumFormat>;

    struct Field {
        TU value;
        std::string name;
        AttributeCollection attributes;
    };

    /**
     * @param typeName Name used in diagnostics.
     * @param isFlagEnum Whether values combine as bit flags.
     * @param fields The declared members in declaration order.
     * @param bridge Optional link to the concrete enumeration.
     */
    EnumCache(std::string typeName, bool isFlagEnum, std::vector<Field> fields,
              std::unique_ptr<const bridge_type> bridge = nullptr)
        : typeName_(std::move(typeName)),
          isFlagEnum_(isFlagEnum),
          bridge_(std::move(bridge)) {
        struct Pending {
            const member_type* member;
            std::size_t declaration;
        };

        members_.reserve(fields.size());
        std::map<TU, Pending> canonical;
        std::vector<Pending> duplicates;
        for (auto& field : fields) {
            members_.push_back(std::make_unique<member_type>(
                field.value, std::move(field.name),
                std::move(field.attributes), *this));
            Pending incoming{members_.back().get(), members_.size() - 1};
            auto [iter, inserted] = canonical.try_emplace(field.value, incoming);
            if (inserted) {
                continue;
            }
            if (incoming.member->attributes().isPrimary() &&
                !iter->second.member->attributes().isPrimary()) {
                std::swap(iter->second, incoming);
            }
            duplicates.push_back(incoming);
        }

        distinct_.reserve(canonical.size());
        for (const auto& [value, pending] : canonical) {
            distinct_.push_back(pending.member);
            if (isSingleBit(value)) {
                allFlags_ = Ops::bitOr(allFlags_, value);
            }
        }

        std::stable_sort(duplicates.begin(), duplicates.end(),
                         [](const Pending& lhs, const Pending& rhs) {
                             if (!Ops::equals(lhs.member->value(),
                                              rhs.member->value())) {
                                 return Ops::lessThan(lhs.member->value(),
                                                      rhs.member->value());
                             }
                             return lhs.declaration < rhs.declaration;
                         });
        duplicates_.reserve(duplicates.size());
        for (const auto& pending : duplicates) {
            duplicates_.push_back(pending.member);
        }

        all_.reserve(members_.size());
        std::size_t next = 0;
        for (const auto* member : distinct_) {
            all_.push_back(member);
            while (next < duplicates_.size() &&
                   Ops::equals(duplicates_[next]->value(), member->value())) {
                all_.push_back(duplicates_[next++]);
            }
        }

        if (!distinct_.empty()) {
            minDefined_ = distinct_.front()->value();
            maxDefined_ = distinct_.back()->value();
            const auto gap = static_cast<TU>(distinct_.size() - 1);
            isContiguous_ = Ops::equals(Ops::subtract(maxDefined_, gap),
                                        minDefined_);
        }

        spdlog::debug(
            "Built enum cache for {}: {} distinct, {} duplicate members, "
            "contiguous {}, flag enum {}",
            typeName_, distinct_.size(), duplicates_.size(), isContiguous_,
            isFlagEnum_);
#if ENUMKIT_ENABLE_DEBUG
        for (const auto* member : all_) {
            spdlog::debug("  {} = {}", member->name(),
                          Ops::toDecimalString(member->value()));
        }
#endif
    }

    [[nodiscard]] auto typeName() const noexcept -> std::string_view {
        return typeName_;
    }
    [[nodiscard]] auto isFlagEnum() const noexcept -> bool {
        return isFlagEnum_;
    }
    [[nodiscard]] auto isContiguous() const noexcept -> bool {
        return isContiguous_;
    }
    [[nodiscard]] auto getAllFlags() const noexcept -> TU { return allFlags_; }

    // Bounds of the defined values; meaningless for an empty cache
    [[nodiscard]] auto minDefined() const noexcept -> TU { return minDefined_; }
    [[nodiscard]] auto maxDefined() const noexcept -> TU { return maxDefined_; }

    // ---------------------------------------------------------------------
    // Members
    // ---------------------------------------------------------------------

    [[nodiscard]] auto distinctMembers() const noexcept -> member_span {
        return distinct_;
    }
    [[nodiscard]] auto duplicateMembers() const noexcept -> member_span {
        return duplicates_;
    }
    // Canonical members in ascending value order, each followed by its aliases
    [[nodiscard]] auto allMembers() const noexcept -> member_span {
        return all_;
    }

    /**
     * @brief The members of a selection when no filtering or reordering is
     * needed, without allocating.
     */
    [[nodiscard]] auto membersView(EnumMemberSelection selection) const
        -> std::optional<member_span> {
        checkSelection(selection);
        if (hasSelection(selection, EnumMemberSelection::Flags) ||
            hasSelection(selection, EnumMemberSelection::DisplayOrder)) {
            return std::nullopt;
        }
        if (hasSelection(selection, EnumMemberSelection::Distinct)) {
            return member_span(distinct_);
        }
        return member_span(all_);
    }

    [[nodiscard]] auto getMemberCount(
        EnumMemberSelection selection = EnumMemberSelection::All) const
        -> std::size_t {
        checkSelection(selection);
        if (hasSelection(selection, EnumMemberSelection::Flags)) {
            return static_cast<std::size_t>(
                std::ranges::count_if(distinct_, [](const member_type* m) {
                    return isSingleBit(m->value());
                }));
        }
        if (hasSelection(selection, EnumMemberSelection::Distinct)) {
            return distinct_.size();
        }
        return all_.size();
    }

    /**
     * @throws error::InvalidArgument on unknown selection bits.
     */
    [[nodiscard]] auto getMembers(
        EnumMemberSelection selection = EnumMemberSelection::All) const
        -> std::vector<const member_type*> {
        checkSelection(selection);
        std::vector<const member_type*> result;
        if (hasSelection(selection, EnumMemberSelection::Flags)) {
            std::ranges::copy_if(distinct_, std::back_inserter(result),
                                 [](const member_type* m) {
                                     return isSingleBit(m->value());
                                 });
        } else if (hasSelection(selection, EnumMemberSelection::Distinct)) {
            result.assign(distinct_.begin(), distinct_.end());
        } else {
            result.assign(all_.begin(), all_.end());
        }
        if (hasSelection(selection, EnumMemberSelection::DisplayOrder)) {
            std::ranges::stable_sort(result, {}, [](const member_type* m) {
                return m->attributes().displayOrder().value_or(INT_MAX);
            });
        }
        return result;
    }

    [[nodiscard]] auto getNames(
        EnumMemberSelection selection = EnumMemberSelection::All) const
        -> std::vector<std::string> {
        std::vector<std::string> names;
        for (const auto* member : getMembers(selection)) {
            names.push_back(member->name());
        }
        return names;
    }

    [[nodiscard]] auto getValues(
        EnumMemberSelection selection = EnumMemberSelection::All) const
        -> std::vector<TU> {
        std::vector<TU> values;
        for (const auto* member : getMembers(selection)) {
            values.push_back(member->value());
        }
        return values;
    }

    /**
     * @brief Canonical member of a value, or nullptr if it is not defined.
     */
    [[nodiscard]] auto getMember(TU value) const -> const member_type* {
        if (distinct_.empty()) {
            return nullptr;
        }
        if (isContiguous_) {
            if (!Ops::inRange(value, minDefined_, maxDefined_)) {
                return nullptr;
            }
            const auto index = static_cast<std::size_t>(
                static_cast<std::make_unsigned_t<TU>>(
                    Ops::subtract(value, minDefined_)));
            return distinct_[index];
        }
        auto iter = std::ranges::lower_bound(
            distinct_, value,
            [](TU lhs, TU rhs) { return Ops::lessThan(lhs, rhs); },
            [](const member_type* m) { return m->value(); });
        if (iter != distinct_.end() && Ops::equals((*iter)->value(), value)) {
            return *iter;
        }
        return nullptr;
    }

    /**
     * @brief Member with the given name, aliases included.
     */
    [[nodiscard]] auto getMember(std::string_view name,
                                 bool ignoreCase = false) const
        -> const member_type* {
        return parserFor(EnumFormat::Name)->tryParse(name, ignoreCase);
    }

    [[nodiscard]] auto getName(TU value) const
        -> std::optional<std::string_view> {
        if (const auto* member = getMember(value)) {
            return std::string_view(member->name());
        }
        return std::nullopt;
    }

    [[nodiscard]] auto getAttributes(TU value) const
        -> const AttributeCollection* {
        if (const auto* member = getMember(value)) {
            return &member->attributes();
        }
        return nullptr;
    }

    // ---------------------------------------------------------------------
    // Validation
    // ---------------------------------------------------------------------

    [[nodiscard]] auto isDefined(TU value) const -> bool {
        if (isContiguous_) {
            return Ops::inRange(value, minDefined_, maxDefined_);
        }
        return getMember(value) != nullptr;
    }

    [[nodiscard]] auto isValidFlagCombination(TU value) const -> bool {
        return Ops::equals(Ops::bitAnd(allFlags_, value), value);
    }

    /**
     * @throws error::InvalidArgument for an unknown validation mode.
     */
    [[nodiscard]] auto isValid(
        TU value, EnumValidation validation = EnumValidation::Default) const
        -> bool {
        switch (validation) {
            case EnumValidation::None:
                return true;
            case EnumValidation::Default:
                if (bridge_ && bridge_->hasCustomValidator()) {
                    return bridge_->customValidate(value);
                }
                if (isFlagEnum_) {
                    return isDefined(value) || isValidFlagCombination(value);
                }
                return isDefined(value);
            case EnumValidation::IsDefined:
                return isDefined(value);
            case EnumValidation::IsValidFlagCombination:
                return isValidFlagCombination(value);
        }
        THROW_INVALID_ARGUMENT("{} is not a valid enum validation mode",
                               static_cast<int>(validation));
    }

    /**
     * @brief Returns value if it is valid under the default validation.
     * @throws error::InvalidArgument otherwise.
     */
    auto validate(TU value, std::string_view paramName = "value") const -> TU {
        if (!isValid(value)) {
            THROW_INVALID_ARGUMENT("invalid value of {} for {} ({})",
                                   asString(value), typeName_, paramName);
        }
        return value;
    }

    /**
     * @brief Converts an integer of any width to the underlying type.
     * @throws error::Overflow if it is out of range.
     * @throws error::InvalidArgument if it fails the requested validation.
     */
    template <std::integral Int>
        requires(!std::same_as<Int, bool>)
    auto toObject(Int value,
                  EnumValidation validation = EnumValidation::None) const
        -> TU {
        auto result = Ops::create(widen(value));
        if (validation != EnumValidation::None && !isValid(result, validation)) {
            THROW_INVALID_ARGUMENT("invalid value of {} for {}",
                                   asString(result), typeName_);
        }
        return result;
    }

    template <std::integral Int>
        requires(!std::same_as<Int, bool>)
    auto tryToObject(Int value,
                     EnumValidation validation = EnumValidation::None) const
        -> std::optional<TU> {
        const auto wide = widen(value);
        if (!Ops::isInValueRange(wide)) {
            return std::nullopt;
        }
        auto result = Ops::create(wide);
        if (!isValid(result, validation)) {
            return std::nullopt;
        }
        return result;
    }

    // ---------------------------------------------------------------------
    // Formatting
    // ---------------------------------------------------------------------

    /**
     * @brief Name of the value, its flags for a flag enumeration, or its
     * decimal value.
     */
    [[nodiscard]] auto asString(TU value) const -> std::string {
        if (isFlagEnum_) {
            if (auto flags = formatFlags(value)) {
                return *std::move(flags);
            }
        }
        return formatInternal(value, getMember(value), DEFAULT_FORMAT_ORDER)
            .value_or(Ops::toDecimalString(value));
    }

    /**
     * @brief Formats with a short code; an empty code is "G".
     * @throws error::InvalidFormat for an unknown code.
     */
    [[nodiscard]] auto asString(TU value, std::string_view code) const
        -> std::string {
        if (code.empty()) {
            return asString(value);
        }
        return format(value, code);
    }

    [[nodiscard]] auto asString(TU value, EnumFormat format) const
        -> std::optional<std::string> {
        return this->format(value, format);
    }

    /**
     * @brief First non-null rendering in the given formats; an empty list
     * behaves like asString(value).
     */
    [[nodiscard]] auto asString(TU value, format_span formats) const
        -> std::optional<std::string> {
        if (formats.empty()) {
            return asString(value);
        }
        validateEnumFormats(formats);
        return formatInternal(value, getMember(value), formats);
    }

    /**
     * @brief Formats with "G", "F", "D" or "X", in either case.
     *
     * G is asString(value), F always decomposes valid flag combinations,
     * D is the decimal value and X the zero-padded hexadecimal value.
     *
     * @throws error::InvalidFormat for any other code.
     */
    [[nodiscard]] auto format(TU value, std::string_view code) const
        -> std::string {
        if (code.size() == 1) {
            switch (code.front()) {
                case 'G':
                case 'g':
                    return asString(value);
                case 'F':
                case 'f':
                    return formatFlags(value).value_or(
                        Ops::toDecimalString(value));
                case 'D':
                case 'd':
                    return Ops::toDecimalString(value);
                case 'X':
                case 'x':
                    return Ops::toHexString(value);
                default:
                    break;
            }
        }
        THROW_INVALID_FORMAT(
            "format string can be only \"G\", \"g\", \"X\", \"x\", \"F\", "
            "\"f\", \"D\" or \"d\"");
    }

    [[nodiscard]] auto format(TU value, EnumFormat format) const
        -> std::optional<std::string> {
        const std::array<EnumFormat, 1> formats{format};
        validateEnumFormats(formats);
        return formatInternal(value, getMember(value), formats);
    }

    /**
     * @throws error::InvalidArgument if formats is empty or holds an invalid
     * format.
     */
    [[nodiscard]] auto format(TU value, format_span formats) const
        -> std::optional<std::string> {
        if (formats.empty()) {
            THROW_INVALID_ARGUMENT("format order must not be empty");
        }
        validateEnumFormats(formats);
        return formatInternal(value, getMember(value), formats);
    }

    /**
     * @brief Formats a flag combination as its single flags joined by a
     * delimiter.
     *
     * Defined values, zero and invalid combinations are formatted as a
     * single value instead.
     *
     * @param delimiter Inserted between flags, ", " when absent.
     * @param formats Format order for each flag; empty means Name then
     * UnderlyingValue.
     * @throws error::InvalidArgument if delimiter is present but empty.
     */
    [[nodiscard]] auto formatFlags(
        TU value, std::optional<std::string_view> delimiter = std::nullopt,
        format_span formats = {}) const -> std::optional<std::string> {
        const auto order = resolveFormats(formats);
        const auto separator = delimiter.value_or(DEFAULT_FLAG_DELIMITER);
        if (separator.empty()) {
            THROW_INVALID_ARGUMENT("delimiter must not be empty");
        }
        const auto* member = getMember(value);
        if (member != nullptr || Ops::equals(value, Ops::ZERO) ||
            !isValidFlagCombination(value)) {
            return formatInternal(value, member, order);
        }
        std::vector<std::string> parts;
        for (auto flag : getFlags(value)) {
            parts.push_back(
                formatInternal(flag, getMember(flag), order).value_or(""));
        }
        return utils::joinStrings(parts, separator);
    }

    // ---------------------------------------------------------------------
    // Flag algebra
    // ---------------------------------------------------------------------

    [[nodiscard]] auto hasAnyFlags(TU value) const -> bool {
        return !Ops::equals(value, Ops::ZERO);
    }

    [[nodiscard]] auto hasAnyFlags(TU value, TU mask) const -> bool {
        return !Ops::equals(Ops::bitAnd(value, mask), Ops::ZERO);
    }

    [[nodiscard]] auto hasAllFlags(TU value) const -> bool {
        return hasAllFlags(value, allFlags_);
    }

    [[nodiscard]] auto hasAllFlags(TU value, TU mask) const -> bool {
        return Ops::equals(Ops::bitAnd(value, mask), mask);
    }

    [[nodiscard]] auto toggleFlags(TU value) const -> TU {
        return Ops::bitXor(value, allFlags_);
    }

    [[nodiscard]] auto toggleFlags(TU value, TU mask) const -> TU {
        return Ops::bitXor(value, mask);
    }

    [[nodiscard]] auto commonFlags(TU value, TU mask) const -> TU {
        return Ops::bitAnd(value, mask);
    }

    [[nodiscard]] auto combineFlags(TU value, TU mask) const -> TU {
        return Ops::bitOr(value, mask);
    }

    [[nodiscard]] auto combineFlags(std::span<const TU> flags) const -> TU {
        auto result = Ops::ZERO;
        for (auto flag : flags) {
            result = Ops::bitOr(result, flag);
        }
        return result;
    }

    [[nodiscard]] auto removeFlags(TU value, TU mask) const -> TU {
        return Ops::bitAnd(value, Ops::bitNot(mask));
    }

    /**
     * @brief The defined single-bit flags of value, lowest first.
     */
    [[nodiscard]] auto getFlags(TU value) const -> FlagSequence<TU, Ops> {
        return FlagSequence<TU, Ops>(Ops::bitAnd(value, allFlags_));
    }

    [[nodiscard]] auto getFlagMembers(TU value) const
        -> std::vector<const member_type*> {
        std::vector<const member_type*> members;
        for (auto flag : getFlags(value)) {
            members.push_back(getMember(flag));
        }
        return members;
    }

    [[nodiscard]] auto getFlagCount() const -> int {
        return Ops::bitCount(allFlags_);
    }

    [[nodiscard]] auto getFlagCount(TU value) const -> int {
        return Ops::bitCount(Ops::bitAnd(value, allFlags_));
    }

    [[nodiscard]] auto getFlagCount(TU value, TU mask) const -> int {
        return Ops::bitCount(
            Ops::bitAnd(Ops::bitAnd(value, mask), allFlags_));
    }

    // ---------------------------------------------------------------------
    // Parsing
    // ---------------------------------------------------------------------

    /**
     * @brief Parses a member representation in the given format order.
     *
     * Flag enumerations are always parsed as flag combinations.
     *
     * @throws error::Overflow if numeric text is out of range.
     * @throws error::ParserError if the text matches nothing.
     * @throws error::InvalidArgument if formats holds an invalid format.
     */
    [[nodiscard]] auto parse(std::string_view text, bool ignoreCase = false,
                             format_span formats = {}) const -> TU {
        if (isFlagEnum_) {
            return parseFlags(text, ignoreCase, std::nullopt, formats);
        }
        const auto order = resolveFormats(formats);
        const auto trimmed = utils::trim(text);
        if (auto result = tryParseInternal(trimmed, ignoreCase, order)) {
            return result->value;
        }
        throwParseFailure(trimmed, false);
    }

    [[nodiscard]] auto tryParse(std::string_view text, bool ignoreCase = false,
                                format_span formats = {}) const
        -> std::optional<TU> {
        if (isFlagEnum_) {
            return tryParseFlags(text, ignoreCase, std::nullopt, formats);
        }
        const auto order = resolveFormats(formats);
        if (auto result =
                tryParseInternal(utils::trim(text), ignoreCase, order)) {
            return result->value;
        }
        return std::nullopt;
    }

    /**
     * @brief Parses one member representation, never as a flag combination.
     *
     * @return The member, or nullptr when the text is a number that is in
     * range but not defined.
     * @throws error::Overflow if numeric text is out of range.
     * @throws error::ParserError if the text matches nothing.
     */
    [[nodiscard]] auto parseMember(std::string_view text,
                                   bool ignoreCase = false,
                                   format_span formats = {}) const
        -> const member_type* {
        const auto order = resolveFormats(formats);
        const auto trimmed = utils::trim(text);
        if (auto result = tryParseInternal(trimmed, ignoreCase, order)) {
            return result->member ? result->member : getMember(result->value);
        }
        throwParseFailure(trimmed, false);
    }

    [[nodiscard]] auto tryParseMember(std::string_view text,
                                      bool ignoreCase = false,
                                      format_span formats = {}) const
        -> const member_type* {
        const auto order = resolveFormats(formats);
        if (auto result =
                tryParseInternal(utils::trim(text), ignoreCase, order)) {
            return result->member ? result->member : getMember(result->value);
        }
        return nullptr;
    }

    /**
     * @brief Parses delimited flags and combines them.
     *
     * Whitespace around each flag is ignored and empty text is zero. The
     * delimiter is matched trimmed unless it is all whitespace.
     *
     * @throws error::Overflow if a numeric flag is out of range.
     * @throws error::ParserError if a flag matches nothing.
     * @throws error::InvalidArgument if delimiter is present but empty.
     */
    [[nodiscard]] auto parseFlags(
        std::string_view text, bool ignoreCase = false,
        std::optional<std::string_view> delimiter = std::nullopt,
        format_span formats = {}) const -> TU {
        std::string_view failed;
        if (auto result =
                parseFlagsInternal(text, ignoreCase, delimiter, formats,
                                   failed)) {
            return *result;
        }
        throwParseFailure(failed, true);
    }

    [[nodiscard]] auto tryParseFlags(
        std::string_view text, bool ignoreCase = false,
        std::optional<std::string_view> delimiter = std::nullopt,
        format_span formats = {}) const -> std::optional<TU> {
        std::string_view failed;
        return parseFlagsInternal(text, ignoreCase, delimiter, formats,
                                  failed);
    }

    /**
     * @brief Parser index of a format, built on first use.
     *
     * Concurrent first uses may each build an index; only the first one
     * published is kept.
     *
     * @throws error::InvalidArgument if the format is not valid.
     */
    [[nodiscard]] auto parserFor(EnumFormat format) const
        -> std::shared_ptr<const parser_type> {
        const auto slot = enumFormatSlot(format);
        auto current = parsers_.load(std::memory_order_acquire);
        if (current && slot < current->size() && (*current)[slot]) {
            return (*current)[slot];
        }

        std::shared_ptr<const parser_type> built =
            std::make_shared<parser_type>(format, member_span(all_));
        while (true) {
            auto next = std::make_shared<ParserList>(
                current ? *current : ParserList{});
            if (next->size() <= slot) {
                next->resize(slot + 1);
            }
            if ((*next)[slot]) {
                spdlog::trace("Discarded duplicate parser index for {}",
                              typeName_);
                return (*next)[slot];
            }
            (*next)[slot] = built;
            std::shared_ptr<const ParserList> desired = std::move(next);
            if (parsers_.compare_exchange_weak(current, desired,
                                               std::memory_order_acq_rel,
                                               std::memory_order_acquire)) {
                return built;
            }
        }
    }

private:
    using ParserList = std::vector<std::shared_ptr<const parser_type>>;

    struct ParseResult {
        TU value;
        const member_type* member;
    };

    static auto isSingleBit(TU value) -> bool {
        return !Ops::equals(value, Ops::ZERO) &&
               Ops::equals(Ops::bitAnd(value, Ops::subtract(value, Ops::ONE)),
                           Ops::ZERO);
    }

    template <std::integral Int>
    static auto widen(Int value) {
        if constexpr (std::is_signed_v<Int>) {
            return static_cast<algorithm::i64>(value);
        } else {
            return static_cast<algorithm::u64>(value);
        }
    }

    static void checkSelection(EnumMemberSelection selection) {
        if (!isValidEnumMemberSelection(selection)) {
            THROW_INVALID_ARGUMENT("{} is not a valid enum member selection",
                                   static_cast<unsigned>(selection));
        }
    }

    static auto resolveFormats(format_span formats) -> format_span {
        if (formats.empty()) {
            return DEFAULT_FORMAT_ORDER;
        }
        validateEnumFormats(formats);
        return formats;
    }

    static auto isNumeric(std::string_view text) -> bool {
        return !text.empty() &&
               (utils::isDigit(text.front()) || text.front() == '-' ||
                text.front() == '+');
    }

    [[noreturn]] void throwParseFailure(std::string_view text,
                                        bool flags) const {
        if (isNumeric(text)) {
            THROW_OVERFLOW("value is outside the underlying type's value range");
        }
        if (flags) {
            THROW_PARSER_ERROR(
                "string was not recognized as a valid combination of {} flags",
                typeName_);
        }
        THROW_PARSER_ERROR("string was not recognized as being a member of {}",
                           typeName_);
    }

    auto formatInternal(TU value, const member_type* member,
                        format_span formats) const
        -> std::optional<std::string> {
        for (auto format : formats) {
            std::optional<std::string> result;
            switch (format) {
                case EnumFormat::DecimalValue:
                case EnumFormat::UnderlyingValue:
                    result = Ops::toDecimalString(value);
                    break;
                case EnumFormat::HexadecimalValue:
                    result = Ops::toHexString(value);
                    break;
                default:
                    if (member != nullptr) {
                        result = member->asString(format);
                    }
                    break;
            }
            if (result) {
                return result;
            }
        }
        return std::nullopt;
    }

    auto tryParseInternal(std::string_view text, bool ignoreCase,
                          format_span formats) const
        -> std::optional<ParseResult> {
        for (auto format : formats) {
            std::optional<TU> number;
            switch (format) {
                case EnumFormat::UnderlyingValue:
                    number = Ops::tryParseNative(text);
                    break;
                case EnumFormat::DecimalValue:
                    number =
                        Ops::tryParseNumber(text, algorithm::NumberStyle::Decimal);
                    break;
                case EnumFormat::HexadecimalValue:
                    number = Ops::tryParseNumber(
                        text, algorithm::NumberStyle::Hexadecimal);
                    break;
                default:
                    if (const auto* member =
                            parserFor(format)->tryParse(text, ignoreCase)) {
                        return ParseResult{member->value(), member};
                    }
                    continue;
            }
            if (number) {
                return ParseResult{*number, nullptr};
            }
        }
        return std::nullopt;
    }

    auto parseFlagsInternal(std::string_view text, bool ignoreCase,
                            std::optional<std::string_view> delimiter,
                            format_span formats,
                            std::string_view& failed) const
        -> std::optional<TU> {
        const auto separator = delimiter.value_or(DEFAULT_FLAG_DELIMITER);
        if (separator.empty()) {
            THROW_INVALID_ARGUMENT("delimiter must not be empty");
        }
        auto effective = utils::trim(separator);
        if (effective.empty()) {
            effective = separator;
        }
        const auto order = resolveFormats(formats);

        text = utils::trim(text);
        auto result = Ops::ZERO;
        std::size_t start = 0;
        while (start < text.size()) {
            while (start < text.size() && utils::isWhiteSpace(text[start])) {
                ++start;
            }
            auto end = text.find(effective, start);
            if (end == std::string_view::npos) {
                end = text.size();
            }
            const auto nextStart = end + effective.size();
            while (end > start && utils::isWhiteSpace(text[end - 1])) {
                --end;
            }
            const auto token = text.substr(start, end - start);
            auto parsed = tryParseInternal(token, ignoreCase, order);
            if (!parsed) {
                failed = token;
                return std::nullopt;
            }
            result = Ops::bitOr(result, parsed->value);
            start = nextStart;
        }
        return result;
    }

    std::string typeName_;
    bool isFlagEnum_;
    std::unique_ptr<const bridge_type> bridge_;

    std::vector<std::unique_ptr<member_type>> members_;
    std::vector<const member_type*> distinct_;
    std::vector<const member_type*> duplicates_;
    std::vector<const member_type*> all_;

    TU allFlags_ = Ops::ZERO;
    TU minDefined_ = Ops::ZERO;
    TU maxDefined_ = Ops::ZERO;
    bool isContiguous_ = false;

    mutable std::atomic<std::shared_ptr<const ParserList>> parsers_;
};

}  // namespace enumkit::meta

#endif  // ENUMKIT_META_ENUM_CACHE_HPP
