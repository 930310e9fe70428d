/*!
 * \file enum_member.hpp
 * \brief Immutable record of one declared enumeration member
 * \author Max Qian <lightapt.com>
 * \date 2024-6-6
 * \copyright Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef ENUMKIT_META_ENUM_MEMBER_HPP
#define ENUMKIT_META_ENUM_MEMBER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "enumkit/error/exception.hpp"
#include "enumkit/meta/attributes.hpp"
#include "enumkit/meta/enum_format.hpp"
#include "enumkit/type/noncopyable.hpp"

namespace enumkit::meta {

/**
 * @brief Type-erased view of a member, as handed to custom formatters.
 */
class EnumMemberBase : public type::NonCopyable {
public:
    virtual ~EnumMemberBase() = default;

    [[nodiscard]] auto name() const noexcept -> const std::string& {
        return name_;
    }

    [[nodiscard]] auto attributes() const noexcept
        -> const AttributeCollection& {
        return attributes_;
    }

    [[nodiscard]] virtual auto enumTypeName() const -> std::string_view = 0;
    [[nodiscard]] virtual auto toDecimalString() const -> std::string = 0;
    [[nodiscard]] virtual auto toHexString() const -> std::string = 0;

    /**
     * @brief Renders the member in one format.
     *
     * @return nullopt when the member has no representation in the format,
     * e.g. Description on a member without a DescriptionAttribute.
     * @throws error::InvalidArgument if the format is not valid.
     */
    [[nodiscard]] auto asString(EnumFormat format) const
        -> std::optional<std::string> {
        switch (format) {
            case EnumFormat::DecimalValue:
            case EnumFormat::UnderlyingValue:
                return toDecimalString();
            case EnumFormat::HexadecimalValue:
                return toHexString();
            case EnumFormat::Name:
                return name_;
            case EnumFormat::Description:
                return attributes_.description();
            case EnumFormat::EnumMemberValue:
                return attributes_.enumMemberValue();
            case EnumFormat::DisplayName:
                return attributes_.displayName();
        }
        auto formatter = getCustomEnumFormatter(format);
        if (!formatter) {
            THROW_INVALID_ARGUMENT("{} is not a valid enum format",
                                   static_cast<int>(format));
        }
        return (*formatter)(*this);
    }

protected:
    EnumMemberBase(std::string name, AttributeCollection attributes)
        : name_(std::move(name)), attributes_(std::move(attributes)) {}

private:
    std::string name_;
    AttributeCollection attributes_;
};

template <typename TU, typename Ops>
class EnumCache;

/**
 * @brief Member record stored by an EnumCache.
 *
 * Owned by its cache and never outlives it.
 */
template <typename TU, typename Ops>
class EnumMemberInternal final : public EnumMemberBase {
public:
    using underlying_type = TU;
    using cache_type = EnumCache<TU, Ops>;

    EnumMemberInternal(TU value, std::string name,
                       AttributeCollection attributes, const cache_type& cache)
        : EnumMemberBase(std::move(name), std::move(attributes)),
          value_(value),
          cache_(&cache) {}

    [[nodiscard]] auto value() const noexcept -> TU { return value_; }

    [[nodiscard]] auto cache() const noexcept -> const cache_type& {
        return *cache_;
    }

    [[nodiscard]] auto enumTypeName() const -> std::string_view override {
        return cache_->typeName();
    }

    [[nodiscard]] auto toDecimalString() const -> std::string override {
        return Ops::toDecimalString(value_);
    }

    [[nodiscard]] auto toHexString() const -> std::string override {
        return Ops::toHexString(value_);
    }

private:
    TU value_;
    const cache_type* cache_;
};

}  // namespace enumkit::meta

#endif  // ENUMKIT_META_ENUM_MEMBER_HPP
