/*!
 * \file attributes.cpp
 * \brief Metadata attached to enumeration members
 * \author Max Qian <lightapt.com>
 * \date 2024-6-5
 * \copyright Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "enumkit/meta/attributes.hpp"

#include "enumkit/error/exception.hpp"

namespace enumkit::meta {

AttributeCollection::AttributeCollection(std::vector<AttributePtr> attributes)
    : attributes_(std::move(attributes)) {
    for (const auto& attribute : attributes_) {
        if (!attribute) {
            THROW_INVALID_ARGUMENT("attribute collection contains a null entry");
        }
    }
}

AttributeCollection::AttributeCollection(
    std::initializer_list<AttributePtr> attributes)
    : AttributeCollection(std::vector<AttributePtr>(attributes)) {}

auto AttributeCollection::description() const -> std::optional<std::string> {
    if (const auto* attribute = get<DescriptionAttribute>()) {
        return attribute->description();
    }
    return std::nullopt;
}

auto AttributeCollection::enumMemberValue() const
    -> std::optional<std::string> {
    if (const auto* attribute = get<EnumMemberAttribute>()) {
        return attribute->value();
    }
    return std::nullopt;
}

auto AttributeCollection::displayName() const -> std::optional<std::string> {
    if (const auto* attribute = get<DisplayAttribute>()) {
        return attribute->name();
    }
    return std::nullopt;
}

auto AttributeCollection::displayOrder() const -> std::optional<int> {
    if (const auto* attribute = get<DisplayAttribute>()) {
        return attribute->order();
    }
    return std::nullopt;
}

auto AttributeCollection::isPrimary() const -> bool {
    return has<PrimaryEnumMemberAttribute>();
}

auto description(std::string text) -> AttributePtr {
    return makeAttribute<DescriptionAttribute>(std::move(text));
}

auto enumMember(std::string value) -> AttributePtr {
    return makeAttribute<EnumMemberAttribute>(std::move(value));
}

auto display(std::string name, std::optional<int> order) -> AttributePtr {
    return makeAttribute<DisplayAttribute>(std::move(name), order);
}

auto primary() -> AttributePtr {
    return makeAttribute<PrimaryEnumMemberAttribute>();
}

}  // namespace enumkit::meta
