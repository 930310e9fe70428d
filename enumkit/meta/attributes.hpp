/*!
 * \file attributes.hpp
 * \brief Metadata attached to enumeration members
 * \author Max Qian <lightapt.com>
 * \date 2024-6-5
 * \copyright Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef ENUMKIT_META_ATTRIBUTES_HPP
#define ENUMKIT_META_ATTRIBUTES_HPP

#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace enumkit::meta {

/**
 * @brief Base class of every member attribute.
 *
 * Attributes are immutable once constructed and shared between the field
 * tables and the caches built from them.
 */
class Attribute {
public:
    virtual ~Attribute() = default;

    /**
     * @brief Short identifier of the attribute kind, used in diagnostics.
     */
    [[nodiscard]] virtual auto kind() const -> std::string_view = 0;
};

using AttributePtr = std::shared_ptr<const Attribute>;

/**
 * @brief Human readable description, rendered by EnumFormat::Description.
 */
class DescriptionAttribute final : public Attribute {
public:
    explicit DescriptionAttribute(std::string description)
        : description_(std::move(description)) {}

    [[nodiscard]] auto kind() const -> std::string_view override {
        return "Description";
    }

    [[nodiscard]] auto description() const -> const std::string& {
        return description_;
    }

private:
    std::string description_;
};

/**
 * @brief Serialized member value, rendered by EnumFormat::EnumMemberValue.
 */
class EnumMemberAttribute final : public Attribute {
public:
    explicit EnumMemberAttribute(std::string value)
        : value_(std::move(value)) {}

    [[nodiscard]] auto kind() const -> std::string_view override {
        return "EnumMember";
    }

    [[nodiscard]] auto value() const -> const std::string& { return value_; }

private:
    std::string value_;
};

/**
 * @brief Display name and optional display order.
 *
 * The name is rendered by EnumFormat::DisplayName; the order drives
 * EnumMemberSelection::DisplayOrder.
 */
class DisplayAttribute final : public Attribute {
public:
    explicit DisplayAttribute(std::string name,
                              std::optional<int> order = std::nullopt)
        : name_(std::move(name)), order_(order) {}

    [[nodiscard]] auto kind() const -> std::string_view override {
        return "Display";
    }

    [[nodiscard]] auto name() const -> const std::string& { return name_; }
    [[nodiscard]] auto order() const -> std::optional<int> { return order_; }

private:
    std::string name_;
    std::optional<int> order_;
};

/**
 * @brief Marks the member that wins when several members share a value.
 */
class PrimaryEnumMemberAttribute final : public Attribute {
public:
    [[nodiscard]] auto kind() const -> std::string_view override {
        return "PrimaryEnumMember";
    }
};

/**
 * @brief Ordered, immutable set of attributes of one member.
 */
class AttributeCollection {
public:
    AttributeCollection() = default;
    explicit AttributeCollection(std::vector<AttributePtr> attributes);
    AttributeCollection(std::initializer_list<AttributePtr> attributes);

    /**
     * @brief First attribute of type T, or nullptr.
     */
    template <typename T>
    [[nodiscard]] auto get() const -> const T* {
        for (const auto& attribute : attributes_) {
            if (const auto* typed = dynamic_cast<const T*>(attribute.get())) {
                return typed;
            }
        }
        return nullptr;
    }

    /**
     * @brief Every attribute of type T, in declaration order.
     */
    template <typename T>
    [[nodiscard]] auto getAll() const -> std::vector<const T*> {
        std::vector<const T*> result;
        for (const auto& attribute : attributes_) {
            if (const auto* typed = dynamic_cast<const T*>(attribute.get())) {
                result.push_back(typed);
            }
        }
        return result;
    }

    template <typename T>
    [[nodiscard]] auto has() const -> bool {
        return get<T>() != nullptr;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return attributes_.size();
    }
    [[nodiscard]] auto empty() const noexcept -> bool {
        return attributes_.empty();
    }

    [[nodiscard]] auto begin() const noexcept { return attributes_.begin(); }
    [[nodiscard]] auto end() const noexcept { return attributes_.end(); }

    // Convenience accessors for the built-in attributes
    [[nodiscard]] auto description() const -> std::optional<std::string>;
    [[nodiscard]] auto enumMemberValue() const -> std::optional<std::string>;
    [[nodiscard]] auto displayName() const -> std::optional<std::string>;
    [[nodiscard]] auto displayOrder() const -> std::optional<int>;
    [[nodiscard]] auto isPrimary() const -> bool;

private:
    std::vector<AttributePtr> attributes_;
};

template <typename T, typename... Args>
[[nodiscard]] auto makeAttribute(Args&&... args) -> AttributePtr {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

[[nodiscard]] auto description(std::string text) -> AttributePtr;
[[nodiscard]] auto enumMember(std::string value) -> AttributePtr;
[[nodiscard]] auto display(std::string name,
                           std::optional<int> order = std::nullopt)
    -> AttributePtr;
[[nodiscard]] auto primary() -> AttributePtr;

}  // namespace enumkit::meta

#endif  // ENUMKIT_META_ATTRIBUTES_HPP
