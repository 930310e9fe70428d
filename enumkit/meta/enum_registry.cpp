/*!
 * \file enum_registry.cpp
 * \brief Process-wide registry of enumerations addressed by type token
 * \author Max Qian <lightapt.com>
 * \date 2024-6-10
 * \copyright Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "enumkit/meta/enum_registry.hpp"

#include <mutex>

#include <spdlog/spdlog.h>

#include "enumkit/error/exception.hpp"

namespace enumkit::meta {

auto EnumRegistry::getInstance() -> EnumRegistry& {
    static EnumRegistry instance;
    return instance;
}

auto EnumRegistry::getOrAdd(
    std::type_index type,
    const std::function<NonGenericEnumInfoPtr()>& factory)
    -> NonGenericEnumInfoPtr {
    if (auto existing = find(type)) {
        return existing;
    }
    auto info = factory();
    if (!info) {
        THROW_INVALID_ARGUMENT("enum info factory returned null");
    }
    std::unique_lock lock(mutex_);
    auto [iter, inserted] = infos_.try_emplace(type, std::move(info));
    if (inserted) {
        spdlog::info("Registered enum {}", iter->second->typeName());
    } else {
        spdlog::trace("Enum {} was registered concurrently",
                      iter->second->typeName());
    }
    return iter->second;
}

auto EnumRegistry::get(std::type_index type) const -> NonGenericEnumInfoPtr {
    if (auto info = find(type)) {
        return info;
    }
    THROW_INVALID_ARGUMENT("type {} is not a registered enum", type.name());
}

auto EnumRegistry::find(std::type_index type) const -> NonGenericEnumInfoPtr {
    std::shared_lock lock(mutex_);
    if (auto iter = infos_.find(type); iter != infos_.end()) {
        return iter->second;
    }
    return nullptr;
}

auto EnumRegistry::contains(std::type_index type) const -> bool {
    std::shared_lock lock(mutex_);
    return infos_.contains(type);
}

auto EnumRegistry::size() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return infos_.size();
}

auto EnumRegistry::typeNames() const -> std::vector<std::string> {
    std::shared_lock lock(mutex_);
    std::vector<std::string> names;
    names.reserve(infos_.size());
    for (const auto& [type, info] : infos_) {
        names.emplace_back(info->typeName());
    }
    return names;
}

auto getEnumInfo(const std::any& value) -> NonGenericEnumInfoPtr {
    if (!value.has_value()) {
        THROW_INVALID_ARGUMENT("value must not be empty");
    }
    return EnumRegistry::getInstance().get(value.type());
}

auto getEnumInfo(std::type_index type) -> NonGenericEnumInfoPtr {
    return EnumRegistry::getInstance().get(type);
}

}  // namespace enumkit::meta
