/*!
 * \file enum_format.cpp
 * \brief Member string formats, validation modes and member selections
 * \author Max Qian <lightapt.com>
 * \date 2024-6-5
 * \copyright Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "enumkit/meta/enum_format.hpp"

#include <mutex>
#include <shared_mutex>
#include <vector>

#include <spdlog/spdlog.h>

#include "enumkit/error/exception.hpp"

namespace enumkit::meta {

namespace {
class CustomFormatRegistry {
public:
    static auto getInstance() -> CustomFormatRegistry& {
        static CustomFormatRegistry instance;
        return instance;
    }

    auto add(CustomEnumFormatter formatter) -> EnumFormat {
        auto entry =
            std::make_shared<CustomEnumFormatter>(std::move(formatter));
        std::unique_lock lock(mutex_);
        formatters_.push_back(std::move(entry));
        return static_cast<EnumFormat>(
            CUSTOM_ENUM_FORMAT_START + static_cast<int>(formatters_.size()) -
            1);
    }

    auto find(EnumFormat format) const
        -> std::shared_ptr<const CustomEnumFormatter> {
        const auto index =
            static_cast<int>(format) - CUSTOM_ENUM_FORMAT_START;
        if (index < 0) {
            return nullptr;
        }
        std::shared_lock lock(mutex_);
        if (static_cast<std::size_t>(index) >= formatters_.size()) {
            return nullptr;
        }
        return formatters_[static_cast<std::size_t>(index)];
    }

private:
    CustomFormatRegistry() = default;

    mutable std::shared_mutex mutex_;
    std::vector<std::shared_ptr<const CustomEnumFormatter>> formatters_;
};
}  // namespace

auto registerCustomEnumFormat(CustomEnumFormatter formatter) -> EnumFormat {
    if (!formatter) {
        THROW_INVALID_ARGUMENT("custom enum formatter must not be empty");
    }
    auto format =
        CustomFormatRegistry::getInstance().add(std::move(formatter));
    spdlog::info("Registered custom enum format {}",
                 static_cast<int>(format));
    return format;
}

auto getCustomEnumFormatter(EnumFormat format)
    -> std::shared_ptr<const CustomEnumFormatter> {
    return CustomFormatRegistry::getInstance().find(format);
}

auto isValidEnumFormat(EnumFormat format) -> bool {
    return isBuiltinEnumFormat(format) ||
           getCustomEnumFormatter(format) != nullptr;
}

void validateEnumFormats(std::span<const EnumFormat> formats) {
    for (auto format : formats) {
        if (!isValidEnumFormat(format)) {
            THROW_INVALID_ARGUMENT("{} is not a valid enum format",
                                   static_cast<int>(format));
        }
    }
}

auto enumFormatSlot(EnumFormat format) -> std::size_t {
    if (isBuiltinEnumFormat(format)) {
        return static_cast<std::size_t>(format);
    }
    if (!isValidEnumFormat(format)) {
        THROW_INVALID_ARGUMENT("{} is not a valid enum format",
                               static_cast<int>(format));
    }
    return BUILTIN_ENUM_FORMAT_COUNT +
           static_cast<std::size_t>(static_cast<int>(format) -
                                    CUSTOM_ENUM_FORMAT_START);
}

auto isValidEnumValidation(EnumValidation validation) noexcept -> bool {
    switch (validation) {
        case EnumValidation::None:
        case EnumValidation::Default:
        case EnumValidation::IsDefined:
        case EnumValidation::IsValidFlagCombination:
            return true;
    }
    return false;
}

auto isValidEnumMemberSelection(EnumMemberSelection selection) noexcept
    -> bool {
    constexpr auto KNOWN = static_cast<unsigned>(
        EnumMemberSelection::Distinct | EnumMemberSelection::Flags |
        EnumMemberSelection::DisplayOrder);
    return (static_cast<unsigned>(selection) & ~KNOWN) == 0;
}

auto toString(EnumFormat format) -> std::string {
    switch (format) {
        case EnumFormat::DecimalValue:
            return "DecimalValue";
        case EnumFormat::HexadecimalValue:
            return "HexadecimalValue";
        case EnumFormat::UnderlyingValue:
            return "UnderlyingValue";
        case EnumFormat::Name:
            return "Name";
        case EnumFormat::Description:
            return "Description";
        case EnumFormat::EnumMemberValue:
            return "EnumMemberValue";
        case EnumFormat::DisplayName:
            return "DisplayName";
    }
    return fmt::format("Custom({})", static_cast<int>(format));
}

}  // namespace enumkit::meta
