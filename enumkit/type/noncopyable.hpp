/*
 * noncopyable.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-3-29

Description: Base class for objects that are referenced by address

**************************************************/

#ifndef ENUMKIT_TYPE_NONCOPYABLE_HPP
#define ENUMKIT_TYPE_NONCOPYABLE_HPP

namespace enumkit::type {

/**
 * @brief A class that prevents copying and moving.
 *
 * Caches, parser indexes and member records hold raw pointers into each
 * other, so none of them may change address after construction.
 */
class NonCopyable {
public:
    NonCopyable() = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable&) = delete;
    auto operator=(const NonCopyable&) -> NonCopyable& = delete;

    NonCopyable(NonCopyable&&) = delete;
    auto operator=(NonCopyable&&) -> NonCopyable& = delete;
};

}  // namespace enumkit::type

#endif  // ENUMKIT_TYPE_NONCOPYABLE_HPP
