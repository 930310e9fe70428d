/*
 * macro.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-2

Description: Common macros shared by the enumkit modules

**************************************************/

#ifndef ENUMKIT_MACRO_HPP
#define ENUMKIT_MACRO_HPP

#if __cplusplus < 202002L && !defined(_MSVC_LANG)
#error "enumkit requires C++20"
#endif

// Source location used by the THROW_* macros
#define ENUMKIT_FILE_NAME __FILE__
#define ENUMKIT_FILE_LINE __LINE__
#define ENUMKIT_FUNC_NAME __func__

// Full signature of the enclosing function, used for compile-time type names
#if defined(__clang__) || defined(__GNUC__)
#define ENUMKIT_META_FUNCTION_NAME __PRETTY_FUNCTION__
#elif defined(_MSC_VER)
#define ENUMKIT_META_FUNCTION_NAME __FUNCSIG__
#else
#error "Unsupported compiler"
#endif

#if defined(__GNUC__) || defined(__clang__)
#define ENUMKIT_FORCE_INLINE inline __attribute__((always_inline))
#elif defined(_MSC_VER)
#define ENUMKIT_FORCE_INLINE __forceinline
#else
#define ENUMKIT_FORCE_INLINE inline
#endif

#ifndef ENUMKIT_ENABLE_DEBUG
#define ENUMKIT_ENABLE_DEBUG 0
#endif

#endif  // ENUMKIT_MACRO_HPP
