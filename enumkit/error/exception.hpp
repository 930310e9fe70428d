/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-2

Description: Exception hierarchy used by enumkit

**************************************************/

#ifndef ENUMKIT_ERROR_EXCEPTION_HPP
#define ENUMKIT_ERROR_EXCEPTION_HPP

#include <exception>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "enumkit/macro.hpp"

namespace enumkit::error {

/**
 * @brief Base exception carrying the throw site and the throwing thread.
 *
 * The message may be a fmt format string followed by its arguments. A message
 * without arguments is stored verbatim, so it may contain braces.
 */
class Exception : public std::exception {
public:
    template <typename... Args>
    Exception(const char* file, int line, const char* func,
              std::string_view message, Args&&... args)
        : file_(file),
          line_(line),
          func_(func),
          thread_id_(std::this_thread::get_id()) {
        if constexpr (sizeof...(Args) == 0) {
            message_ = std::string(message);
        } else {
            message_ =
                fmt::format(fmt::runtime(message), std::forward<Args>(args)...);
        }
    }

    /**
     * @brief Full diagnostic text: throw site, thread and message.
     */
    [[nodiscard]] auto what() const noexcept -> const char* override;

    [[nodiscard]] auto getFile() const -> std::string;
    [[nodiscard]] auto getLine() const -> int;
    [[nodiscard]] auto getFunction() const -> std::string;
    [[nodiscard]] auto getMessage() const -> std::string;
    [[nodiscard]] auto getThreadId() const -> std::thread::id;

private:
    std::string file_;
    int line_;
    std::string func_;
    std::string message_;
    std::thread::id thread_id_;
    mutable std::string full_message_;
};

// Null, missing or unrecognized caller input (formats, modes, delimiters)
class InvalidArgument : public Exception {
public:
    using Exception::Exception;
};

#define THROW_INVALID_ARGUMENT(...)                             \
    throw enumkit::error::InvalidArgument(                      \
        ENUMKIT_FILE_NAME, ENUMKIT_FILE_LINE, ENUMKIT_FUNC_NAME, \
        __VA_ARGS__)

// Numeric input outside the underlying type's value range
class Overflow : public Exception {
public:
    using Exception::Exception;
};

#define THROW_OVERFLOW(...)                                                \
    throw enumkit::error::Overflow(ENUMKIT_FILE_NAME, ENUMKIT_FILE_LINE,   \
                                   ENUMKIT_FUNC_NAME, __VA_ARGS__)

// Text that is neither a known member representation nor numeric
class ParserError : public Exception {
public:
    using Exception::Exception;
};

#define THROW_PARSER_ERROR(...)                                              \
    throw enumkit::error::ParserError(ENUMKIT_FILE_NAME, ENUMKIT_FILE_LINE,  \
                                      ENUMKIT_FUNC_NAME, __VA_ARGS__)

// Unsupported single-character format code
class InvalidFormat : public Exception {
public:
    using Exception::Exception;
};

#define THROW_INVALID_FORMAT(...)                                             \
    throw enumkit::error::InvalidFormat(ENUMKIT_FILE_NAME, ENUMKIT_FILE_LINE, \
                                        ENUMKIT_FUNC_NAME, __VA_ARGS__)

}  // namespace enumkit::error

#endif  // ENUMKIT_ERROR_EXCEPTION_HPP
