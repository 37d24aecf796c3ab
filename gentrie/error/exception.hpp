/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: Better Exception Library

**************************************************/

#ifndef GENTRIE_ERROR_EXCEPTION_HPP
#define GENTRIE_ERROR_EXCEPTION_HPP

#include <exception>
#include <string>
#include <thread>
#include <utility>

#include <fmt/format.h>

#include "gentrie/error/stacktrace.hpp"
#include "gentrie/macro.hpp"

namespace gentrie::error {

/**
 * @brief Base class of every exception thrown by gentrie.
 *
 * Records where the exception was raised (file, line, function), the
 * raising thread and the call stack at construction time. The message is
 * formatted with fmt.
 */
class Exception : public std::exception {
public:
    template <typename... Args>
    Exception(const char* file, int line, const char* func,
              fmt::format_string<Args...> format, Args&&... args)
        : file_(file),
          line_(line),
          func_(func),
          message_(fmt::format(format, std::forward<Args>(args)...)),
          thread_id_(std::this_thread::get_id()) {}

    /**
     * @brief Full diagnostic text: location, thread, message and stack.
     */
    auto what() const noexcept -> const char* override;

    GENTRIE_NODISCARD auto getFile() const -> std::string;
    GENTRIE_NODISCARD auto getLine() const -> int;
    GENTRIE_NODISCARD auto getFunction() const -> std::string;
    GENTRIE_NODISCARD auto getMessage() const -> std::string;
    GENTRIE_NODISCARD auto getThreadId() const -> std::thread::id;

private:
    std::string file_;
    int line_;
    std::string func_;
    std::string message_;
    mutable std::string full_message_;
    std::thread::id thread_id_;
    StackTrace stack_trace_;
};

class RuntimeError : public Exception {
public:
    using Exception::Exception;
};

#define THROW_RUNTIME_ERROR(...)                                       \
    throw gentrie::error::RuntimeError(GENTRIE_FILE_NAME, GENTRIE_FILE_LINE, \
                                       GENTRIE_FUNC_NAME, __VA_ARGS__)

class InvalidArgument : public Exception {
public:
    using Exception::Exception;
};

#define THROW_INVALID_ARGUMENT(...)                                  \
    throw gentrie::error::InvalidArgument(GENTRIE_FILE_NAME,         \
                                          GENTRIE_FILE_LINE,         \
                                          GENTRIE_FUNC_NAME, __VA_ARGS__)

class OutOfRange : public Exception {
public:
    using Exception::Exception;
};

#define THROW_OUT_OF_RANGE(...)                                          \
    throw gentrie::error::OutOfRange(GENTRIE_FILE_NAME, GENTRIE_FILE_LINE, \
                                     GENTRIE_FUNC_NAME, __VA_ARGS__)

}  // namespace gentrie::error

#endif  // GENTRIE_ERROR_EXCEPTION_HPP
