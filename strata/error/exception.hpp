/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: Exception base class with source location, thread id and
stack trace

**************************************************/

#ifndef STRATA_ERROR_EXCEPTION_HPP
#define STRATA_ERROR_EXCEPTION_HPP

#include <exception>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#include "strata/error/stacktrace.hpp"

#define STRATA_FILE_NAME __FILE__
#define STRATA_FILE_LINE __LINE__
#define STRATA_FUNC_NAME __func__

namespace strata::error {

/**
 * @brief Base exception of the library.
 *
 * Records where it was thrown, the throwing thread and the call stack. The
 * message is built by streaming every trailing constructor argument.
 */
class Exception : public std::exception {
public:
    /**
     * @brief Constructs an exception.
     * @param file Source file of the throw site.
     * @param line Source line of the throw site.
     * @param func Function of the throw site.
     * @param args Values concatenated into the message.
     */
    template <typename... Args>
    Exception(const char* file, int line, const char* func, Args&&... args)
        : file_(file), line_(line), func_(func) {
        std::ostringstream oss;
        if constexpr (sizeof...(Args) > 0) {
            (oss << ... << std::forward<Args>(args));
        }
        message_ = oss.str();
        thread_id_ = std::this_thread::get_id();
    }

    /**
     * @brief Throws a new exception of this type nested around the one
     * currently being handled.
     */
    template <typename... Args>
    [[noreturn]] static void rethrowNested(Args&&... args) {
        try {
            throw;
        } catch (...) {
            std::throw_with_nested(Exception(std::forward<Args>(args)...));
        }
    }

    /**
     * @brief Full report: location, thread, message and stack trace.
     */
    auto what() const noexcept -> const char* override;

    [[nodiscard]] auto getFile() const -> std::string;
    [[nodiscard]] auto getLine() const -> int;
    [[nodiscard]] auto getFunction() const -> std::string;
    [[nodiscard]] auto getMessage() const -> std::string;
    [[nodiscard]] auto getThreadId() const -> std::thread::id;

protected:
    /**
     * @brief Replaces the message; used by subclasses that format their
     * own text after construction.
     */
    void setMessage(std::string message) {
        message_ = std::move(message);
        full_message_.clear();
    }

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

class LogicError : public Exception {
public:
    using Exception::Exception;
};

class InvalidArgument : public Exception {
public:
    using Exception::Exception;
};

class OutOfRange : public Exception {
public:
    using Exception::Exception;
};

}  // namespace strata::error

#define THROW_EXCEPTION(...)                                         \
    throw strata::error::Exception(STRATA_FILE_NAME, STRATA_FILE_LINE, \
                                   STRATA_FUNC_NAME, __VA_ARGS__)

#define THROW_NESTED_EXCEPTION(...)                                  \
    strata::error::Exception::rethrowNested(STRATA_FILE_NAME,         \
                                            STRATA_FILE_LINE,         \
                                            STRATA_FUNC_NAME, __VA_ARGS__)

#define THROW_RUNTIME_ERROR(...)                                        \
    throw strata::error::RuntimeError(STRATA_FILE_NAME, STRATA_FILE_LINE, \
                                      STRATA_FUNC_NAME, __VA_ARGS__)

#define THROW_LOGIC_ERROR(...)                                        \
    throw strata::error::LogicError(STRATA_FILE_NAME, STRATA_FILE_LINE, \
                                    STRATA_FUNC_NAME, __VA_ARGS__)

#define THROW_INVALID_ARGUMENT(...)                                        \
    throw strata::error::InvalidArgument(STRATA_FILE_NAME, STRATA_FILE_LINE, \
                                         STRATA_FUNC_NAME, __VA_ARGS__)

#define THROW_OUT_OF_RANGE(...)                                        \
    throw strata::error::OutOfRange(STRATA_FILE_NAME, STRATA_FILE_LINE, \
                                    STRATA_FUNC_NAME, __VA_ARGS__)

#endif
