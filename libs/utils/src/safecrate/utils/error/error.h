/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "safecrate/utils/error/details/error_impl.h"

#include <tl/expected.hpp>

#include <cassert>
#include <exception>
#include <memory>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace safecrate::utils::error {

enum class ErrorCode : int {
    Failed = -1, // generic failure
    Success = 0,
    Unknown = 1000,

    /* paths */
    InvalidDirectory = 1001,  // target directory missing or not canonicalizable
    TemplateNotFound = 1002,  // custom image template missing
    TemplateWriteFailed = 1003,

    /* container engine */
    EngineNotFound = 2001,      // engine binary not found in PATH
    EngineCommandFailed = 2002, // engine exited with non-zero status
    NoContainerToResume = 2003,

    /* configuration */
    InvalidConfig = 3001,
};

class Error
{
public:
    Error() = default;

    Error(const Error &) = delete;
    Error(Error &&) = default;
    Error &operator=(const Error &) = delete;
    Error &operator=(Error &&) = default;

    [[nodiscard]] auto code() const { return pImpl->code(); };

    [[nodiscard]] auto message() const { return pImpl->message(); }

    static auto Err(const char *file,
                    int line,
                    const std::string &trace_msg,
                    const std::string &msg,
                    const ErrorCode &code) -> Error
    {
        return Error(std::make_unique<details::ErrorImpl>(file,
                                                          line,
                                                          static_cast<int>(code),
                                                          trace_msg,
                                                          msg,
                                                          nullptr));
    }

    static auto Err(
      const char *file, int line, const std::string &trace_msg, const std::string &msg, int code = -1)
      -> Error
    {
        return Error(
          std::make_unique<details::ErrorImpl>(file, line, code, trace_msg, msg, nullptr));
    }

    static auto
    Err(const char *file, int line, const std::string &trace_msg, const std::exception &e) -> Error
    {
        return Error(
          std::make_unique<details::ErrorImpl>(file, line, -1, trace_msg, e.what(), nullptr));
    }

    static auto Err(const char *file,
                    int line,
                    const std::string &trace_msg,
                    const std::string &msg,
                    const std::exception &e,
                    int code = -1) -> Error
    {
        return Error(std::make_unique<details::ErrorImpl>(file,
                                                          line,
                                                          code,
                                                          trace_msg,
                                                          msg + ": " + e.what(),
                                                          nullptr));
    }

    static auto Err(const char *file,
                    int line,
                    const std::string &trace_msg,
                    const std::string &msg,
                    const std::system_error &e) -> Error
    {
        return Err(file, line, trace_msg, msg, e, e.code().value());
    }

    template <typename Value>
    static auto Err(const char *file,
                    int line,
                    const std::string &trace_msg,
                    const std::string &msg,
                    tl::expected<Value, Error> &&cause) -> Error
    {
        assert(!cause.has_value());

        return Error(std::make_unique<details::ErrorImpl>(file,
                                                          line,
                                                          cause.error().code(),
                                                          trace_msg,
                                                          msg,
                                                          std::move(cause.error().pImpl)));
    }

    template <typename Value>
    static auto Err(const char *file,
                    int line,
                    const std::string &trace_msg,
                    tl::expected<Value, Error> &&cause) -> Error
    {
        assert(!cause.has_value());

        return Error(std::make_unique<details::ErrorImpl>(file,
                                                          line,
                                                          cause.error().code(),
                                                          trace_msg,
                                                          std::nullopt,
                                                          std::move(cause.error().pImpl)));
    }

    static auto Err(const char *file,
                    int line,
                    const std::string &trace_msg,
                    const std::string &msg,
                    Error &&cause) -> Error
    {
        return Error(std::make_unique<details::ErrorImpl>(file,
                                                          line,
                                                          cause.code(),
                                                          trace_msg,
                                                          msg,
                                                          std::move(cause.pImpl)));
    }

    static auto Err(const char *file, int line, const std::string &trace_msg, Error &&cause)
      -> Error
    {
        return Error(std::make_unique<details::ErrorImpl>(file,
                                                          line,
                                                          cause.code(),
                                                          trace_msg,
                                                          std::nullopt,
                                                          std::move(cause.pImpl)));
    }

private:
    explicit Error(std::unique_ptr<details::ErrorImpl> pImpl)
        : pImpl(std::move(pImpl))
    {
    }

    std::unique_ptr<details::ErrorImpl> pImpl;
};

template <typename Value>
using Result = tl::expected<Value, Error>;

} // namespace safecrate::utils::error

// Use this macro to define trace message at the begining of function
#define SAFECRATE_TRACE(message) const std::string safecrate_trace_message{ message };

// Use this macro to create new error or wrap an existing error
// SAFECRATE_ERR(message, code =-1)
// SAFECRATE_ERR(message, /* ErrorCode */)
// SAFECRATE_ERR(message, /* const std::exception & */, code=-1)
// SAFECRATE_ERR(/* const std::exception & */)
// SAFECRATE_ERR(message, /* const std::system_error & */)
// SAFECRATE_ERR(message, /* Result<Value>&& */)
// SAFECRATE_ERR(/* Result<Value>&& */)
// SAFECRATE_ERR(message, /* Error&& */)
// SAFECRATE_ERR(/* Error&& */)

#define SAFECRATE_ERR_GETMACRO(_1, _2, _3, NAME, ...) /*NOLINT*/ NAME
#define SAFECRATE_ERR(...) /*NOLINT*/                                                          \
    SAFECRATE_ERR_GETMACRO(__VA_ARGS__, SAFECRATE_ERR_3, SAFECRATE_ERR_2, SAFECRATE_ERR_1, ...) \
    (__VA_ARGS__)

// std::move is used for Result<Value>
#define SAFECRATE_ERR_1(_1) /*NOLINT*/                                            \
    tl::unexpected(::safecrate::utils::error::Error::Err(__FILE__,                \
                                                         __LINE__,                \
                                                         safecrate_trace_message, \
                                                         std::move((_1)) /*NOLINT*/))

// std::move is used for Result<Value>
#define SAFECRATE_ERR_2(_1, _2) /*NOLINT*/                                        \
    tl::unexpected(::safecrate::utils::error::Error::Err(__FILE__,                \
                                                         __LINE__,                \
                                                         safecrate_trace_message, \
                                                         (_1),                    \
                                                         std::move((_2)) /*NOLINT*/))

#define SAFECRATE_ERR_3(_1, _2, _3) /*NOLINT*/                                    \
    tl::unexpected(::safecrate::utils::error::Error::Err(__FILE__,                \
                                                         __LINE__,                \
                                                         safecrate_trace_message, \
                                                         (_1),                    \
                                                         (_2),                    \
                                                         (_3)))

#define SAFECRATE_OK \
    {                \
    }
