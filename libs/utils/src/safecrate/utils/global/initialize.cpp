/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#include "safecrate/utils/global/initialize.h"

#include "safecrate/common/strings.h"

#include <cstdlib>
#include <string>
#include <vector>

#include <unistd.h>

namespace safecrate::utils::global {

using namespace safecrate::common;
using safecrate::utils::log::LogBackend;
using safecrate::utils::log::LogLevel;

LogLevel parseLogLevel(const char *level)
{
    if (strings::stringEqual(level, "debug")) {
        return LogLevel::Debug;
    }

    if (strings::stringEqual(level, "info")) {
        return LogLevel::Info;
    }

    if (strings::stringEqual(level, "warning")) {
        return LogLevel::Warning;
    }

    if (strings::stringEqual(level, "error")) {
        return LogLevel::Error;
    }

    if (strings::stringEqual(level, "fatal")) {
        return LogLevel::Fatal;
    }

    return LogLevel::Info;
}

LogBackend parseLogBackend(const char *backends)
{
    LogBackend logBackend = LogBackend::None;

    const std::vector<std::string> backendsList =
      strings::split(backends, ',', strings::splitOption::TrimWhitespace);
    for (const auto &backend : backendsList) {
        if (strings::stringEqual(backend, "console")) {
            logBackend = logBackend | LogBackend::Console;
        } else if (strings::stringEqual(backend, "journal")) {
            logBackend = logBackend | LogBackend::Journal;
        }
    }

    return logBackend;
}

void initSafecrateLogSystem(LogBackend backend)
{
    LogLevel logLevel = LogLevel::Info;
    LogBackend logBackend = LogBackend::None;

    const char *logLevelEnv = getenv("SAFECRATE_LOG_LEVEL");
    if (logLevelEnv) {
        logLevel = parseLogLevel(logLevelEnv);
    }

    const char *logBackendEnv = getenv("SAFECRATE_LOG_BACKEND");
    if (logBackendEnv) {
        logBackend = parseLogBackend(logBackendEnv);
    } else {
        logBackend = backend;

        if (isatty(STDERR_FILENO)) {
            logBackend = logBackend | LogBackend::Console;
        }
    }

    log::setLogLevel(logLevel);
    log::setLogBackend(logBackend);
}

} // namespace safecrate::utils::global
