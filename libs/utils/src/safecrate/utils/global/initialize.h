/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "safecrate/utils/log/log.h"

namespace safecrate::utils::global {

// Configure g_logger from SAFECRATE_LOG_LEVEL and SAFECRATE_LOG_BACKEND.
// Without SAFECRATE_LOG_BACKEND the given backend is used, plus the console when stderr is a tty.
void initSafecrateLogSystem(log::LogBackend backend);

log::LogLevel parseLogLevel(const char *level);
log::LogBackend parseLogBackend(const char *backends);

} // namespace safecrate::utils::global
