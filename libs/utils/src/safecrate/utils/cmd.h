/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "safecrate/utils/error/error.h"

#include <filesystem>
#include <string>
#include <vector>

namespace safecrate::utils {

// Executes a command from the standard system PATH, blocking until the child process exits.
// exec() captures the stdout of the child process, run() lets the child share the terminal.
class Cmd
{
public:
    explicit Cmd(std::string command) noexcept;
    virtual ~Cmd();

    Cmd(const Cmd &) = delete;
    Cmd &operator=(const Cmd &) = delete;

    [[nodiscard]] const std::string &command() const noexcept { return m_command; }

    virtual bool exists() noexcept;

    // Fails if the command is missing or exits with non-zero status.
    virtual utils::error::Result<std::string>
    exec(const std::vector<std::string> &args = {}) noexcept;

    // Inherits stdin, stdout and stderr. Returns the exit status of the child,
    // 128 + signal number if it was killed by a signal.
    virtual utils::error::Result<int> run(const std::vector<std::string> &args = {}) noexcept;

private:
    std::filesystem::path getCommandPath();

    std::string m_command;
};

} // namespace safecrate::utils
