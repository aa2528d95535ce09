/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#include "cmd.h"

#include "safecrate/common/error.h"
#include "safecrate/common/strings.h"
#include "safecrate/utils/log/log.h"

#include <fmt/ranges.h>
#include <fmt/std.h>
#include <gsl/util>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <iostream>

#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace safecrate::utils {

namespace {

std::vector<char *> toArgv(const std::filesystem::path &commandPath,
                           const std::vector<std::string> &args,
                           std::string &argv0)
{
    std::vector<char *> argv;
    argv0 = commandPath.filename().string();
    argv.push_back(argv0.data());
    for (const auto &arg : args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

utils::error::Result<int> waitChild(pid_t pid)
{
    SAFECRATE_TRACE(fmt::format("wait for child {}", pid));

    int status{ 0 };
    while (waitpid(pid, &status, 0) == -1) {
        if (errno == EINTR) {
            continue;
        }
        return SAFECRATE_ERR(
          fmt::format("waitpid error: {}", common::error::errorString(errno)));
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }

    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }

    return SAFECRATE_ERR("command exited abnormally");
}

} // namespace

Cmd::Cmd(std::string command) noexcept
    : m_command(std::move(command))
{
}

Cmd::~Cmd() = default;

bool Cmd::exists() noexcept
{
    return !getCommandPath().empty();
}

std::filesystem::path Cmd::getCommandPath()
{
    std::error_code ec;
    std::filesystem::path path{ m_command };
    if (m_command.find('/') != std::string::npos) {
        if (std::filesystem::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0) {
            return std::filesystem::absolute(path, ec);
        }
        return {};
    }

    std::vector<std::string> pathDirs;
    const char *pathEnv = std::getenv("PATH");
    if (pathEnv && pathEnv[0] != '\0') {
        pathDirs = common::strings::split(pathEnv, ':', common::strings::splitOption::SkipEmpty);
    } else {
        pathDirs = { "/usr/local/bin", "/usr/bin", "/bin" };
    }

    for (const auto &pathDir : pathDirs) {
        std::filesystem::path fullPath = std::filesystem::path{ pathDir } / m_command;
        if (std::filesystem::is_regular_file(fullPath, ec)
            && ::access(fullPath.c_str(), X_OK) == 0) {
            return fullPath;
        }
    }

    return {};
}

utils::error::Result<std::string> Cmd::exec(const std::vector<std::string> &args) noexcept
{
    SAFECRATE_TRACE(fmt::format("exec cmd: {} args: {}", m_command, fmt::join(args, " ")));

    auto commandPath = getCommandPath();
    if (commandPath.empty()) {
        return SAFECRATE_ERR(fmt::format("command not found: {}", m_command));
    }

    std::array<int, 2> stdoutPipe{ -1, -1 };
    if (pipe(stdoutPipe.data()) == -1) {
        return SAFECRATE_ERR(fmt::format("pipe error: {}", common::error::errorString(errno)));
    }
    auto stdoutPipeCloser = gsl::finally([&stdoutPipe]() {
        for (auto fd : stdoutPipe) {
            if (fd != -1) {
                close(fd);
            }
        }
    });

    // allocate everything the child needs before fork
    std::string argv0;
    auto argv = toArgv(commandPath, args, argv0);

    LogD("execute {} with args [{}]", commandPath, fmt::join(args, ", "));

    pid_t pid = fork();
    if (pid == -1) {
        return SAFECRATE_ERR(fmt::format("fork error: {}", common::error::errorString(errno)));
    }

    if (pid == 0) {
        close(stdoutPipe[0]);
        if (dup2(stdoutPipe[1], STDOUT_FILENO) == -1) {
            _exit(127);
        }
        close(stdoutPipe[1]);

        execve(commandPath.c_str(), argv.data(), environ);

        std::cerr << "execve failed: " << common::error::errorString(errno) << std::endl;
        _exit(127);
    }

    close(stdoutPipe[1]);
    stdoutPipe[1] = -1;

    std::string output;
    std::array<char, 4096> buffer{};
    while (true) {
        ssize_t n = read(stdoutPipe[0], buffer.data(), buffer.size());
        if (n > 0) {
            output.append(buffer.data(), static_cast<size_t>(n));
            continue;
        }

        if (n == -1 && errno == EINTR) {
            continue;
        }

        if (n == -1) {
            LogW("read stdout of {} error: {}", m_command, common::error::errorString(errno));
        }
        break;
    }

    auto exitCode = waitChild(pid);
    if (!exitCode) {
        return SAFECRATE_ERR(exitCode);
    }

    if (*exitCode != 0) {
        return SAFECRATE_ERR(
          fmt::format("command execute failed with exit code {}: {}", *exitCode, output),
          *exitCode);
    }

    return output;
}

utils::error::Result<int> Cmd::run(const std::vector<std::string> &args) noexcept
{
    SAFECRATE_TRACE(fmt::format("run cmd: {} args: {}", m_command, fmt::join(args, " ")));

    auto commandPath = getCommandPath();
    if (commandPath.empty()) {
        return SAFECRATE_ERR(fmt::format("command not found: {}", m_command));
    }

    std::string argv0;
    auto argv = toArgv(commandPath, args, argv0);

    LogD("run {} with args [{}]", commandPath, fmt::join(args, ", "));

    pid_t pid = fork();
    if (pid == -1) {
        return SAFECRATE_ERR(fmt::format("fork error: {}", common::error::errorString(errno)));
    }

    if (pid == 0) {
        execve(commandPath.c_str(), argv.data(), environ);

        std::cerr << "execve failed: " << common::error::errorString(errno) << std::endl;
        _exit(127);
    }

    auto exitCode = waitChild(pid);
    if (!exitCode) {
        return SAFECRATE_ERR(exitCode);
    }

    LogD("{} exited with status {}", m_command, *exitCode);
    return *exitCode;
}

} // namespace safecrate::utils
