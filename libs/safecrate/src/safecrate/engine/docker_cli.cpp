/*
 * SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#include "safecrate/engine/docker_cli.h"

#include "safecrate/common/strings.h"
#include "safecrate/utils/log/log.h"

#include <fmt/format.h>

namespace safecrate::engine {

using utils::error::ErrorCode;

utils::error::Result<std::unique_ptr<DockerCLI>>
DockerCLI::New(std::unique_ptr<utils::Cmd> cmd) noexcept
{
    SAFECRATE_TRACE("create container engine");

    if (!cmd) {
        return SAFECRATE_ERR("no engine command given");
    }

    if (!cmd->exists()) {
        return SAFECRATE_ERR(
          fmt::format("Failed to execute {0} command. Is {0} installed and running?",
                      cmd->command()),
          ErrorCode::EngineNotFound);
    }

    return std::unique_ptr<DockerCLI>(new DockerCLI(std::move(cmd)));
}

DockerCLI::DockerCLI(std::unique_ptr<utils::Cmd> cmd) noexcept
    : m_cmd(std::move(cmd))
{
}

std::vector<std::string> DockerCLI::arguments(const BuildOption &option)
{
    return { "build", "-t", option.tag, "-f", option.file.string(), option.context.string() };
}

std::vector<std::string> DockerCLI::arguments(const RunOption &option)
{
    std::vector<std::string> args{ "run" };

    std::string mode;
    if (option.interactive) {
        mode += "i";
    }
    if (option.tty) {
        mode += "t";
    }
    if (!mode.empty()) {
        args.push_back("-" + mode);
    }

    if (option.removeOnExit) {
        args.emplace_back("--rm");
    }

    if (!option.name.empty()) {
        args.insert(args.end(), { "--name", option.name });
    }

    if (option.network) {
        args.insert(args.end(), { "--network", *option.network });
    }

    for (const auto &volume : option.volumes) {
        args.insert(args.end(), { "-v", volume.source + ":" + volume.destination });
    }

    if (option.workdir) {
        args.insert(args.end(), { "-w", *option.workdir });
    }

    args.push_back(option.image);
    args.insert(args.end(), option.command.begin(), option.command.end());
    return args;
}

std::vector<std::string> DockerCLI::arguments(const ListOption &option)
{
    std::vector<std::string> args{ "ps" };
    if (option.all) {
        args.emplace_back("-a");
    }

    for (const auto &filter : option.filters) {
        args.insert(args.end(), { "--filter", filter });
    }

    if (option.format) {
        args.insert(args.end(), { "--format", *option.format });
    }

    return args;
}

std::vector<std::string> DockerCLI::arguments(const std::string &container,
                                              const StartOption &option)
{
    std::vector<std::string> args{ "start" };

    std::string mode;
    if (option.attach) {
        mode += "a";
    }
    if (option.interactive) {
        mode += "i";
    }
    if (!mode.empty()) {
        args.push_back("-" + mode);
    }

    args.push_back(container);
    return args;
}

std::vector<std::string> DockerCLI::arguments(const std::string &container,
                                              const RemoveOption &option)
{
    std::vector<std::string> args{ "rm" };
    if (option.force) {
        args.emplace_back("-f");
    }

    args.push_back(container);
    return args;
}

utils::error::Result<void> DockerCLI::runAttached(const std::vector<std::string> &args,
                                                  const std::string &failure) noexcept
{
    SAFECRATE_TRACE(fmt::format("{} {}", bin(), common::strings::quoteShellArgs(args)));

    LogD("invoke: {} {}", bin(), common::strings::quoteShellArgs(args));

    auto exitCode = m_cmd->run(args);
    if (!exitCode) {
        return SAFECRATE_ERR(
          fmt::format("Failed to execute {0} command. Is {0} installed and running?", bin()),
          ErrorCode::EngineNotFound);
    }

    if (*exitCode != 0) {
        return SAFECRATE_ERR(fmt::format("{}. {} command exited with non-zero status ({}).",
                                         failure,
                                         bin(),
                                         *exitCode),
                             ErrorCode::EngineCommandFailed);
    }

    return SAFECRATE_OK;
}

utils::error::Result<void> DockerCLI::build(const BuildOption &option) noexcept
{
    return runAttached(arguments(option), "Image build failed");
}

utils::error::Result<void> DockerCLI::run(const RunOption &option) noexcept
{
    return runAttached(arguments(option), "Failed to open container");
}

utils::error::Result<std::vector<std::string>> DockerCLI::list(const ListOption &option) noexcept
{
    auto args = arguments(option);
    SAFECRATE_TRACE(fmt::format("{} {}", bin(), common::strings::quoteShellArgs(args)));

    LogD("invoke: {} {}", bin(), common::strings::quoteShellArgs(args));

    auto output = m_cmd->exec(args);
    if (!output) {
        return SAFECRATE_ERR(fmt::format("Failed to list containers: {}", output.error().message()),
                             ErrorCode::EngineCommandFailed);
    }

    return common::strings::split(*output,
                                  '\n',
                                  common::strings::splitOption::TrimWhitespace
                                    | common::strings::splitOption::SkipEmpty);
}

utils::error::Result<void> DockerCLI::start(const std::string &container,
                                            const StartOption &option) noexcept
{
    return runAttached(arguments(container, option), "Failed to resume container");
}

utils::error::Result<void> DockerCLI::remove(const std::string &container,
                                             const RemoveOption &option) noexcept
{
    return runAttached(arguments(container, option), "Failed to remove container");
}

} // namespace safecrate::engine
