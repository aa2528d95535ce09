/*
 * SPDX-FileCopyrightText: 2022 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "safecrate/cli/printer.h"
#include "safecrate/engine/engine.h"
#include "safecrate/utils/error/error.h"

#include <filesystem>
#include <optional>
#include <string>

namespace safecrate::cli {

struct GlobalOptions
{
    bool version{ false };
    bool verbose{ false };
    bool json{ false };
};

struct InitOptions
{
    std::optional<std::string> dockerfile;
};

struct OpenOptions
{
    std::string dir;
    std::optional<std::string> command;
    bool keepContainer{ false };
    bool noNetwork{ false };
};

struct ResumeOptions
{
    std::string dir;
};

struct RemoveOptions
{
    std::string dir;
    bool force{ false };
};

// Runs one subcommand against the container engine. Every handler returns the process
// exit code and reports failures through the printer.
class Cli
{
public:
    Cli(Printer &printer, engine::Engine &engine, std::string defaultCommand);
    Cli(const Cli &) = delete;
    Cli &operator=(const Cli &) = delete;

    int init(const InitOptions &options);
    int open(const OpenOptions &options);
    int resume(const ResumeOptions &options);
    int remove(const RemoveOptions &options);

    // The run invocation for a canonical host directory.
    static engine::RunOption makeRunOption(const std::filesystem::path &canonicalDir,
                                           const std::string &container,
                                           const std::string &command,
                                           bool keepContainer,
                                           bool noNetwork);

private:
    utils::error::Result<void> doInit(const InitOptions &options);
    utils::error::Result<void> doOpen(const OpenOptions &options);
    utils::error::Result<void> doResume(const ResumeOptions &options);
    utils::error::Result<std::string> doRemove(const RemoveOptions &options);

    int report(utils::error::Result<void> result);

    Printer &printer;
    engine::Engine &engine;
    std::string defaultCommand;
};

} // namespace safecrate::cli
