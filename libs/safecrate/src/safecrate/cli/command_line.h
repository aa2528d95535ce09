/*
 * SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "safecrate/cli/cli.h"

#include <CLI/CLI.hpp>

#include <iostream>

namespace safecrate::cli {

struct CommandOptions
{
    GlobalOptions global;
    InitOptions init;
    OpenOptions open;
    ResumeOptions resume;
    RemoveOptions remove;
};

void addInitCommand(CLI::App &commandParser, InitOptions &initOptions);
void addOpenCommand(CLI::App &commandParser, OpenOptions &openOptions);
void addResumeCommand(CLI::App &commandParser, ResumeOptions &resumeOptions);
void addRemoveCommand(CLI::App &commandParser, RemoveOptions &removeOptions);

// Registers the global flags and every subcommand. At most one subcommand is accepted.
void buildCommandLine(CLI::App &commandParser, CommandOptions &options);

// --verbose switches the logger to debug level.
void applyGlobalOptions(const GlobalOptions &options) noexcept;

// The subcommand given on the command line, nullptr if there is none.
CLI::App *parsedSubcommand(const CLI::App &commandParser);

// Prints the help text to err and returns the exit code for a run without subcommand.
int reportMissingSubcommand(const CLI::App &commandParser, std::ostream &err = std::cerr);

// Runs the handler of a parsed subcommand.
int dispatch(const CLI::App &subcommand, const CommandOptions &options, Cli &cli);

} // namespace safecrate::cli
