/*
 * SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#include "safecrate/cli/command_line.h"

#include "configure.h"
#include "safecrate/utils/log/log.h"

#include <algorithm>
#include <string>

namespace safecrate::cli {

namespace {

// Validator for string inputs
CLI::Validator validatorString{
    [](const std::string &parameter) {
        if (parameter.empty()) {
            return std::string{ "Input parameter is empty, please input valid parameter instead" };
        }
        return std::string();
    },
    ""
};

} // namespace

void addInitCommand(CLI::App &commandParser, InitOptions &initOptions)
{
    auto *cliInit = commandParser.add_subcommand("init", "Initialize a safecrate base image");
    cliInit
      ->add_option("--dockerfile", initOptions.dockerfile, "Custom Dockerfile (overrides default)")
      ->type_name("PATH")
      ->check(CLI::ExistingFile);
    cliInit->usage(R"(Usage: safecrate init [OPTIONS]

Example:
# build the base image from the bundled template
safecrate init
# build the base image from your own Dockerfile
safecrate init --dockerfile ./Dockerfile)");
}

void addOpenCommand(CLI::App &commandParser, OpenOptions &openOptions)
{
    auto *cliOpen = commandParser.add_subcommand("open", "Open a directory in an isolated container");
    cliOpen->add_option("DIR", openOptions.dir, "Directory to open")
      ->required()
      ->check(validatorString);
    cliOpen
      ->add_option("--cmd",
                   openOptions.command,
                   "Command to run inside container (default: " SAFECRATE_DEFAULT_COMMAND ")")
      ->type_name("COMMAND")
      ->check(validatorString);
    cliOpen->add_flag("--keep-container",
                      openOptions.keepContainer,
                      "Do not remove container after exit");
    cliOpen->add_flag("--no-network", openOptions.noNetwork, "Disable network");
    cliOpen->usage(R"(Usage: safecrate open [OPTIONS] DIR

Example:
# browse a repository with the default editor
safecrate open ./untrusted-repo
# run a build offline and keep the container for later
safecrate open ./untrusted-repo --cmd "cargo build" --no-network --keep-container)");
}

void addResumeCommand(CLI::App &commandParser, ResumeOptions &resumeOptions)
{
    auto *cliResume =
      commandParser.add_subcommand("resume", "Open a previously created container");
    cliResume
      ->add_option("DIR", resumeOptions.dir, "Project directory to resume container for")
      ->required()
      ->check(validatorString);
}

void addRemoveCommand(CLI::App &commandParser, RemoveOptions &removeOptions)
{
    auto *cliRemove =
      commandParser.add_subcommand("remove", "Remove a previously created container");
    cliRemove
      ->add_option("DIR", removeOptions.dir, "Project directory whose container to remove")
      ->required()
      ->check(validatorString);
    cliRemove->add_flag("--force", removeOptions.force, "Force remove even if running");
}

void buildCommandLine(CLI::App &commandParser, CommandOptions &options)
{
    commandParser.name("safecrate");
    commandParser.usage("Usage: safecrate [OPTIONS] SUBCOMMAND");

    commandParser.add_flag("--version", options.global.version, "Show version");
    commandParser.add_flag("--json", options.global.json, "Use json format to output result");
    commandParser.add_flag("-v,--verbose",
                           options.global.verbose,
                           "Show debug info (verbose logs)");

    addInitCommand(commandParser, options.init);
    addOpenCommand(commandParser, options.open);
    addResumeCommand(commandParser, options.resume);
    addRemoveCommand(commandParser, options.remove);

    commandParser.require_subcommand(0, 1);
}

void applyGlobalOptions(const GlobalOptions &options) noexcept
{
    if (options.verbose) {
        utils::log::setLogLevel(utils::log::LogLevel::Debug);
    }
}

CLI::App *parsedSubcommand(const CLI::App &commandParser)
{
    const auto &commands = commandParser.get_subcommands();
    auto ret = std::find_if(commands.begin(), commands.end(), [](CLI::App *app) {
        return app->parsed();
    });
    if (ret == commands.end()) {
        return nullptr;
    }

    return *ret;
}

int reportMissingSubcommand(const CLI::App &commandParser, std::ostream &err)
{
    err << commandParser.help() << std::endl;
    return -1;
}

int dispatch(const CLI::App &subcommand, const CommandOptions &options, Cli &cli)
{
    const auto &name = subcommand.get_name();
    if (name == "init") {
        return cli.init(options.init);
    }
    if (name == "open") {
        return cli.open(options.open);
    }
    if (name == "resume") {
        return cli.resume(options.resume);
    }
    if (name == "remove") {
        return cli.remove(options.remove);
    }

    LogE("unknown subcommand {}", name);
    return -1;
}

} // namespace safecrate::cli
