/*
 * SPDX-FileCopyrightText: 2022 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */
#include "configure.h"
#include "safecrate/cli/cli.h"
#include "safecrate/cli/cli_printer.h"
#include "safecrate/cli/command_line.h"
#include "safecrate/cli/json_printer.h"
#include "safecrate/config/config.h"
#include "safecrate/engine/docker_cli.h"
#include "safecrate/utils/cmd.h"
#include "safecrate/utils/global/initialize.h"
#include "safecrate/utils/log/log.h"

#include <CLI/CLI.hpp>

#include <memory>
#include <string>

using namespace safecrate;
using namespace safecrate::cli;

namespace {

int runCliApplication(int argc, char **argv)
{
    CLI::App commandParser{ "Safely open and run untrusted code in isolated environments." };
    CommandOptions options{};
    buildCommandLine(commandParser, options);

    CLI11_PARSE(commandParser, argc, argv);

    applyGlobalOptions(options.global);

    std::unique_ptr<Printer> printer;
    if (options.global.json) {
        printer = std::make_unique<JSONPrinter>();
    } else {
        printer = std::make_unique<CLIPrinter>();
    }

    if (options.global.version) {
        printer->printVersion(SAFECRATE_VERSION);
        return 0;
    }

    // a subcommand is mandatory unless --version was given
    auto *subcommand = parsedSubcommand(commandParser);
    if (subcommand == nullptr) {
        return reportMissingSubcommand(commandParser);
    }

    auto userConfig = config::loadUserConfig();
    if (!userConfig) {
        printer->printErr(userConfig.error());
        return -1;
    }

    auto engineBin = config::resolveEngine(*userConfig);
    LogD("using container engine {}", engineBin);

    auto dockerCli = engine::DockerCLI::New(std::make_unique<utils::Cmd>(engineBin));
    if (!dockerCli) {
        printer->printErr(dockerCli.error());
        return -1;
    }

    Cli cli(*printer, **dockerCli, config::resolveDefaultCommand(*userConfig));
    return dispatch(*subcommand, options, cli);
}

} // namespace

int main(int argc, char **argv)
{
    utils::global::initSafecrateLogSystem(utils::log::LogBackend::Journal);

    return runCliApplication(argc, argv);
}
