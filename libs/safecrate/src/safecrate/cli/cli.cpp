/*
 * SPDX-FileCopyrightText: 2022 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#include "safecrate/cli/cli.h"

#include "configure.h"
#include "safecrate/assets/template.h"
#include "safecrate/cli/messages.h"
#include "safecrate/common/dir.h"
#include "safecrate/container/naming.h"
#include "safecrate/utils/log/log.h"

#include <fmt/format.h>

#include <algorithm>
#include <system_error>

namespace safecrate::cli {

using utils::error::ErrorCode;

Cli::Cli(Printer &printer, engine::Engine &engine, std::string defaultCommand)
    : printer(printer)
    , engine(engine)
    , defaultCommand(std::move(defaultCommand))
{
}

engine::RunOption Cli::makeRunOption(const std::filesystem::path &canonicalDir,
                                     const std::string &container,
                                     const std::string &command,
                                     bool keepContainer,
                                     bool noNetwork)
{
    engine::RunOption option;
    option.name = container;
    option.image = SAFECRATE_IMAGE_NAME;
    option.interactive = true;
    option.tty = true;
    option.removeOnExit = !keepContainer;
    // omitting --network would still attach the engine default bridge
    option.network = noNetwork ? "none" : "bridge";
    option.volumes.push_back({ canonicalDir.string(), SAFECRATE_WORKSPACE_DIR });
    option.workdir = SAFECRATE_WORKSPACE_DIR;
    option.command = { "sh", "-c", command };
    return option;
}

int Cli::report(utils::error::Result<void> result)
{
    if (!result) {
        LogD("command failed: {}", result.error());
        printer.printErr(result.error());
        return -1;
    }

    return 0;
}

int Cli::init(const InitOptions &options)
{
    auto ret = doInit(options);
    if (!ret) {
        return report(std::move(ret));
    }

    printer.printImageBuilt(SAFECRATE_IMAGE_NAME);
    return 0;
}

int Cli::open(const OpenOptions &options)
{
    return report(doOpen(options));
}

int Cli::resume(const ResumeOptions &options)
{
    return report(doResume(options));
}

int Cli::remove(const RemoveOptions &options)
{
    auto container = doRemove(options);
    if (!container) {
        printer.printErr(container.error());
        return -1;
    }

    printer.printContainerRemoved(*container);
    return 0;
}

utils::error::Result<void> Cli::doInit(const InitOptions &options)
{
    SAFECRATE_TRACE("build base image");

    std::filesystem::path dockerfile;
    if (options.dockerfile) {
        dockerfile = *options.dockerfile;
        std::error_code ec;
        if (!std::filesystem::is_regular_file(dockerfile, ec)) {
            return SAFECRATE_ERR(fmt::format("Dockerfile {} does not exist", dockerfile.string()),
                                 ErrorCode::TemplateNotFound);
        }
    } else {
        dockerfile = common::dir::getDefaultTemplatePath();
        auto ret = assets::writeDefaultDockerfile(dockerfile);
        if (!ret) {
            return SAFECRATE_ERR(ret);
        }
    }

    engine::BuildOption option;
    option.tag = SAFECRATE_IMAGE_NAME;
    option.file = dockerfile;
    option.context = ".";

    LogI("building image {} from {}", option.tag, dockerfile.string());
    auto ret = engine.build(option);
    if (!ret) {
        return SAFECRATE_ERR(ret);
    }

    return SAFECRATE_OK;
}

utils::error::Result<void> Cli::doOpen(const OpenOptions &options)
{
    SAFECRATE_TRACE("open " + options.dir);

    auto dir = container::canonicalDirectory(options.dir);
    if (!dir) {
        return SAFECRATE_ERR(dir);
    }

    auto name = container::nameFromCanonicalPath(*dir);
    if (!name) {
        return SAFECRATE_ERR(name);
    }

    auto option = makeRunOption(*dir,
                                *name,
                                options.command.value_or(defaultCommand),
                                options.keepContainer,
                                options.noNetwork);

    LogI("opening {} in container {}", dir->string(), *name);
    auto ret = engine.run(option);
    if (!ret) {
        return SAFECRATE_ERR(ret);
    }

    return SAFECRATE_OK;
}

utils::error::Result<void> Cli::doResume(const ResumeOptions &options)
{
    SAFECRATE_TRACE("resume " + options.dir);

    auto name = container::containerName(options.dir);
    if (!name) {
        return SAFECRATE_ERR(name);
    }

    engine::ListOption listOption;
    listOption.all = true;
    listOption.filters = { "name=" + *name };
    listOption.format = "{{.Names}}";

    auto containers = engine.list(listOption);
    if (!containers) {
        return SAFECRATE_ERR(containers);
    }

    // the engine's name filter matches substrings, only an exact name counts
    auto found = std::find(containers->begin(), containers->end(), *name) != containers->end();
    if (!found) {
        return SAFECRATE_ERR(messages::NothingToResume, ErrorCode::NoContainerToResume);
    }

    engine::StartOption startOption;
    startOption.attach = true;
    startOption.interactive = true;

    LogI("resuming container {}", *name);
    auto ret = engine.start(*name, startOption);
    if (!ret) {
        return SAFECRATE_ERR(ret);
    }

    return SAFECRATE_OK;
}

utils::error::Result<std::string> Cli::doRemove(const RemoveOptions &options)
{
    SAFECRATE_TRACE("remove " + options.dir);

    auto name = container::containerName(options.dir);
    if (!name) {
        return SAFECRATE_ERR(name);
    }

    engine::RemoveOption option;
    option.force = options.force;

    auto ret = engine.remove(*name, option);
    if (!ret) {
        return SAFECRATE_ERR(ret);
    }

    return name;
}

} // namespace safecrate::cli
