/*
 * SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "safecrate/engine/engine.h"
#include "safecrate/utils/cmd.h"

#include <memory>
#include <string>
#include <vector>

namespace safecrate::engine {

// Drives docker, or any engine with a docker compatible command line such as podman.
class DockerCLI : public Engine
{
public:
    static utils::error::Result<std::unique_ptr<DockerCLI>>
    New(std::unique_ptr<utils::Cmd> cmd) noexcept;

    [[nodiscard]] const std::string &bin() const noexcept { return m_cmd->command(); }

    utils::error::Result<void> build(const BuildOption &option) noexcept override;
    utils::error::Result<void> run(const RunOption &option) noexcept override;
    utils::error::Result<std::vector<std::string>>
    list(const ListOption &option) noexcept override;
    utils::error::Result<void> start(const std::string &container,
                                     const StartOption &option) noexcept override;
    utils::error::Result<void> remove(const std::string &container,
                                      const RemoveOption &option) noexcept override;

    [[nodiscard]] static std::vector<std::string> arguments(const BuildOption &option);
    [[nodiscard]] static std::vector<std::string> arguments(const RunOption &option);
    [[nodiscard]] static std::vector<std::string> arguments(const ListOption &option);
    [[nodiscard]] static std::vector<std::string> arguments(const std::string &container,
                                                            const StartOption &option);
    [[nodiscard]] static std::vector<std::string> arguments(const std::string &container,
                                                            const RemoveOption &option);

private:
    explicit DockerCLI(std::unique_ptr<utils::Cmd> cmd) noexcept;

    utils::error::Result<void> runAttached(const std::vector<std::string> &args,
                                           const std::string &failure) noexcept;

    std::unique_ptr<utils::Cmd> m_cmd;
};

} // namespace safecrate::engine
