// SPDX-FileCopyrightText: 2024 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "safecrate/utils/cmd.h"
#include "safecrate/utils/error/error.h"

#include <functional>
#include <string>
#include <vector>

class MockCommand : public safecrate::utils::Cmd
{
public:
    explicit MockCommand(const std::string &command)
        : Cmd(command)
    {
    }

    // mock exec
    std::function<safecrate::utils::error::Result<std::string>(const std::vector<std::string> &)>
      wrapExecFunc;

    safecrate::utils::error::Result<std::string>
    exec(const std::vector<std::string> &args) noexcept override
    {
        return wrapExecFunc ? wrapExecFunc(args) : Cmd::exec(args);
    }

    // mock run
    std::function<safecrate::utils::error::Result<int>(const std::vector<std::string> &)>
      wrapRunFunc;

    safecrate::utils::error::Result<int> run(const std::vector<std::string> &args) noexcept override
    {
        return wrapRunFunc ? wrapRunFunc(args) : Cmd::run(args);
    }

    // mock exists
    std::function<bool()> wrapExistsFunc;

    bool exists() noexcept override { return wrapExistsFunc ? wrapExistsFunc() : Cmd::exists(); }
};
