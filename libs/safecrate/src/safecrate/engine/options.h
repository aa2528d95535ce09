/*
 * SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace safecrate::engine {

struct BuildOption
{
    std::string tag;
    std::filesystem::path file;
    std::filesystem::path context{ "." };
};

struct Mount
{
    std::string source;
    std::string destination;
};

struct RunOption
{
    std::string name;
    std::string image;
    bool interactive{ true };
    bool tty{ true };
    bool removeOnExit{ true };
    std::optional<std::string> network;
    std::vector<Mount> volumes;
    std::optional<std::string> workdir;
    std::vector<std::string> command;
};

struct ListOption
{
    bool all{ false };
    std::vector<std::string> filters;
    std::optional<std::string> format;
};

struct StartOption
{
    bool attach{ false };
    bool interactive{ false };
};

struct RemoveOption
{
    bool force{ false };
};

} // namespace safecrate::engine
