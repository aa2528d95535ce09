/*
 * SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */
#pragma once

#include "safecrate/utils/error/error.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace safecrate::config {

// $XDG_CONFIG_HOME/safecrate/config.json, for example:
// {
//     "engine": "podman",
//     "defaultCommand": "hx ."
// }
struct Config
{
    std::optional<std::string> engine;
    std::optional<std::string> defaultCommand;
};

void from_json(const nlohmann::json &json, Config &config);

utils::error::Result<Config> loadConfig(const std::filesystem::path &path) noexcept;

// An absent file yields an empty Config.
utils::error::Result<Config> loadUserConfig() noexcept;

// SAFECRATE_ENGINE > config "engine" > built-in default.
std::string resolveEngine(const Config &config) noexcept;

std::string resolveDefaultCommand(const Config &config) noexcept;

} // namespace safecrate::config
