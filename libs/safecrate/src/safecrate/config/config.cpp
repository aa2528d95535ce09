/*
 * SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#include "safecrate/config/config.h"

#include "configure.h"
#include "safecrate/common/dir.h"
#include "safecrate/utils/env.h"
#include "safecrate/utils/log/log.h"
#include "safecrate/utils/serialize/json.h"

#include <fmt/format.h>

#include <stdexcept>
#include <system_error>

namespace safecrate::config {

using utils::error::ErrorCode;

namespace {

std::optional<std::string> optionalString(const nlohmann::json &json, const char *key)
{
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return std::nullopt;
    }

    auto value = it->get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }

    return value;
}

} // namespace

void from_json(const nlohmann::json &json, Config &config)
{
    if (!json.is_object()) {
        throw std::invalid_argument("config must be a JSON object");
    }

    config.engine = optionalString(json, "engine");
    config.defaultCommand = optionalString(json, "defaultCommand");
}

utils::error::Result<Config> loadConfig(const std::filesystem::path &path) noexcept
{
    SAFECRATE_TRACE("load config from " + path.string());

    auto result = utils::serialize::LoadJSONFile<Config>(path);
    if (!result) {
        return SAFECRATE_ERR(fmt::format("Invalid config file {}: {}",
                                         path.string(),
                                         result.error().message()),
                             ErrorCode::InvalidConfig);
    }

    return result;
}

utils::error::Result<Config> loadUserConfig() noexcept
{
    SAFECRATE_TRACE("load user config");

    auto configDir = common::dir::getUserConfigDir();
    if (configDir.empty()) {
        return Config{};
    }

    auto configPath = configDir / "config.json";
    std::error_code ec;
    if (!std::filesystem::exists(configPath, ec)) {
        LogD("no user config at {}", configPath.string());
        return Config{};
    }

    auto config = loadConfig(configPath);
    if (!config) {
        return SAFECRATE_ERR(config);
    }

    return config;
}

std::string resolveEngine(const Config &config) noexcept
{
    if (auto env = utils::getEnv("SAFECRATE_ENGINE")) {
        return *env;
    }

    return config.engine.value_or(SAFECRATE_DEFAULT_ENGINE);
}

std::string resolveDefaultCommand(const Config &config) noexcept
{
    return config.defaultCommand.value_or(SAFECRATE_DEFAULT_COMMAND);
}

} // namespace safecrate::config
