/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "safecrate/utils/error/error.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace safecrate::utils::serialize {

template <typename T>
error::Result<T> LoadJSON(const std::string &content) noexcept
{
    SAFECRATE_TRACE("load json");

    try {
        auto json = nlohmann::json::parse(content);
        return json.template get<T>();
    } catch (const std::exception &e) {
        return SAFECRATE_ERR(e);
    }
}

template <typename T>
error::Result<T> LoadJSONFile(const std::filesystem::path &filePath) noexcept
{
    SAFECRATE_TRACE("load json from " + filePath.string());

    std::ifstream file(filePath);
    if (!file.is_open()) {
        return SAFECRATE_ERR("failed to open file " + filePath.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.fail()) {
        return SAFECRATE_ERR("failed to read file " + filePath.string());
    }

    auto result = LoadJSON<T>(buffer.str());
    if (!result) {
        return SAFECRATE_ERR(result);
    }

    return result;
}

} // namespace safecrate::utils::serialize
