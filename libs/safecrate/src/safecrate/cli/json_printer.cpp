/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#include "safecrate/cli/json_printer.h"

#include "safecrate/cli/messages.h"

#include <nlohmann/json.hpp>

#include <string>

namespace safecrate::cli {

namespace {

// paths are arbitrary bytes, invalid UTF-8 is replaced instead of thrown
std::string dump(const nlohmann::json &json)
{
    return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace

void JSONPrinter::printErr(const utils::error::Error &error)
{
    err << dump(nlohmann::json{ { "code", error.code() }, { "message", error.message() } })
        << std::endl;
}

void JSONPrinter::printImageBuilt(const std::string &image)
{
    out << dump(nlohmann::json{
      { "image", image },
      { "warning", std::string{ messages::IsolationWarning } + " " + messages::IsolationAdvice },
    }) << std::endl;
}

void JSONPrinter::printContainerRemoved(const std::string &container)
{
    out << dump(nlohmann::json{ { "removed", container } }) << std::endl;
}

void JSONPrinter::printVersion(const std::string &version)
{
    out << dump(nlohmann::json{ { "version", version } }) << std::endl;
}

} // namespace safecrate::cli
