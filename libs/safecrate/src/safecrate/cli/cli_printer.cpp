/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#include "safecrate/cli/cli_printer.h"

#include "safecrate/cli/messages.h"

namespace safecrate::cli {

void CLIPrinter::printErr(const utils::error::Error &error)
{
    err << "Error: " << error.message() << std::endl;
}

void CLIPrinter::printImageBuilt(const std::string &image)
{
    out << std::endl
        << "Built the base image " << image << "." << std::endl
        << "WARNING: " << messages::IsolationWarning << std::endl
        << "\t" << messages::IsolationAdvice << std::endl
        << std::endl
        << "Usage:" << std::endl
        << "\t$> safecrate open UNTRUSTED_CODE_DIR" << std::endl;
}

void CLIPrinter::printContainerRemoved(const std::string &container)
{
    out << "Removed container " << container << std::endl;
}

void CLIPrinter::printVersion(const std::string &version)
{
    out << "safecrate version " << version << std::endl;
}

} // namespace safecrate::cli
