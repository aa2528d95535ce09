/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "safecrate/cli/printer.h"

#include <iostream>

namespace safecrate::cli {

// One JSON object per line, errors go to the error stream.
class JSONPrinter : public Printer
{
public:
    explicit JSONPrinter(std::ostream &out = std::cout, std::ostream &err = std::cerr)
        : out(out)
        , err(err)
    {
    }

    void printErr(const utils::error::Error &) override;
    void printImageBuilt(const std::string &image) override;
    void printContainerRemoved(const std::string &container) override;
    void printVersion(const std::string &version) override;

private:
    std::ostream &out;
    std::ostream &err;
};

} // namespace safecrate::cli
