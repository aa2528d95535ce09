/*
 * SPDX-FileCopyrightText: 2022 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "safecrate/utils/error/error.h"

#include <string>

namespace safecrate::cli {

class Printer
{
public:
    Printer() = default;
    Printer(const Printer &) = delete;
    Printer(Printer &&) = delete;
    Printer &operator=(const Printer &) = delete;
    Printer &operator=(Printer &&) = delete;
    virtual ~Printer() = default;

    virtual void printErr(const utils::error::Error &) = 0;
    virtual void printImageBuilt(const std::string &image) = 0;
    virtual void printContainerRemoved(const std::string &container) = 0;
    virtual void printVersion(const std::string &version) = 0;
};

} // namespace safecrate::cli
