/*
 * SPDX-FileCopyrightText: 2022 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include <gmock/gmock.h>

#include "safecrate/cli/printer.h"

namespace safecrate::cli::test {

class MockPrinter : public Printer
{
public:
    MOCK_METHOD(void, printErr, (const utils::error::Error &), (override));
    MOCK_METHOD(void, printImageBuilt, (const std::string &), (override));
    MOCK_METHOD(void, printContainerRemoved, (const std::string &), (override));
    MOCK_METHOD(void, printVersion, (const std::string &), (override));
};

} // namespace safecrate::cli::test
