// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include <filesystem>

namespace safecrate::common::xdg {

std::filesystem::path getXDGConfigHomeDir() noexcept;

} // namespace safecrate::common::xdg
