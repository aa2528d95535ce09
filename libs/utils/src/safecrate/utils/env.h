/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include <optional>
#include <string>

namespace safecrate::utils {

// Sets an environment variable for the lifetime of the guard and restores
// (or unsets) the previous value on destruction.
class EnvironmentVariableGuard
{
public:
    EnvironmentVariableGuard(std::string variableName, const std::string &newValue);
    ~EnvironmentVariableGuard();

    EnvironmentVariableGuard(const EnvironmentVariableGuard &) = delete;
    EnvironmentVariableGuard &operator=(const EnvironmentVariableGuard &) = delete;
    EnvironmentVariableGuard(EnvironmentVariableGuard &&) = delete;
    EnvironmentVariableGuard &operator=(EnvironmentVariableGuard &&) = delete;

private:
    std::optional<std::string> getOriginalValue() const;
    void restoreOriginalValue();

    std::string m_variableName;
    std::optional<std::string> m_originalValue;
};

// Returns the value of an environment variable, or nullopt when unset or empty.
std::optional<std::string> getEnv(const char *name) noexcept;

} // namespace safecrate::utils
