/*
 * SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "safecrate/engine/options.h"
#include "safecrate/utils/error/error.h"

#include <string>
#include <vector>

namespace safecrate::engine {

// A container engine driven through its command line. Every call is one blocking
// request/response cycle; the engine owns all container state.
class Engine
{
public:
    Engine() = default;
    Engine(const Engine &) = delete;
    Engine(Engine &&) = delete;
    Engine &operator=(const Engine &) = delete;
    Engine &operator=(Engine &&) = delete;
    virtual ~Engine() = default;

    virtual utils::error::Result<void> build(const BuildOption &option) noexcept = 0;

    // Runs a new container attached to the current terminal.
    virtual utils::error::Result<void> run(const RunOption &option) noexcept = 0;

    // Returns one entry per container, as printed by the engine.
    virtual utils::error::Result<std::vector<std::string>>
    list(const ListOption &option) noexcept = 0;

    virtual utils::error::Result<void> start(const std::string &container,
                                             const StartOption &option) noexcept = 0;

    virtual utils::error::Result<void> remove(const std::string &container,
                                              const RemoveOption &option) noexcept = 0;
};

} // namespace safecrate::engine
