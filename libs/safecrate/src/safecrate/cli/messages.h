/*
 * SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

namespace safecrate::cli::messages {

inline constexpr const char *IsolationWarning =
  "Running untrusted code in a container is NOT 100% secure.";
inline constexpr const char *IsolationAdvice =
  "Container escape is still possible. For maximum safety, run inside a full VM "
  "(e.g., VMWare, VirtualBox, QEMU).";
inline constexpr const char *NothingToResume =
  "No existing container to resume. Run `safecrate open` first with --keep-container.";

} // namespace safecrate::cli::messages
