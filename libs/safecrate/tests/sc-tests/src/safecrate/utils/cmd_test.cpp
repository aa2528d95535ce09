// SPDX-FileCopyrightText: 2024 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include <gtest/gtest.h>

#include "safecrate/utils/cmd.h"
#include "safecrate/utils/env.h"

#include <csignal>

#include <unistd.h>

namespace {

TEST(command, Exec)
{
    auto ret = safecrate::utils::Cmd("echo").exec({ "-n", "hello" });
    ASSERT_TRUE(ret);
    EXPECT_EQ(ret->size(), 5);
    EXPECT_EQ(*ret, "hello");
    auto userId = safecrate::utils::Cmd("id").exec({ "-u" });
    ASSERT_TRUE(userId.has_value());

    userId = userId->substr(0, userId->find('\n'));
    EXPECT_EQ(*userId, std::to_string(getuid()));

    auto ret3 = safecrate::utils::Cmd("safecrate-nonexistent").exec();
    EXPECT_FALSE(ret3.has_value());

    auto ret4 = safecrate::utils::Cmd("ls").exec({ "/safecrate/nonexistent" });
    ASSERT_FALSE(ret4.has_value());
    EXPECT_NE(ret4.error().code(), 0);
}

TEST(command, Exists)
{
    EXPECT_TRUE(safecrate::utils::Cmd("sh").exists());
    EXPECT_TRUE(safecrate::utils::Cmd("/bin/sh").exists());
    EXPECT_FALSE(safecrate::utils::Cmd("safecrate-nonexistent").exists());
    EXPECT_FALSE(safecrate::utils::Cmd("/safecrate/nonexistent/sh").exists());
}

TEST(command, Run)
{
    auto ret = safecrate::utils::Cmd("sh").run({ "-c", "exit 0" });
    ASSERT_TRUE(ret.has_value()) << ret.error().message();
    EXPECT_EQ(*ret, 0);

    // a non-zero exit status is a value, not an error
    ret = safecrate::utils::Cmd("sh").run({ "-c", "exit 3" });
    ASSERT_TRUE(ret.has_value()) << ret.error().message();
    EXPECT_EQ(*ret, 3);

    ret = safecrate::utils::Cmd("sh").run({ "-c", "kill -TERM $$" });
    ASSERT_TRUE(ret.has_value()) << ret.error().message();
    EXPECT_EQ(*ret, 128 + SIGTERM);

    ret = safecrate::utils::Cmd("safecrate-nonexistent").run();
    EXPECT_FALSE(ret.has_value());
}

TEST(command, InheritsEnvironment)
{
    safecrate::utils::EnvironmentVariableGuard guard("SAFECRATE_TEST_ENGINE_ENV", "inherited");

    auto ret = safecrate::utils::Cmd("sh").exec({ "-c", "printf %s \"$SAFECRATE_TEST_ENGINE_ENV\"" });
    ASSERT_TRUE(ret.has_value()) << ret.error().message();
    EXPECT_EQ(*ret, "inherited");
}

} // namespace
