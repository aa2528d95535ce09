// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "safecrate/cli/cli.h"
#include "safecrate/engine/docker_cli.h"
#include "safecrate/mocks/command_mock.h"

#include <memory>
#include <string>
#include <vector>

using namespace safecrate;
using safecrate::utils::error::ErrorCode;
using safecrate::utils::error::Result;
using ::testing::ElementsAre;
using ::testing::Not;
using ::testing::Contains;

namespace {

using Args = std::vector<std::string>;

class DockerCLITest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        auto cmd = std::make_unique<MockCommand>("docker");
        command = cmd.get();
        command->wrapExistsFunc = []() {
            return true;
        };

        auto ret = engine::DockerCLI::New(std::move(cmd));
        ASSERT_TRUE(ret.has_value()) << ret.error().message();
        docker = std::move(*ret);
    }

    MockCommand *command{ nullptr };
    std::unique_ptr<engine::DockerCLI> docker;
};

TEST(DockerCLI, MissingEngine)
{
    auto cmd = std::make_unique<MockCommand>("podman");
    cmd->wrapExistsFunc = []() {
        return false;
    };

    auto ret = engine::DockerCLI::New(std::move(cmd));
    ASSERT_FALSE(ret.has_value());
    EXPECT_EQ(ret.error().code(), static_cast<int>(ErrorCode::EngineNotFound));
    EXPECT_EQ(ret.error().message(),
              "Failed to execute podman command. Is podman installed and running?");
}

TEST(DockerCLI, BuildArguments)
{
    engine::BuildOption option;
    option.tag = "safecrate_default";
    option.file = "/tmp/Dockerfile.safecrate";

    EXPECT_THAT(engine::DockerCLI::arguments(option),
                ElementsAre("build",
                            "-t",
                            "safecrate_default",
                            "-f",
                            "/tmp/Dockerfile.safecrate",
                            "."));
}

TEST(DockerCLI, OpenArguments)
{
    auto option =
      cli::Cli::makeRunOption("/home/u/proj", "proj_isolated", "ls", false, false);

    EXPECT_THAT(engine::DockerCLI::arguments(option),
                ElementsAre("run",
                            "-it",
                            "--rm",
                            "--name",
                            "proj_isolated",
                            "--network",
                            "bridge",
                            "-v",
                            "/home/u/proj:/workspace",
                            "-w",
                            "/workspace",
                            "safecrate_default",
                            "sh",
                            "-c",
                            "ls"));
}

TEST(DockerCLI, OpenArgumentsKeepContainerWithoutNetwork)
{
    auto option =
      cli::Cli::makeRunOption("/home/u/proj", "proj_isolated", "nvim .", true, true);
    auto args = engine::DockerCLI::arguments(option);

    EXPECT_THAT(args, Not(Contains("--rm")));
    EXPECT_THAT(args, Not(Contains("bridge")));
    EXPECT_THAT(args,
                ElementsAre("run",
                            "-it",
                            "--name",
                            "proj_isolated",
                            "--network",
                            "none",
                            "-v",
                            "/home/u/proj:/workspace",
                            "-w",
                            "/workspace",
                            "safecrate_default",
                            "sh",
                            "-c",
                            "nvim ."));
}

TEST(DockerCLI, ListStartRemoveArguments)
{
    engine::ListOption list;
    list.all = true;
    list.filters = { "name=proj_isolated" };
    list.format = "{{.Names}}";
    EXPECT_THAT(engine::DockerCLI::arguments(list),
                ElementsAre("ps", "-a", "--filter", "name=proj_isolated", "--format", "{{.Names}}"));

    engine::StartOption start;
    start.attach = true;
    start.interactive = true;
    EXPECT_THAT(engine::DockerCLI::arguments("proj_isolated", start),
                ElementsAre("start", "-ai", "proj_isolated"));

    EXPECT_THAT(engine::DockerCLI::arguments("proj_isolated", engine::RemoveOption{}),
                ElementsAre("rm", "proj_isolated"));

    engine::RemoveOption force;
    force.force = true;
    EXPECT_THAT(engine::DockerCLI::arguments("proj_isolated", force),
                ElementsAre("rm", "-f", "proj_isolated"));
}

TEST_F(DockerCLITest, RunPassesArgumentsToEngine)
{
    Args seen;
    command->wrapRunFunc = [&seen](const Args &args) -> Result<int> {
        seen = args;
        return 0;
    };

    engine::RemoveOption option;
    option.force = true;
    auto ret = docker->remove("proj_isolated", option);
    ASSERT_TRUE(ret.has_value()) << ret.error().message();
    EXPECT_THAT(seen, ElementsAre("rm", "-f", "proj_isolated"));
}

TEST_F(DockerCLITest, NonZeroExitStatus)
{
    command->wrapRunFunc = [](const Args &) -> Result<int> {
        return 125;
    };

    auto ret = docker->start("proj_isolated", engine::StartOption{});
    ASSERT_FALSE(ret.has_value());
    EXPECT_EQ(ret.error().code(), static_cast<int>(ErrorCode::EngineCommandFailed));
    EXPECT_EQ(ret.error().message(),
              "Failed to resume container. docker command exited with non-zero status (125).");
}

TEST_F(DockerCLITest, EngineCannotBeExecuted)
{
    command->wrapRunFunc = [](const Args &) -> Result<int> {
        SAFECRATE_TRACE("run docker");
        return SAFECRATE_ERR("command not found: docker");
    };

    auto ret = docker->build(engine::BuildOption{});
    ASSERT_FALSE(ret.has_value());
    EXPECT_EQ(ret.error().code(), static_cast<int>(ErrorCode::EngineNotFound));
}

TEST_F(DockerCLITest, ListParsesNames)
{
    Args seen;
    command->wrapExecFunc = [&seen](const Args &args) -> Result<std::string> {
        seen = args;
        return std::string{ "proj_isolated\nproj_isolated_old\n\n" };
    };

    engine::ListOption option;
    option.all = true;
    option.filters = { "name=proj_isolated" };
    auto ret = docker->list(option);
    ASSERT_TRUE(ret.has_value()) << ret.error().message();
    EXPECT_THAT(*ret, ElementsAre("proj_isolated", "proj_isolated_old"));
    EXPECT_THAT(seen, ElementsAre("ps", "-a", "--filter", "name=proj_isolated"));
}

TEST_F(DockerCLITest, ListFailure)
{
    command->wrapExecFunc = [](const Args &) -> Result<std::string> {
        SAFECRATE_TRACE("exec docker ps");
        return SAFECRATE_ERR("Cannot connect to the Docker daemon", 1);
    };

    auto ret = docker->list(engine::ListOption{});
    ASSERT_FALSE(ret.has_value());
    EXPECT_EQ(ret.error().code(), static_cast<int>(ErrorCode::EngineCommandFailed));
}

} // namespace
