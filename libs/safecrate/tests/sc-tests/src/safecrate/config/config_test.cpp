// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include <gtest/gtest.h>

#include "common/tempdir.h"
#include "safecrate/config/config.h"
#include "safecrate/utils/env.h"

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

using namespace safecrate;
using safecrate::utils::EnvironmentVariableGuard;
using safecrate::utils::error::ErrorCode;

namespace {

class ConfigTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(tmp.isValid());
        configHome = std::make_unique<EnvironmentVariableGuard>("XDG_CONFIG_HOME",
                                                                tmp.path().string());
        engineEnv = std::make_unique<EnvironmentVariableGuard>("SAFECRATE_ENGINE", "");
    }

    void TearDown() override
    {
        engineEnv.reset();
        configHome.reset();
    }

    void writeConfig(const std::string &content)
    {
        auto dir = tmp.path() / "safecrate";
        std::filesystem::create_directories(dir);
        std::ofstream file(dir / "config.json");
        file << content;
    }

    TempDir tmp;
    std::unique_ptr<EnvironmentVariableGuard> configHome;
    std::unique_ptr<EnvironmentVariableGuard> engineEnv;
};

TEST_F(ConfigTest, MissingFileYieldsDefaults)
{
    auto loaded = config::loadUserConfig();
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message();
    EXPECT_FALSE(loaded->engine.has_value());
    EXPECT_FALSE(loaded->defaultCommand.has_value());

    EXPECT_EQ(config::resolveEngine(*loaded), "docker");
    EXPECT_EQ(config::resolveDefaultCommand(*loaded), "nvim .");
}

TEST_F(ConfigTest, LoadsUserConfig)
{
    writeConfig(R"({"engine": "podman", "defaultCommand": "hx .", "unknown": true})");

    auto loaded = config::loadUserConfig();
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message();
    EXPECT_EQ(loaded->engine, "podman");
    EXPECT_EQ(loaded->defaultCommand, "hx .");

    EXPECT_EQ(config::resolveEngine(*loaded), "podman");
    EXPECT_EQ(config::resolveDefaultCommand(*loaded), "hx .");
}

TEST_F(ConfigTest, EmptyValuesAreIgnored)
{
    writeConfig(R"({"engine": "", "defaultCommand": null})");

    auto loaded = config::loadUserConfig();
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message();
    EXPECT_EQ(config::resolveEngine(*loaded), "docker");
    EXPECT_EQ(config::resolveDefaultCommand(*loaded), "nvim .");
}

TEST_F(ConfigTest, MalformedFiles)
{
    for (const auto *content : { "{ not json", R"(["podman"])", R"({"engine": 5})" }) {
        writeConfig(content);

        auto loaded = config::loadUserConfig();
        ASSERT_FALSE(loaded.has_value()) << content;
        EXPECT_EQ(loaded.error().code(), static_cast<int>(ErrorCode::InvalidConfig)) << content;
    }
}

TEST_F(ConfigTest, EnvironmentOverridesConfig)
{
    config::Config userConfig;
    userConfig.engine = "podman";

    EnvironmentVariableGuard guard("SAFECRATE_ENGINE", "/usr/local/bin/docker");
    EXPECT_EQ(config::resolveEngine(userConfig), "/usr/local/bin/docker");
}

TEST_F(ConfigTest, LoadConfigFromPath)
{
    auto missing = config::loadConfig(tmp.path() / "nowhere.json");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code(), static_cast<int>(ErrorCode::InvalidConfig));

    auto path = tmp.path() / "custom.json";
    std::ofstream(path) << R"({"defaultCommand": "bash"})";

    auto loaded = config::loadConfig(path);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message();
    EXPECT_FALSE(loaded->engine.has_value());
    EXPECT_EQ(loaded->defaultCommand, "bash");
}

} // namespace
