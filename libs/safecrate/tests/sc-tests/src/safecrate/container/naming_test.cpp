// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include <gtest/gtest.h>

#include "common/tempdir.h"
#include "safecrate/container/naming.h"

#include <filesystem>
#include <fstream>

using namespace safecrate;
using safecrate::utils::error::ErrorCode;

TEST(ContainerName, FromCanonicalPath)
{
    auto name = container::nameFromCanonicalPath("/home/u/proj");
    ASSERT_TRUE(name.has_value()) << name.error().message();
    EXPECT_EQ(*name, "proj_isolated");

    name = container::nameFromCanonicalPath("/srv/my.repo-v2");
    ASSERT_TRUE(name.has_value()) << name.error().message();
    EXPECT_EQ(*name, "my.repo-v2_isolated");

    // the suffix is appended even when the directory already carries it
    name = container::nameFromCanonicalPath("/home/u/foo_isolated");
    ASSERT_TRUE(name.has_value()) << name.error().message();
    EXPECT_EQ(*name, "foo_isolated_isolated");
}

TEST(ContainerName, RootHasNoName)
{
    auto name = container::nameFromCanonicalPath("/");
    ASSERT_FALSE(name.has_value());
    EXPECT_EQ(name.error().code(), static_cast<int>(ErrorCode::InvalidDirectory));

    name = container::containerName("/");
    ASSERT_FALSE(name.has_value());
    EXPECT_EQ(name.error().code(), static_cast<int>(ErrorCode::InvalidDirectory));
}

TEST(ContainerName, SpellingsOfTheSameDirectoryAgree)
{
    TempDir tmp;
    ASSERT_TRUE(tmp.isValid());

    auto proj = tmp.path() / "proj";
    ASSERT_TRUE(std::filesystem::create_directories(proj / "sub"));
    std::filesystem::create_directory_symlink(proj, tmp.path() / "link");

    for (const auto &spelling : { proj,
                                  proj / ".",
                                  proj / "sub" / "..",
                                  tmp.path() / "link",
                                  tmp.path() / "link" / "sub" / ".." }) {
        auto name = container::containerName(spelling);
        ASSERT_TRUE(name.has_value()) << spelling << ": " << name.error().message();
        EXPECT_EQ(*name, "proj_isolated") << spelling;
    }

    auto canonical = container::canonicalDirectory(tmp.path() / "link" / ".");
    ASSERT_TRUE(canonical.has_value()) << canonical.error().message();
    EXPECT_EQ(*canonical, proj);
}

TEST(ContainerName, MissingDirectory)
{
    TempDir tmp;
    ASSERT_TRUE(tmp.isValid());

    auto name = container::containerName(tmp.path() / "does-not-exist");
    ASSERT_FALSE(name.has_value());
    EXPECT_EQ(name.error().code(), static_cast<int>(ErrorCode::InvalidDirectory));
}

TEST(ContainerName, RegularFileIsRejected)
{
    TempDir tmp;
    ASSERT_TRUE(tmp.isValid());

    auto file = tmp.path() / "notes.txt";
    std::ofstream(file) << "not a directory";

    auto name = container::containerName(file);
    ASSERT_FALSE(name.has_value());
    EXPECT_EQ(name.error().code(), static_cast<int>(ErrorCode::InvalidDirectory));
}
