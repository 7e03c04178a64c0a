/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <gtest/gtest.h>
#include <path_normalizer.h>

#include "test_fakes.h"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using namespace AppLauncher;

class PathNormalizerTest : public ::testing::Test
{
protected:
    fs::path m_test_dir;
    fs::path m_canonical_dir;
    FakePlatform m_platform;

    void SetUp() override
    {
        m_test_dir = fs::temp_directory_path() / "app_launcher_test_normalizer";
        fs::remove_all(m_test_dir);
        fs::create_directories(m_test_dir);
        m_canonical_dir = fs::canonical(m_test_dir);

        m_platform.m_home = m_test_dir / "home";
        m_platform.m_env["HOME"] = (m_test_dir / "home").string();
        m_platform.m_env["APPNAME"] = "editor";
        fs::create_directories(m_test_dir / "home");
    }

    void TearDown() override
    {
        fs::remove_all(m_test_dir);
    }
};

// ============================================================================
// Environment variable expansion
// ============================================================================

TEST_F(PathNormalizerTest, ExpandsAllVariableForms)
{
    EXPECT_EQ(ExpandEnvironmentVariables("/a/$APPNAME/b", m_platform), "/a/editor/b");
    EXPECT_EQ(ExpandEnvironmentVariables("/a/${APPNAME}x", m_platform), "/a/editorx");
    EXPECT_EQ(ExpandEnvironmentVariables("/a/%APPNAME%/b", m_platform), "/a/editor/b");
}

TEST_F(PathNormalizerTest, UndefinedVariablesLeftVerbatim)
{
    EXPECT_EQ(ExpandEnvironmentVariables("/a/$UNDEFINED_VAR/b", m_platform), "/a/$UNDEFINED_VAR/b");
    EXPECT_EQ(ExpandEnvironmentVariables("/a/${UNDEFINED_VAR}/b", m_platform), "/a/${UNDEFINED_VAR}/b");
    EXPECT_EQ(ExpandEnvironmentVariables("/a/%UNDEFINED_VAR%/b", m_platform), "/a/%UNDEFINED_VAR%/b");
}

TEST_F(PathNormalizerTest, LoneDollarAndPercent)
{
    EXPECT_EQ(ExpandEnvironmentVariables("/cost$", m_platform), "/cost$");
    EXPECT_EQ(ExpandEnvironmentVariables("/100%", m_platform), "/100%");
}

// ============================================================================
// Home directory expansion
// ============================================================================

TEST_F(PathNormalizerTest, ExpandsTilde)
{
    std::string home = (m_test_dir / "home").string();

    EXPECT_EQ(ExpandHomeDirectory("~", m_platform), home);
    EXPECT_EQ(ExpandHomeDirectory("~/.cache/editor", m_platform), home + "/.cache/editor");
}

TEST_F(PathNormalizerTest, TildeUserNotExpanded)
{
    EXPECT_EQ(ExpandHomeDirectory("~someone/.cache", m_platform), "~someone/.cache");
    EXPECT_EQ(ExpandHomeDirectory("/abs/~/x", m_platform), "/abs/~/x");
}

TEST_F(PathNormalizerTest, UnknownHomeLeavesTilde)
{
    m_platform.m_home.reset();

    EXPECT_EQ(ExpandHomeDirectory("~/.cache", m_platform), "~/.cache");
}

// ============================================================================
// NormalizePath
// ============================================================================

TEST_F(PathNormalizerTest, EmptyExpression)
{
    EXPECT_TRUE(NormalizePath("", m_platform).empty());
}

TEST_F(PathNormalizerTest, RootStaysRoot)
{
    EXPECT_EQ(NormalizePath("/", m_platform), fs::path("/"));
}

TEST_F(PathNormalizerTest, TildeAndVariables)
{
    fs::path expected = m_canonical_dir / "home" / ".cache" / "editor";

    EXPECT_EQ(NormalizePath("~/.cache/$APPNAME", m_platform), expected);
    EXPECT_EQ(NormalizePath("$HOME/.cache/${APPNAME}", m_platform), expected);
}

TEST_F(PathNormalizerTest, RelativeResolvedAgainstWorkingDirectory)
{
    fs::path expected = fs::weakly_canonical(fs::current_path()) / "some_relative_dir" / "file";

    EXPECT_EQ(NormalizePath("some_relative_dir/file", m_platform), expected);
}

TEST_F(PathNormalizerTest, DotSegmentsCollapsed)
{
    std::string expression = (m_test_dir / "a" / ".." / "b" / "." / "c").string();

    EXPECT_EQ(NormalizePath(expression, m_platform), m_canonical_dir / "b" / "c");
}

TEST_F(PathNormalizerTest, TrailingSeparatorDropped)
{
    std::string expression = (m_test_dir / "cache").string() + "/";

    EXPECT_EQ(NormalizePath(expression, m_platform), m_canonical_dir / "cache");
}

TEST_F(PathNormalizerTest, FinalSymlinkIsNotFollowed)
{
    fs::create_directories(m_test_dir / "real_target");
    fs::create_directory_symlink(m_test_dir / "real_target", m_test_dir / "link");

    EXPECT_EQ(NormalizePath((m_test_dir / "link").string(), m_platform), m_canonical_dir / "link");
}

TEST_F(PathNormalizerTest, SymlinkInParentIsResolved)
{
    fs::create_directories(m_test_dir / "real_parent");
    fs::create_directory_symlink(m_test_dir / "real_parent", m_test_dir / "linked_parent");

    EXPECT_EQ(NormalizePath((m_test_dir / "linked_parent" / "data").string(), m_platform),
              m_canonical_dir / "real_parent" / "data");
}

TEST_F(PathNormalizerTest, NonexistentPathIsAllowed)
{
    std::string expression = (m_test_dir / "does" / "not" / "exist").string();

    EXPECT_EQ(NormalizePath(expression, m_platform), m_canonical_dir / "does" / "not" / "exist");
}

TEST_F(PathNormalizerTest, Idempotent)
{
    fs::path once = NormalizePath("~/.cache/../.config/$APPNAME/", m_platform);

    EXPECT_EQ(NormalizePath(once.string(), m_platform), once);
}

TEST_F(PathNormalizerTest, NormalizePathsKeepsOrder)
{
    std::vector<fs::path> paths = NormalizePaths({"~/b", "~/a"}, m_platform);

    ASSERT_EQ(paths.size(), 2u);
    EXPECT_EQ(paths[0], m_canonical_dir / "home" / "b");
    EXPECT_EQ(paths[1], m_canonical_dir / "home" / "a");
}
