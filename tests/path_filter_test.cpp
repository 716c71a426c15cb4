#include <gtest/gtest.h>

#include "../lib/pathFilter.hpp"

using namespace Dockwire;

TEST(PathFilterTest, CleansPaths) {
    EXPECT_EQ(cleanPath("./src//lib/"), "src/lib");
    EXPECT_EQ(cleanPath("/"), "");
    EXPECT_EQ(cleanPath("."), "");
}

TEST(PathFilterTest, MatchesParentsAndGlobs) {
    EXPECT_TRUE(matchPath("build", "build/out/app"));
    EXPECT_TRUE(matchPath("*.log", "debug.log"));
    EXPECT_FALSE(matchPath("*.log", "logs/debug.log"));
    EXPECT_TRUE(matchPath("**/*.log", "logs/deep/debug.log"));
    EXPECT_TRUE(matchPath("**/*.log", "top.log"));
    EXPECT_TRUE(matchPath("src/*/test", "src/net/test/case.cpp"));
    EXPECT_FALSE(matchPath("src/*/test", "src/net/other"));
}

TEST(PathFilterTest, MatchesClassesAndEscapes) {
    EXPECT_TRUE(matchPath("file[0-9].txt", "file3.txt"));
    EXPECT_FALSE(matchPath("file[0-9].txt", "fileA.txt"));
    EXPECT_TRUE(matchPath("file[!0-9].txt", "fileA.txt"));
    EXPECT_TRUE(matchPath("logs/[ab]*", "logs/app.log"));
    EXPECT_TRUE(matchPath("file\\*.txt", "file*.txt"));
    EXPECT_FALSE(matchPath("file\\*.txt", "file1.txt"));
}

TEST(PathFilterTest, MatchesBelowDirectories) {
    EXPECT_TRUE(matchesBelow("src/lib/*.cpp", "src"));
    EXPECT_TRUE(matchesBelow("src/lib/*.cpp", "src/lib"));
    EXPECT_FALSE(matchesBelow("src/lib/*.cpp", "docs"));
    EXPECT_TRUE(matchesBelow("**/keep", "anything/below"));
}

TEST(PathFilterTest, ParsesDockerignore) {
    auto patterns = PathFilter::parseIgnoreFile("# comment\n\n  node_modules  \r\n*.tmp\n!important.tmp\n");
    EXPECT_EQ(patterns, (std::vector<std::string>{"node_modules", "*.tmp", "!important.tmp"}));
}

TEST(PathFilterTest, LastMatchingRuleWins) {
    auto filter = PathFilter::fromDockerignore("*.tmp\n!important.tmp\nnode_modules\n");
    EXPECT_FALSE(filter.included("scratch.tmp", false));
    EXPECT_TRUE(filter.included("important.tmp", false));
    EXPECT_FALSE(filter.included("node_modules/left-pad/index.js", false));
    EXPECT_TRUE(filter.included("src/main.cpp", false));
    EXPECT_TRUE(filter.skipDirectory("node_modules"));
    EXPECT_FALSE(filter.skipDirectory("src"));
}

TEST(PathFilterTest, NegatedRuleKeepsExcludedDirectoryWalkable) {
    auto filter = PathFilter::fromDockerignore("vendor\n!vendor/keep.txt\n");
    EXPECT_FALSE(filter.skipDirectory("vendor"));
    EXPECT_TRUE(filter.included("vendor/keep.txt", false));
    EXPECT_FALSE(filter.included("vendor/drop.txt", false));
}

TEST(PathFilterTest, IncludePatternsNarrowTheWalk) {
    PathFilter filter({"src/*.cpp", "Dockerfile"}, {"src/skip.cpp"});
    EXPECT_TRUE(filter.included("Dockerfile", false));
    EXPECT_TRUE(filter.included("src", true));
    EXPECT_TRUE(filter.included("src/main.cpp", false));
    EXPECT_FALSE(filter.included("src/skip.cpp", false));
    EXPECT_FALSE(filter.included("README.md", false));
    EXPECT_TRUE(filter.skipDirectory("docs"));
    EXPECT_FALSE(filter.skipDirectory("src"));
}

TEST(PathFilterTest, EmptyFilterAcceptsEverything) {
    PathFilter filter;
    EXPECT_TRUE(filter.empty());
    EXPECT_TRUE(filter.included("any/path", false));
    EXPECT_FALSE(filter.skipDirectory("any"));
}
