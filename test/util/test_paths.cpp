#include <gtest/gtest.h>

#include "util/Paths.hpp"
#include "util/TextFile.hpp"

namespace fs = std::filesystem;

using namespace baretree;

TEST(PathsTest, NormalizeAbsolute) {
    EXPECT_EQ(Paths::normalizeAbsolute("/a/b/../c/"), fs::path("/a/c"));
    EXPECT_EQ(Paths::normalizeAbsolute("/a/./b"), fs::path("/a/b"));
    EXPECT_TRUE(Paths::normalizeAbsolute("relative/x").is_absolute());
}

TEST(PathsTest, Containment) {
    EXPECT_TRUE(Paths::isWithin("/r", "/r"));
    EXPECT_TRUE(Paths::isWithin("/r", "/r/a/b"));
    EXPECT_FALSE(Paths::isWithin("/r", "/rx"));
    EXPECT_FALSE(Paths::isWithin("/r/a", "/r"));

    EXPECT_TRUE(Paths::isStrictAncestor("/r", "/r/a"));
    EXPECT_FALSE(Paths::isStrictAncestor("/r", "/r"));
    EXPECT_FALSE(Paths::isStrictAncestor("/r/a", "/r/ab"));
}

TEST(PathsTest, ComponentCount) {
    EXPECT_EQ(Paths::componentCount("a/b"), 2u);
    EXPECT_EQ(Paths::componentCount("."), 0u);
    EXPECT_EQ(Paths::componentCount("a/./b/"), 2u);
}

TEST(TextFileTest, TrimTrailing) {
    EXPECT_EQ(trimTrailing("value\r\n"), "value");
    EXPECT_EQ(trimTrailing("  lead stays \n\n"), "  lead stays");
    EXPECT_EQ(trimTrailing(""), "");
}

TEST(TextFileTest, ReadMissingFileIsIoError) {
    auto res = readTextFile("/nonexistent/baretree/file");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::IoError);
}
