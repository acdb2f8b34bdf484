#include "layerserve/string-equal-ignore-case.hpp"

#include <gtest/gtest.h>

namespace layerserve {

TEST(StringEqualIgnoreCase, Equal) {
  EXPECT_TRUE(CaseInsensitiveEqual("Content-Type", "content-type"));
  EXPECT_TRUE(CaseInsensitiveEqual("", ""));
  EXPECT_FALSE(CaseInsensitiveEqual("etag", "etags"));
  EXPECT_FALSE(CaseInsensitiveEqual("etag", "etaf"));
}

TEST(StringEqualIgnoreCase, StartsWith) {
  EXPECT_TRUE(StartsWithCaseInsensitive("Content-Length", "content"));
  EXPECT_TRUE(StartsWithCaseInsensitive("content-disposition", "CONTENT"));
  EXPECT_FALSE(StartsWithCaseInsensitive("cache-control", "content"));
  EXPECT_FALSE(StartsWithCaseInsensitive("con", "content"));
}

TEST(StringEqualIgnoreCase, EndsWith) {
  EXPECT_TRUE(EndsWithCaseInsensitive("setup.EXE", ".exe"));
  EXPECT_TRUE(EndsWithCaseInsensitive(".exe", ".exe"));
  EXPECT_FALSE(EndsWithCaseInsensitive("setup.exe.txt", ".exe"));
  EXPECT_FALSE(EndsWithCaseInsensitive("exe", ".exe"));
}

}  // namespace layerserve
