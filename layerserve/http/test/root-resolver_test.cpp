#include "layerserve/root-resolver.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "layerserve/temp-file.hpp"

namespace layerserve {

TEST(CandidatePathTest, Join) {
  EXPECT_EQ(CandidatePath("/www", "/a/b.txt"), "/www/a/b.txt");
  EXPECT_EQ(CandidatePath("/", "/a.txt"), "/a.txt");
  EXPECT_EQ(CandidatePath("/www", "a.txt"), "/www/a.txt");
}

TEST(CandidatePathTest, TrailingSeparatorAppendsIndex) {
  EXPECT_EQ(CandidatePath("/www", "/"), "/www/index.html");
  EXPECT_EQ(CandidatePath("/www", "/docs/"), "/www/docs/index.html");
  EXPECT_EQ(CandidatePath("/", "/"), "/index.html");
}

class RootResolverTest : public ::testing::Test {
 protected:
  test::ScopedTempDir first{"layerserve-root1-"};
  test::ScopedTempDir second{"layerserve-root2-"};
  std::vector<std::string> roots{first.dirPath().string(), second.dirPath().string()};
};

TEST_F(RootResolverTest, FirstRootWins) {
  first.writeFile("a.txt", "one");
  second.writeFile("a.txt", "two!");

  const RootResolution resolution = ResolveInRoots(roots, "/a.txt");
  ASSERT_EQ(resolution.kind, RootResolution::Kind::Found);
  EXPECT_EQ(resolution.file.absolutePath, (first.dirPath() / "a.txt").string());
  EXPECT_EQ(resolution.file.stat.size, 3U);
}

TEST_F(RootResolverTest, MissingInFirstRootFallsBackToNext) {
  second.writeFile("sub/b.txt", "b");

  const RootResolution resolution = ResolveInRoots(roots, "/sub/b.txt");
  ASSERT_EQ(resolution.kind, RootResolution::Kind::Found);
  EXPECT_EQ(resolution.file.absolutePath, (second.dirPath() / "sub" / "b.txt").string());
  EXPECT_TRUE(resolution.file.stat.isRegularFile);
}

TEST_F(RootResolverTest, IndexFile) {
  second.writeFile("docs/index.html", "<html></html>");

  const RootResolution resolution = ResolveInRoots(roots, "/docs/");
  ASSERT_EQ(resolution.kind, RootResolution::Kind::Found);
  EXPECT_EQ(resolution.file.absolutePath, (second.dirPath() / "docs" / "index.html").string());
}

TEST_F(RootResolverTest, DirectoryIsFoundButNotRegular) {
  first.makeDir("dir");

  const RootResolution resolution = ResolveInRoots(roots, "/dir");
  ASSERT_EQ(resolution.kind, RootResolution::Kind::Found);
  EXPECT_TRUE(resolution.file.stat.isDirectory);
  EXPECT_FALSE(resolution.file.stat.isRegularFile);
}

TEST_F(RootResolverTest, NotFoundAnywhere) {
  first.writeFile("file", "x");

  EXPECT_EQ(ResolveInRoots(roots, "/nope.txt").kind, RootResolution::Kind::NotFound);
  // path component being a regular file is treated as missing
  EXPECT_EQ(ResolveInRoots(roots, "/file/nope.txt").kind, RootResolution::Kind::NotFound);
  EXPECT_EQ(ResolveInRoots({}, "/file").kind, RootResolution::Kind::NotFound);
}

TEST_F(RootResolverTest, StatErrorStopsSearch) {
  const std::string tooLong = "/" + std::string(4096, 'x');

  const RootResolution resolution = ResolveInRoots(roots, tooLong);
  ASSERT_EQ(resolution.kind, RootResolution::Kind::Error);
  EXPECT_TRUE(static_cast<bool>(resolution.error));
  EXPECT_EQ(resolution.file.absolutePath, CandidatePath(roots.front(), tooLong));
}

}  // namespace layerserve
