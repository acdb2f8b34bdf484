#include "layerserve/file.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <string>
#include <system_error>

#include "layerserve/temp-file.hpp"

namespace layerserve {

TEST(FileTest, DefaultConstructedIsClosed) {
  File file;
  EXPECT_FALSE(file);
}

TEST(FileTest, LoadAllContent) {
  test::ScopedTempDir tmpDir;
  const auto path = tmpDir.writeFile("hello.txt", "Hello, static file!");

  File file(path.string());
  ASSERT_TRUE(file);
  EXPECT_EQ(file.size(), 19U);
  EXPECT_EQ(file.loadAllContent(), "Hello, static file!");
  // loading twice gives the same content, it does not depend on a file offset
  EXPECT_EQ(file.loadAllContent(), "Hello, static file!");
}

TEST(FileTest, LoadEmptyFile) {
  test::ScopedTempDir tmpDir;
  const auto path = tmpDir.writeFile("empty.bin", "");
  EXPECT_EQ(File(path.string()).loadAllContent(), "");
}

TEST(FileTest, LoadLargeBinaryFile) {
  test::ScopedTempDir tmpDir;
  std::string content;
  for (int i = 0; i < 100000; ++i) {
    content.push_back(static_cast<char>(i % 256));
  }
  const auto path = tmpDir.writeFile("large.bin", content);
  EXPECT_EQ(File(path.string()).loadAllContent(), content);
}

TEST(FileTest, OpenMissingFileThrows) {
  test::ScopedTempDir tmpDir;
  const auto path = tmpDir.dirPath() / "missing.txt";
  try {
    File file(path.string());
    FAIL() << "expected std::system_error";
  } catch (const std::system_error& ex) {
    EXPECT_EQ(ex.code().value(), ENOENT);
  }
}

}  // namespace layerserve
