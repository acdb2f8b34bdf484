#include "layerserve/url-decode.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <string_view>

namespace layerserve::url {

TEST(UrlDecode, DecodePathPlain) {
  EXPECT_EQ(DecodePath("/a/b.txt"), "/a/b.txt");
  EXPECT_EQ(DecodePath(""), "");
}

TEST(UrlDecode, DecodePathPercentSequences) {
  EXPECT_EQ(DecodePath("/hello%20world.txt"), "/hello world.txt");
  EXPECT_EQ(DecodePath("/%2e%2E/etc"), "/../etc");
  EXPECT_EQ(DecodePath("/caf%C3%A9"), "/caf\xC3\xA9");
}

TEST(UrlDecode, PlusIsKeptInPaths) { EXPECT_EQ(DecodePath("/a+b"), "/a+b"); }

TEST(UrlDecode, DecodePathEmbeddedNul) {
  const std::string decoded = DecodePath("/a%00b");
  ASSERT_EQ(decoded.size(), 4U);
  EXPECT_EQ(decoded[2], '\0');
}

TEST(UrlDecode, DecodePathMalformed) {
  EXPECT_THROW((void)DecodePath("/a%"), std::invalid_argument);
  EXPECT_THROW((void)DecodePath("/a%2"), std::invalid_argument);
  EXPECT_THROW((void)DecodePath("/a%zz"), std::invalid_argument);
}

TEST(UrlDecode, DecodeInPlaceReturnsNewEnd) {
  std::string buf = "x%41y";
  char* end = DecodeInPlace(buf.data(), buf.data() + buf.size());
  ASSERT_NE(end, nullptr);
  EXPECT_EQ(std::string_view(buf.data(), end), "xAy");
}

}  // namespace layerserve::url
