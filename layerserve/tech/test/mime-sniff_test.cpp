#include "layerserve/mime-sniff.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace layerserve {

using namespace std::string_view_literals;

TEST(MimeSniffer, EmptySnifferDetectsNothing) {
  MimeSniffer sniffer;
  EXPECT_TRUE(sniffer.empty());
  EXPECT_FALSE(sniffer.sniff("\x89PNG\r\n\x1A\n"sv).has_value());
}

TEST(MimeSniffer, DefaultImageSignatures) {
  const MimeSniffer sniffer = MimeSniffer::WithDefaultSignatures();
  EXPECT_EQ(sniffer.sniff("\x89PNG\r\n\x1A\n\0\0\0\rIHDR"sv), "image/png");
  EXPECT_EQ(sniffer.sniff("\xFF\xD8\xFF\xE0\0\x10JFIF"sv), "image/jpeg");
  EXPECT_EQ(sniffer.sniff("GIF89a\x01\0\x01\0"sv), "image/gif");
  EXPECT_EQ(sniffer.sniff("GIF87a"sv), "image/gif");
  EXPECT_EQ(sniffer.sniff("RIFF\x24\x10\0\0WEBPVP8 "sv), "image/webp");
  EXPECT_EQ(sniffer.sniff("BM\x36\x10\0\0"sv), "image/bmp");
  EXPECT_EQ(sniffer.sniff("\0\0\x01\0\x01\0"sv), "image/x-icon");
  EXPECT_EQ(sniffer.sniff("II*\0\x08\0\0\0"sv), "image/tiff");
  EXPECT_EQ(sniffer.sniff("%PDF-1.7\n"sv), "application/pdf");
}

TEST(MimeSniffer, NoMatch) {
  const MimeSniffer sniffer = MimeSniffer::WithDefaultSignatures();
  EXPECT_FALSE(sniffer.sniff("hello world").has_value());
  EXPECT_FALSE(sniffer.sniff("").has_value());
  // truncated signature
  EXPECT_FALSE(sniffer.sniff("\x89PN"sv).has_value());
  // RIFF container which is not WebP (WAV)
  EXPECT_FALSE(sniffer.sniff("RIFF\x24\x10\0\0WAVEfmt "sv).has_value());
}

TEST(MimeSniffer, SignatureAtOffset) {
  MimeSniffer sniffer;
  sniffer.add(MagicSignature{"ftypavif", {}, "image/avif", 4});
  EXPECT_EQ(sniffer.sniff("\0\0\0\x1C"
                          "ftypavif"sv),
            "image/avif");
  EXPECT_FALSE(sniffer.sniff("ftypavif").has_value());
}

TEST(MimeSniffer, CustomDetectorAfterSignatures) {
  MimeSniffer sniffer = MimeSniffer::WithDefaultSignatures();
  sniffer.add([](std::string_view prefix) -> std::string_view {
    return prefix.starts_with("<svg") ? "image/svg+xml" : std::string_view{};
  });
  EXPECT_EQ(sniffer.sniff("<svg xmlns=\"http://www.w3.org/2000/svg\"/>"), "image/svg+xml");
  EXPECT_EQ(sniffer.sniff("GIF89a"), "image/gif");
  EXPECT_FALSE(sniffer.sniff("<html>").has_value());
}

TEST(MimeSniffer, DetectorOnlySeesPrefix) {
  MimeSniffer sniffer;
  std::size_t seenSize = 0;
  sniffer.add([&seenSize](std::string_view prefix) {
    seenSize = prefix.size();
    return std::string_view{};
  });
  const std::string big(MimeSniffer::kMaxSniffLength * 3, 'a');
  EXPECT_FALSE(sniffer.sniff(big).has_value());
  EXPECT_EQ(seenSize, MimeSniffer::kMaxSniffLength);
}

TEST(MimeSniffer, InvalidSignatures) {
  MimeSniffer sniffer;
  EXPECT_THROW(sniffer.add(MagicSignature{"abc", "\xFF", "x/y"}), std::invalid_argument);
  EXPECT_THROW(sniffer.add(MagicSignature{"", {}, "x/y"}), std::invalid_argument);
  EXPECT_THROW(sniffer.add(MagicSignature{"abc", {}, ""}), std::invalid_argument);
  EXPECT_THROW(sniffer.add(MimeSniffer::Detector{}), std::invalid_argument);
}

}  // namespace layerserve
