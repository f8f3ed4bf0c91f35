#include <gtest/gtest.h>
#include "attest/core/encoding.hpp"

using namespace attest::core;

static std::vector<uint8_t> bytes_of(const std::string& s) {
  return std::vector<uint8_t>(s.begin(), s.end());
}

TEST(Base64, EncodeKnownValues) {
  EXPECT_EQ(base64_encode(bytes_of("foobar")), "Zm9vYmFy");
  EXPECT_EQ(base64_encode(bytes_of("fo")), "Zm8=");
  EXPECT_EQ(base64_encode(std::vector<uint8_t>{}), "");
  EXPECT_EQ(base64_encode(std::vector<uint8_t>(32, 0)), "AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA=");
}

TEST(Base64, DecodeStripsPadding) {
  auto decoded = base64_decode("Zm8=");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, bytes_of("fo"));

  auto key = base64_decode("AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA==");
  ASSERT_TRUE(key.has_value());
  EXPECT_EQ(key->size(), 31u);
}

TEST(Base64, DecodeRejectsMalformedInput) {
  EXPECT_FALSE(base64_decode("Zm8").has_value());        // not a multiple of four
  EXPECT_FALSE(base64_decode("Zm!=").has_value());       // outside the alphabet
  EXPECT_FALSE(base64_decode("Z=8=").has_value());       // padding in the middle
  EXPECT_FALSE(base64_decode("AA=A").has_value());
  EXPECT_FALSE(base64_decode("====").has_value());
  EXPECT_FALSE(base64_decode("Zm9v\nYmFy").has_value());
  EXPECT_FALSE(base64_decode("AB==").has_value());       // low bits beside the padding set
  EXPECT_FALSE(base64_decode("AP==").has_value());
  EXPECT_FALSE(base64_decode("Zm9=").has_value());
  EXPECT_FALSE(base64_decode("Zm/=").has_value());
}

TEST(Base64, EachByteStringHasOneText) {
  for (const char* text : {"AA==", "AAA=", "Zm8=", "Zm9v", "/w==", "//8="}) {
    auto decoded = base64_decode(text);
    ASSERT_TRUE(decoded.has_value()) << text;
    EXPECT_EQ(base64_encode(*decoded), text);
  }
}

TEST(Base64, EmptyDecodesToEmpty) {
  auto decoded = base64_decode("");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_TRUE(decoded->empty());
}
