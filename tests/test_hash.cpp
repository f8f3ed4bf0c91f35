#include <gtest/gtest.h>
#include "attest/core/hash.hpp"
#include "attest/core/canonical.hpp"

using namespace attest::core;

TEST(HashTests, SHA256_KnownValue) {
    auto hash_value = sha256("hello");
    EXPECT_EQ(to_hex(hash_value),
        "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");
}

TEST(HashTests, SHA256_EmptyString) {
  auto hash_value = sha256("");
  EXPECT_EQ(to_hex(hash_value),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(HashTests, ToHex_FormatsLeadingZeros) {
  std::vector<uint8_t> data{0x00, 0x01, 0x0A, 0xFF};
  EXPECT_EQ(toHex(data), "00010aff");
}

TEST(HashTests, RecordDigest_KnownValue) {
  Record record = {{"score", 0.87}, {"label", "POSITIVE"}, {"id", "1"}};
  EXPECT_EQ(to_hex(digest(record)),
            "2db9456ea31dc1d9e978a667d0c579a0c311f1f6bc0693c6318ef6fd958a38f5");
}

TEST(HashTests, RecordDigest_StableAcrossCalls) {
  Record record = {{"id", "42"}, {"nested", {{"b", 1}, {"a", {true, nullptr}}}}};
  auto first = digest(record);
  for (int i = 0; i < 5; ++i) EXPECT_EQ(digest(record), first);
  EXPECT_EQ(digest(Record::parse(record.dump())), first);
}
