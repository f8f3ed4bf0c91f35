#include <gtest/gtest.h>
#include <filesystem>
#include "attest/storage/key_store.hpp"
#include "attest/storage/json_file.hpp"
#include "attest/core/encoding.hpp"
#include "attest/core/errors.hpp"

using namespace attest::core;
using namespace attest::storage;
namespace fs = std::filesystem;

static fs::path tmpdir(const char* name) {
  auto p = fs::temp_directory_path() / (std::string("attest_") + name);
  fs::remove_all(p);
  fs::create_directories(p);
  return p;
}

static void write_keystore(const fs::path& path, const Record& document) {
  write_text_file(path, document.dump());
}

TEST(KeyStoreFile, SaveLoadRoundTrip) {
  ASSERT_TRUE(crypto_init());
  auto path = tmpdir("keystore_roundtrip") / "oracle_keypair.json";
  auto key_pair = generate_keypair();
  save_keypair(key_pair, path);

  auto loaded = load_keypair(path);
  EXPECT_EQ(loaded.private_key, key_pair.private_key);
  EXPECT_EQ(loaded.public_key, key_pair.public_key);

  auto document = read_json_file(path);
  EXPECT_EQ(document["public_key"], base64_encode(key_pair.public_key));
  EXPECT_EQ(document["private_key"], base64_encode(key_pair.private_key));
}

TEST(KeyStoreFile, SaveOverwrites) {
  ASSERT_TRUE(crypto_init());
  auto path = tmpdir("keystore_overwrite") / "oracle_keypair.json";
  save_keypair(generate_keypair(), path);
  auto second = generate_keypair();
  save_keypair(second, path);
  EXPECT_EQ(load_keypair(path).public_key, second.public_key);
}

TEST(KeyStoreFile, MissingFileIsKeyLoadError) {
  auto path = tmpdir("keystore_missing") / "absent.json";
  try {
    load_keypair(path);
    FAIL() << "expected KeyLoadError";
  } catch (const KeyLoadError& ex) {
    EXPECT_EQ(ex.path(), path.string());
  }
}

TEST(KeyStoreFile, MalformedContentIsKeyLoadError) {
  ASSERT_TRUE(crypto_init());
  auto dir = tmpdir("keystore_malformed");
  auto key_pair = generate_keypair();
  auto good_priv = base64_encode(key_pair.private_key);
  auto good_pub = base64_encode(key_pair.public_key);

  auto not_json = dir / "not_json.json";
  write_text_file(not_json, "private_key=abc");
  EXPECT_THROW(load_keypair(not_json), KeyLoadError);

  auto not_object = dir / "array.json";
  write_keystore(not_object, Record::array({good_priv, good_pub}));
  EXPECT_THROW(load_keypair(not_object), KeyLoadError);

  auto missing_field = dir / "missing.json";
  write_keystore(missing_field, Record{{"private_key", good_priv}});
  EXPECT_THROW(load_keypair(missing_field), KeyLoadError);

  auto wrong_type = dir / "wrong_type.json";
  write_keystore(wrong_type, Record{{"private_key", good_priv}, {"public_key", 7}});
  EXPECT_THROW(load_keypair(wrong_type), KeyLoadError);

  auto bad_base64 = dir / "bad_base64.json";
  write_keystore(bad_base64, Record{{"private_key", "***"}, {"public_key", good_pub}});
  EXPECT_THROW(load_keypair(bad_base64), KeyLoadError);
}

TEST(KeyStoreFile, WrongKeyLengthIsKeyLoadError) {
  ASSERT_TRUE(crypto_init());
  auto dir = tmpdir("keystore_length");
  auto key_pair = generate_keypair();

  auto short_priv = dir / "short_priv.json";
  write_keystore(short_priv, Record{{"private_key", base64_encode(std::vector<uint8_t>(31, 1))},
                                    {"public_key", base64_encode(key_pair.public_key)}});
  EXPECT_THROW(load_keypair(short_priv), KeyLoadError);

  auto long_pub = dir / "long_pub.json";
  write_keystore(long_pub, Record{{"private_key", base64_encode(key_pair.private_key)},
                                  {"public_key", base64_encode(std::vector<uint8_t>(33, 1))}});
  EXPECT_THROW(load_keypair(long_pub), KeyLoadError);
}

TEST(KeyStoreFile, MismatchedPairIsKeyLoadError) {
  ASSERT_TRUE(crypto_init());
  auto path = tmpdir("keystore_mismatch") / "oracle_keypair.json";
  auto key_pair_1 = generate_keypair();
  auto key_pair_2 = generate_keypair();
  save_keypair(KeyPair{key_pair_1.private_key, key_pair_2.public_key}, path);
  EXPECT_THROW(load_keypair(path), KeyLoadError);
}

TEST(KeyStoreBootstrap, CreatesOnceThenReuses) {
  ASSERT_TRUE(crypto_init());
  auto dir = tmpdir("keystore_bootstrap");
  KeyStore store(dir / "nested" / "oracle_keypair.json");
  ASSERT_FALSE(store.exists());

  auto created = store.load_or_create();
  EXPECT_TRUE(store.exists());

  // a second process start sees the same identity
  KeyStore reopened(dir / "nested" / "oracle_keypair.json");
  auto loaded = reopened.load_or_create();
  EXPECT_EQ(loaded.private_key, created.private_key);
  EXPECT_EQ(loaded.public_key, created.public_key);
}

TEST(KeyStoreBootstrap, CorruptKeystoreIsNotReplaced) {
  ASSERT_TRUE(crypto_init());
  auto path = tmpdir("keystore_corrupt") / "oracle_keypair.json";
  write_text_file(path, "{}");
  KeyStore store(path);
  EXPECT_THROW(store.load_or_create(), KeyLoadError);
  EXPECT_EQ(read_text_file(path), "{}");
}
