#include "attest/storage/key_store.hpp"
#include "attest/storage/json_file.hpp"
#include "attest/core/encoding.hpp"
#include "attest/core/errors.hpp"
#include "attest/core/logger.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;
using namespace attest::core;

namespace attest::storage {
  static constexpr const char* kPrivateKeyField = "private_key";
  static constexpr const char* kPublicKeyField = "public_key";

  template <size_t N>
  static std::array<uint8_t, N> decode_key_field(const Record& document, const char* field, const fs::path& path) {
    auto it = document.find(field);
    if (it == document.end()) throw KeyLoadError(path.string(), std::string("missing field '") + field + "'");
    if (!it->is_string()) throw KeyLoadError(path.string(), std::string("field '") + field + "' is not a string");

    auto bytes = base64_decode(it->get_ref<const std::string&>());
    if (!bytes) throw KeyLoadError(path.string(), std::string("field '") + field + "' is not valid base64");
    if (bytes->size() != N) {
      throw KeyLoadError(path.string(), std::string("field '") + field + "' decodes to " +
                         std::to_string(bytes->size()) + " bytes, expected " + std::to_string(N));
    }
    std::array<uint8_t, N> out{};
    std::copy(bytes->begin(), bytes->end(), out.begin());
    return out;
  }

  void save_keypair(const KeyPair& key_pair, const fs::path& path) {
    Record document = Record::object();
    document[kPrivateKeyField] = base64_encode(key_pair.private_key);
    document[kPublicKeyField] = base64_encode(key_pair.public_key);
    write_json_file(path, document);
  }

  KeyPair load_keypair(const fs::path& path) {
    Record document;
    try {
      document = read_json_file(path);
    } catch (const IoError& ex) {
      throw KeyLoadError(path.string(), ex.what());
    } catch (const FormatError& ex) {
      throw KeyLoadError(path.string(), ex.what());
    }
    if (!document.is_object()) throw KeyLoadError(path.string(), "keystore is not a JSON object");

    KeyPair key_pair;
    key_pair.private_key = decode_key_field<kPrivateKeySize>(document, kPrivateKeyField, path);
    key_pair.public_key = decode_key_field<kPublicKeySize>(document, kPublicKeyField, path);

    if (derive_public_key(key_pair.private_key) != key_pair.public_key) {
      throw KeyLoadError(path.string(), "public key does not belong to the private key");
    }
    return key_pair;
  }

  KeyStore::KeyStore(fs::path path) : path_(std::move(path)) {}

  bool KeyStore::exists() const {
    std::error_code ec;
    return fs::exists(path_, ec);
  }

  KeyPair KeyStore::load() const { return load_keypair(path_); }

  void KeyStore::save(const KeyPair& key_pair) const { save_keypair(key_pair, path_); }

  KeyPair KeyStore::load_or_create() const {
    auto log = createLogger("keystore");
    if (exists()) {
      auto key_pair = load();
      log->info("loaded oracle key {} from {}", base64_encode(key_pair.public_key), path_.string());
      return key_pair;
    }

    if (path_.has_parent_path()) {
      std::error_code ec;
      fs::create_directories(path_.parent_path(), ec);
      if (ec) throw IoError(path_.parent_path().string(), ec.message());
    }
    auto key_pair = generate_keypair();
    save(key_pair);
    log->info("generated oracle key {} at {}", base64_encode(key_pair.public_key), path_.string());
    return key_pair;
  }
}
