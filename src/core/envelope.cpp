#include "attest/core/envelope.hpp"
#include "attest/core/encoding.hpp"
#include "attest/core/errors.hpp"
#include "attest/core/logger.hpp"
#include "attest/storage/json_file.hpp"

#include <algorithm>
#include <string>

namespace fs = std::filesystem;

namespace attest::core {
  static constexpr const char* kDataField = "data";
  static constexpr const char* kSignatureField = "signature";
  static constexpr const char* kPublicKeyField = "public_key";

  static std::vector<uint8_t> decode_field(const Record& document, const char* field, const fs::path& path) {
    auto it = document.find(field);
    if (it == document.end()) throw FormatError(path.string(), std::string("missing field '") + field + "'");
    if (!it->is_string()) throw FormatError(path.string(), std::string("field '") + field + "' is not a string");

    auto bytes = base64_decode(it->get_ref<const std::string&>());
    if (!bytes) throw FormatError(path.string(), std::string("field '") + field + "' is not valid base64");
    return std::move(*bytes);
  }

  bool SignedRecord::operator==(const SignedRecord& other) const {
    return data == other.data && signature == other.signature && public_key == other.public_key;
  }

  SignedRecord seal(const Record& record, std::span<const uint8_t> private_key,
                    std::span<const uint8_t> public_key) {
    auto derived = derive_public_key(private_key);
    if (public_key.size() != derived.size() || !std::equal(derived.begin(), derived.end(), public_key.begin())) {
      throw InvalidKeyError("public key does not belong to the signing key");
    }

    auto record_digest = digest(record);
    auto signature = sign_digest(record_digest, private_key);

    createLogger("envelope")->debug("sealed record digest {}", to_hex(record_digest));
    return SignedRecord{record,
                        std::vector<uint8_t>(signature.begin(), signature.end()),
                        std::vector<uint8_t>(derived.begin(), derived.end())};
  }

  SignedRecord seal(const Record& record, const KeyPair& key_pair) {
    return seal(record, key_pair.private_key, key_pair.public_key);
  }

  SignedRecord seal(const Record& record, std::span<const uint8_t> private_key) {
    auto public_key = derive_public_key(private_key);
    return seal(record, private_key, public_key);
  }

  VerifyResult verify_envelope(const SignedRecord& envelope) {
    Hash256 record_digest{};
    try {
      record_digest = digest(envelope.data);
    } catch (const EncodingError& ex) {
      createLogger("verify")->warn("envelope rejected: {}", ex.what());
      return {false, VerifyError::MalformedData};
    }
    auto result = verify_digest_detailed(record_digest, envelope.signature, envelope.public_key);
    if (!result.is_valid) {
      createLogger("verify")->warn("envelope rejected: {} (digest {})", to_string(result.error), to_hex(record_digest));
    }
    return result;
  }

  void save_envelope(const SignedRecord& envelope, const fs::path& path) {
    Record document = Record::object();
    document[kDataField] = envelope.data;
    document[kSignatureField] = base64_encode(envelope.signature);
    document[kPublicKeyField] = base64_encode(envelope.public_key);
    storage::write_json_file(path, document);
    createLogger("envelope")->debug("saved envelope to {}", path.string());
  }

  SignedRecord load_envelope(const fs::path& path) {
    auto envelope = parse_envelope(storage::read_json_file(path), path);
    createLogger("envelope")->debug("loaded envelope from {}", path.string());
    return envelope;
  }

  SignedRecord parse_envelope(Record document, const fs::path& source) {
    if (!document.is_object()) throw FormatError(source.string(), "envelope is not a JSON object");

    auto data = document.find(kDataField);
    if (data == document.end()) throw FormatError(source.string(), std::string("missing field '") + kDataField + "'");

    SignedRecord envelope;
    envelope.signature = decode_field(document, kSignatureField, source);
    envelope.public_key = decode_field(document, kPublicKeyField, source);
    envelope.data = std::move(*data);
    return envelope;
  }

  OpenedRecord open_and_verify(const fs::path& path) {
    auto envelope = load_envelope(path);
    auto result = verify_envelope(envelope);
    return OpenedRecord{std::move(envelope.data), result.is_valid, result.error};
  }

  bool looks_like_envelope(const Record& document) {
    if (!document.is_object() || document.size() != 3 || !document.contains(kDataField)) return false;
    auto signature = document.find(kSignatureField);
    auto public_key = document.find(kPublicKeyField);
    return signature != document.end() && signature->is_string() &&
           public_key != document.end() && public_key->is_string();
  }
}
