#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

#include "attest/core/canonical.hpp"
#include "attest/core/keys.hpp"

namespace attest::core {

  /**
   * A record with the oracle's signature over sha256(canonicalize(data)) and
   * the public key to check it with. Signature and key are held as plain
   * bytes: an envelope read from disk is untrusted, and a wrong-length field
   * must surface as a failed verification rather than a load error.
   */
  struct SignedRecord {
    Record data;
    std::vector<uint8_t> signature;
    std::vector<uint8_t> public_key;

    bool operator==(const SignedRecord& other) const;
  };

  struct OpenedRecord {
    Record data;
    bool is_valid;
    VerifyError error;
  };

  /**
   * canonicalize -> digest -> sign, bundled with the public key.
   * Throws EncodingError if the record cannot be canonicalized, and
   * InvalidKeyError if the private key is malformed or public_key is not the
   * key derived from it.
   */
  SignedRecord seal(const Record& record, std::span<const uint8_t> private_key,
                    std::span<const uint8_t> public_key);

  SignedRecord seal(const Record& record, const KeyPair& key_pair);

  // Derives the public key from the private key.
  SignedRecord seal(const Record& record, std::span<const uint8_t> private_key);

  /**
   * Recomputes the digest of the embedded data and checks the signature.
   * Data that cannot be canonicalized (too deep, NaN, bad UTF-8) is reported
   * as VerifyError::MalformedData rather than thrown.
   */
  VerifyResult verify_envelope(const SignedRecord& envelope);

  /**
   * {"data": ..., "signature": base64, "public_key": base64}; data is written
   * as-is, member order included. Throws IoError on write failure.
   */
  void save_envelope(const SignedRecord& envelope, const std::filesystem::path& path);

  /**
   * Throws IoError if the file cannot be read, FormatError if it is not a
   * JSON object with "data" and base64 string "signature"/"public_key".
   */
  SignedRecord load_envelope(const std::filesystem::path& path);

  // Builds an envelope from an already parsed document; source names it in FormatError.
  SignedRecord parse_envelope(Record document, const std::filesystem::path& source);

  // load_envelope + verify_envelope. The record is returned even when invalid.
  OpenedRecord open_and_verify(const std::filesystem::path& path);

  /**
   * True if the document is an object with exactly the members "data",
   * "signature" and "public_key", the last two strings.
   */
  bool looks_like_envelope(const Record& document);
}
