#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <string>

#include <attest/core/hash.hpp>

namespace attest::core {
  constexpr size_t kPrivateKeySize = 32;
  constexpr size_t kPublicKeySize = 32;
  constexpr size_t kSignatureSize = 64;

  using PrivateKey = std::array<uint8_t, kPrivateKeySize>;
  using PublicKey = std::array<uint8_t, kPublicKeySize>;
  using Signature = std::array<uint8_t, kSignatureSize>;

  /**
  * Ed25519 keypair in raw form.
  * - private_key: 32-byte seed
  * - public_key: 32-byte encoded point
  */
  struct KeyPair {
    PrivateKey private_key{};
    PublicKey public_key{};
  };

  enum class VerifyError {
    None = 0,
    MalformedDigest,
    MalformedPublicKey,
    MalformedSignature,
    BadSignature,
    MalformedData,   // envelope data has no canonical encoding
  };

  struct VerifyResult {
    bool is_valid;
    VerifyError error;
  };

  const char* to_string(VerifyError error);

/**
 * Initialize crypto subsystem; must be called once at startup.
 * Returns true on success.
 */
 bool crypto_init();

/**
 * Generate a fresh Ed25519 keypair from the OpenSSL CSPRNG.
 * Throws std::runtime_error on failure.
 */
 KeyPair generate_keypair();

/**
 * Compute the public key belonging to a private key.
 * Throws InvalidKeyError if the bytes are not a usable Ed25519 seed.
 */
 PublicKey derive_public_key(std::span<const uint8_t> private_key);

/**
 * Sign a digest with Ed25519. No randomness is drawn at sign time.
 * Throws InvalidKeyError if private_key is not exactly 32 bytes.
 */
 Signature sign_digest(const Hash256& digest, std::span<const uint8_t> private_key);

/**
 * Verify a signature over a digest. Malformed or untrusted input is reported
 * through the result, never thrown; only an OpenSSL malfunction throws.
 */
 VerifyResult verify_digest_detailed(std::span<const uint8_t> digest,
  std::span<const uint8_t> signature, std::span<const uint8_t> public_key);

 inline bool verify_digest(std::span<const uint8_t> digest,
  std::span<const uint8_t> signature, std::span<const uint8_t> public_key) {
    return verify_digest_detailed(digest, signature, public_key).is_valid;
 }
}
