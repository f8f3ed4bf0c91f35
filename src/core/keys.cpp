#include "attest/core/keys.hpp"
#include "attest/core/errors.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <openssl/crypto.h>

#include <stdexcept>
#include <string>
#include <memory>

namespace attest::core {

  namespace  {

    std::string openssl_error_string() {
      unsigned long err = ERR_get_error();
      char err_buf[256]{0};
      ERR_error_string_n(err, err_buf, sizeof(err_buf));
      return err_buf;
    }

    [[noreturn]] void throw_openssl_error(const std::string& context) {
      throw std::runtime_error(context + ": " + openssl_error_string());
    }

    using EVP_PKEY_Ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
    using EVP_PKEY_CTX_Ptr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
    using EVP_MD_CTX_Ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

    EVP_PKEY_Ptr load_private_key(std::span<const uint8_t> private_key) {
      if (private_key.size() != kPrivateKeySize) {
        throw InvalidKeyError("Ed25519 private key must be 32 bytes, got " + std::to_string(private_key.size()));
      }
      EVP_PKEY_Ptr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, private_key.data(), private_key.size()),
                       &EVP_PKEY_free);
      if (!key) throw InvalidKeyError("EVP_PKEY_new_raw_private_key: " + openssl_error_string());
      return key;
    }

    PublicKey export_public_key(EVP_PKEY* key) {
      PublicKey out{};
      size_t len = out.size();
      if (EVP_PKEY_get_raw_public_key(key, out.data(), &len) != 1 || len != out.size()) {
        throw_openssl_error("EVP_PKEY_get_raw_public_key");
      }
      return out;
    }
  }

  const char* to_string(VerifyError error) {
    switch (error) {
      case VerifyError::None: return "none";
      case VerifyError::MalformedDigest: return "digest is not 32 bytes";
      case VerifyError::MalformedPublicKey: return "public key is not a 32-byte Ed25519 key";
      case VerifyError::MalformedSignature: return "signature is not 64 bytes";
      case VerifyError::BadSignature: return "signature does not match digest and public key";
      case VerifyError::MalformedData: return "record data cannot be canonically encoded";
    }
    return "unknown";
  }

  bool crypto_init() {
    if (OPENSSL_init_crypto(0, nullptr) != 1) {
      return false;
    }
    ERR_load_crypto_strings();
    return true;
  }

  KeyPair generate_keypair() {
    EVP_PKEY_CTX_Ptr keygen_ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), &EVP_PKEY_CTX_free);
    if (!keygen_ctx) throw_openssl_error("EVP_PKEY_CTX_new_id");

    if (EVP_PKEY_keygen_init(keygen_ctx.get()) <= 0) throw_openssl_error("EVP_PKEY_keygen_init");

    EVP_PKEY* generated_key = nullptr;
    if (EVP_PKEY_keygen(keygen_ctx.get(), &generated_key) <= 0) throw_openssl_error("EVP_PKEY_keygen");
    EVP_PKEY_Ptr key_handle(generated_key, &EVP_PKEY_free);

    KeyPair key_pair;
    size_t priv_len = key_pair.private_key.size();
    if (EVP_PKEY_get_raw_private_key(key_handle.get(), key_pair.private_key.data(), &priv_len) != 1 ||
        priv_len != key_pair.private_key.size()) {
      throw_openssl_error("EVP_PKEY_get_raw_private_key");
    }
    key_pair.public_key = export_public_key(key_handle.get());
    return key_pair;
  }

  PublicKey derive_public_key(std::span<const uint8_t> private_key) {
    auto key_handle = load_private_key(private_key);
    return export_public_key(key_handle.get());
  }

  Signature sign_digest(const Hash256& digest, std::span<const uint8_t> private_key) {
    auto key_handle = load_private_key(private_key);

    EVP_MD_CTX_Ptr sign_ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!sign_ctx) throw_openssl_error("EVP_MD_CTX_new");

    // Ed25519 is one-shot: no message digest, no Update/Final split
    if (EVP_DigestSignInit(sign_ctx.get(), nullptr, nullptr, nullptr, key_handle.get()) <= 0)
      throw_openssl_error("EVP_DigestSignInit");

    Signature signature{};
    size_t sig_len = signature.size();
    if (EVP_DigestSign(sign_ctx.get(), signature.data(), &sig_len, digest.data(), digest.size()) <= 0)
      throw_openssl_error("EVP_DigestSign");
    if (sig_len != signature.size())
      throw std::runtime_error("EVP_DigestSign: unexpected signature length " + std::to_string(sig_len));

    return signature;
  }

  VerifyResult verify_digest_detailed(std::span<const uint8_t> digest,
    std::span<const uint8_t> signature, std::span<const uint8_t> public_key) {
      if (digest.size() != Hash256{}.size()) return {false, VerifyError::MalformedDigest};
      if (public_key.size() != kPublicKeySize) return {false, VerifyError::MalformedPublicKey};
      if (signature.size() != kSignatureSize) return {false, VerifyError::MalformedSignature};

      EVP_PKEY_Ptr key_handle(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(), public_key.size()),
                              &EVP_PKEY_free);
      if (!key_handle) {
        ERR_clear_error();
        return {false, VerifyError::MalformedPublicKey};
      }

      EVP_MD_CTX_Ptr verify_ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
      if (!verify_ctx) throw_openssl_error("EVP_MD_CTX_new");

      if (EVP_DigestVerifyInit(verify_ctx.get(), nullptr, nullptr, nullptr, key_handle.get()) <= 0)
        throw_openssl_error("EVP_DigestVerifyInit");

      int result = EVP_DigestVerify(verify_ctx.get(), signature.data(), signature.size(), digest.data(), digest.size());
      if (result == 1) return {true, VerifyError::None};

      // Points that fail to decode surface here as well as forged signatures
      ERR_clear_error();
      return {false, VerifyError::BadSignature};
    }

  }
