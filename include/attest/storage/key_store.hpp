#pragma once
#include <filesystem>
#include <attest/core/keys.hpp>

namespace attest::storage {

  /**
   * Persist a keypair as {"private_key": base64, "public_key": base64}.
   * Overwrites an existing file. Throws core::IoError on write failure.
   */
  void save_keypair(const attest::core::KeyPair& key_pair, const std::filesystem::path& path);

  /**
   * Load a keypair written by save_keypair.
   * Throws core::KeyLoadError if the file is missing or unreadable, is not a
   * JSON object with string fields, holds invalid base64, a key that does
   * not decode to 32 bytes, or a public key that does not belong to the
   * private key.
   */
  attest::core::KeyPair load_keypair(const std::filesystem::path& path);

  // The oracle identity: one keystore file, bootstrapped on first use.
  class KeyStore {
    public:
      explicit KeyStore(std::filesystem::path path);

      bool exists() const;
      attest::core::KeyPair load() const;
      void save(const attest::core::KeyPair& key_pair) const;

      // Load the keystore, generating and persisting a fresh keypair if absent.
      attest::core::KeyPair load_or_create() const;

      const std::filesystem::path& path() const { return path_; }

    private:
      std::filesystem::path path_;
  };
}
