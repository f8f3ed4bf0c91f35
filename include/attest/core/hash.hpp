#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <string>

namespace attest::core {
  using Hash256 = std::array<uint8_t, 32>;

  /**
   * SHA-256 over raw bytes (OpenSSL EVP).
   * Throws std::runtime_error if the digest context cannot be driven.
   */
  auto sha256(std::span<const uint8_t> data) -> Hash256;

  inline auto sha256(const std::string& data) -> Hash256 {
    return sha256(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(data.data()), data.size()));
  }

  auto toHex(std::span<const uint8_t> data) -> std::string;
  inline std::string to_hex(std::span<const uint8_t> data) { return toHex(data); }
}
