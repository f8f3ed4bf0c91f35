#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace attest::core {

  // Standard base64 (RFC 4648, padded, no line breaks).
  std::string base64_encode(std::span<const uint8_t> bytes);

  /**
   * Strict base64 decode: the input must be padded to a multiple of four,
   * use only the standard alphabet, carry '=' only as trailing padding and
   * leave the bits beside the padding zero, so each byte string has exactly
   * one accepted text. Returns std::nullopt for anything else; whitespace is
   * not tolerated.
   */
  std::optional<std::vector<uint8_t>> base64_decode(std::string_view text);

}
