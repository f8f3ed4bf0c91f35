#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "attest/core/hash.hpp"

namespace attest::core {

  /**
   * A record is any JSON value; the top level is conventionally an object.
   * Insertion order is kept for display and persistence but never reaches
   * the canonical bytes.
   */
  using Record = nlohmann::ordered_json;

  // Deepest array/object nesting accepted by the encoder and the JSON reader.
  constexpr size_t kMaxNestingDepth = 512;

  /**
   * Canonical JSON rendering used for hashing and signing.
   *
   * - object keys sorted by unsigned byte value at every level
   * - no whitespace
   * - integers in plain decimal
   * - floats as the shortest round-trip decimal in fixed notation: 1.0 -> "1",
   *   0.87 -> "0.87", 1e21 -> "1000000000000000000000", -0.0 -> "0"
   * - strings must be valid UTF-8; escapes are \" \\ \b \f \n \r \t and
   *   \u00xx for the remaining control bytes, all else verbatim
   *
   * Throws EncodingError for NaN, Infinity, invalid UTF-8 and nesting deeper
   * than kMaxNestingDepth.
   */
  std::string canonical_string(const Record& record);

  std::vector<uint8_t> canonicalize(const Record& record);

  // sha256(canonicalize(record))
  Hash256 digest(const Record& record);
}
