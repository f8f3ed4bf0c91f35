#include "attest/core/encoding.hpp"
#include <openssl/evp.h>

namespace attest::core {
  namespace {
    // Six-bit value of an alphabet character, -1 outside the alphabet.
    int base64_value(char c) {
      if (c >= 'A' && c <= 'Z') return c - 'A';
      if (c >= 'a' && c <= 'z') return c - 'a' + 26;
      if (c >= '0' && c <= '9') return c - '0' + 52;
      if (c == '+') return 62;
      if (c == '/') return 63;
      return -1;
    }
  }

  std::string base64_encode(std::span<const uint8_t> bytes) {
    if (bytes.empty()) return {};
    // 4 output chars per 3 input bytes, plus the NUL EVP_EncodeBlock writes
    std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  bytes.data(), static_cast<int>(bytes.size()));
    out.resize(static_cast<size_t>(written));
    return out;
  }

  std::optional<std::vector<uint8_t>> base64_decode(std::string_view text) {
    if (text.empty()) return std::vector<uint8_t>{};
    if (text.size() % 4 != 0) return std::nullopt;

    size_t padding = 0;
    if (text.back() == '=') {
      ++padding;
      if (text[text.size() - 2] == '=') ++padding;
    }

    for (size_t i = 0; i < text.size() - padding; ++i) {
      if (base64_value(text[i]) < 0) return std::nullopt;
    }

    // The bits of the last character that fall into the padding must be zero,
    // otherwise several texts would decode to the same bytes.
    if (padding > 0) {
      int last = base64_value(text[text.size() - padding - 1]);
      int unused_mask = padding == 2 ? 0x0F : 0x03;
      if ((last & unused_mask) != 0) return std::nullopt;
    }

    std::vector<uint8_t> out(3 * (text.size() / 4));
    int decoded = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (decoded < 0 || static_cast<size_t>(decoded) < padding) return std::nullopt;
    // EVP_DecodeBlock counts padding as zero bytes
    out.resize(static_cast<size_t>(decoded) - padding);
    return out;
  }
}
