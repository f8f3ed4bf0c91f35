#include "attest/core/canonical.hpp"
#include "attest/core/errors.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace attest::core {
  namespace {
    constexpr char kHexDigits[] = "0123456789abcdef";

    bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

    // Rejects overlong forms, surrogates and code points above U+10FFFF.
    bool valid_utf8(std::string_view text) {
      size_t i = 0;
      while (i < text.size()) {
        auto c = static_cast<unsigned char>(text[i]);
        size_t extra = 0;
        uint32_t cp = 0;
        if (c < 0x80) { ++i; continue; }
        else if (c >= 0xC2 && c <= 0xDF) { extra = 1; cp = c & 0x1F; }
        else if (c >= 0xE0 && c <= 0xEF) { extra = 2; cp = c & 0x0F; }
        else if (c >= 0xF0 && c <= 0xF4) { extra = 3; cp = c & 0x07; }
        else return false;

        if (i + extra >= text.size()) return false;
        for (size_t k = 1; k <= extra; ++k) {
          auto next = static_cast<unsigned char>(text[i + k]);
          if (!is_continuation(next)) return false;
          cp = (cp << 6) | (next & 0x3F);
        }
        if (extra == 2 && (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF))) return false;
        if (extra == 3 && (cp < 0x10000 || cp > 0x10FFFF)) return false;
        i += extra + 1;
      }
      return true;
    }

    bool byte_less(const std::string& a, const std::string& b) {
      return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
        [](char x, char y) { return static_cast<unsigned char>(x) < static_cast<unsigned char>(y); });
    }

    class CanonicalWriter {
      public:
        void write(const Record& value) {
          switch (value.type()) {
            case Record::value_t::null:
              out_ += "null";
              break;
            case Record::value_t::boolean:
              out_ += value.get<bool>() ? "true" : "false";
              break;
            case Record::value_t::number_integer:
              write_integer(value.get<int64_t>());
              break;
            case Record::value_t::number_unsigned:
              write_integer(value.get<uint64_t>());
              break;
            case Record::value_t::number_float:
              write_float(value.get<double>());
              break;
            case Record::value_t::string:
              write_string(value.get_ref<const std::string&>());
              break;
            case Record::value_t::array: {
              enter();
              out_ += '[';
              size_t index = 0;
              for (const auto& element : value) {
                if (index > 0) out_ += ',';
                path_.push_back(Segment{nullptr, index});
                write(element);
                path_.pop_back();
                ++index;
              }
              out_ += ']';
              --depth_;
              break;
            }
            case Record::value_t::object: {
              enter();
              using Member = std::pair<const std::string*, const Record*>;
              std::vector<Member> members;
              members.reserve(value.size());
              for (auto it = value.begin(); it != value.end(); ++it) members.emplace_back(&it.key(), &it.value());
              std::sort(members.begin(), members.end(),
                        [](const Member& a, const Member& b) { return byte_less(*a.first, *b.first); });

              out_ += '{';
              bool first = true;
              for (const auto& [key, member_value] : members) {
                if (!first) out_ += ',';
                first = false;
                path_.push_back(Segment{key, 0});
                write_string(*key);
                out_ += ':';
                write(*member_value);
                path_.pop_back();
              }
              out_ += '}';
              --depth_;
              break;
            }
            case Record::value_t::binary:
              fail("binary values have no JSON rendering");
            case Record::value_t::discarded:
              fail("discarded value");
          }
        }

        std::string take() { return std::move(out_); }

      private:
        // One step of the JSON path: an object key, or an array index when key is null.
        struct Segment {
          const std::string* key;
          size_t index;
        };

        void enter() {
          if (++depth_ > kMaxNestingDepth) fail("nesting too deep");
        }

        [[noreturn]] void fail(const std::string& what) const {
          throw EncodingError(render_path(), what);
        }

        std::string render_path() const {
          std::string path = "$";
          for (const auto& segment : path_) {
            if (segment.key != nullptr) {
              path += '.';
              path += *segment.key;
            } else {
              path += '[';
              path += std::to_string(segment.index);
              path += ']';
            }
          }
          return path;
        }

        template <class T> void write_integer(T value) {
          std::array<char, 32> buf{};
          auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value);
          out_.append(buf.data(), end);
        }

        void write_float(double value) {
          if (std::isnan(value)) fail("NaN has no canonical rendering");
          if (std::isinf(value)) fail("Infinity has no canonical rendering");
          if (value == 0.0) {
            out_ += '0';
            return;
          }
          // DBL_MAX in fixed notation is 309 digits; the smallest subnormal needs 326 chars
          std::array<char, 400> buf{};
          auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value, std::chars_format::fixed);
          if (ec != std::errc{}) fail("float rendering failed");
          out_.append(buf.data(), end);
        }

        void write_string(const std::string& text) {
          if (!valid_utf8(text)) fail("string is not valid UTF-8");
          out_ += '"';
          for (char ch : text) {
            auto c = static_cast<unsigned char>(ch);
            switch (c) {
              case '"':  out_ += "\\\""; break;
              case '\\': out_ += "\\\\"; break;
              case '\b': out_ += "\\b"; break;
              case '\f': out_ += "\\f"; break;
              case '\n': out_ += "\\n"; break;
              case '\r': out_ += "\\r"; break;
              case '\t': out_ += "\\t"; break;
              default:
                if (c < 0x20) {
                  out_ += "\\u00";
                  out_ += kHexDigits[c >> 4];
                  out_ += kHexDigits[c & 0x0F];
                } else {
                  out_ += ch;
                }
            }
          }
          out_ += '"';
        }

        std::string out_;
        std::vector<Segment> path_;
        size_t depth_ = 0;
    };
  }

  std::string canonical_string(const Record& record) {
    CanonicalWriter writer;
    writer.write(record);
    return writer.take();
  }

  std::vector<uint8_t> canonicalize(const Record& record) {
    auto text = canonical_string(record);
    return std::vector<uint8_t>(text.begin(), text.end());
  }

  Hash256 digest(const Record& record) {
    auto bytes = canonicalize(record);
    return sha256(std::span<const uint8_t>(bytes.data(), bytes.size()));
  }
}
