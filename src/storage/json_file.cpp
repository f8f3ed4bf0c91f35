#include "attest/storage/json_file.hpp"
#include "attest/core/errors.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using namespace attest::core;

namespace attest::storage {
  namespace {
    std::string errno_cause(const char* action) {
      return std::string(action) + ": " + (errno != 0 ? std::strerror(errno) : "unknown error");
    }
  }

  std::string read_text_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) throw IoError(path.string(), "no such file");
    if (fs::is_directory(path, ec)) throw IoError(path.string(), "is a directory");

    errno = 0;
    std::ifstream in(path, std::ios::binary);
    if (!in) throw IoError(path.string(), errno_cause("open for read failed"));

    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) throw IoError(path.string(), errno_cause("read failed"));
    return content;
  }

  void write_text_file(const fs::path& path, const std::string& content) {
    errno = 0;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw IoError(path.string(), errno_cause("open for write failed"));

    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out.good()) throw IoError(path.string(), errno_cause("write failed"));
  }

  Record read_json_file(const fs::path& path) {
    auto content = read_text_file(path);
    // depth counts the containers enclosing the one being opened
    Record::parser_callback_t limit_depth = [&path](int depth, Record::parse_event_t event, Record&) {
      if ((event == Record::parse_event_t::object_start || event == Record::parse_event_t::array_start) &&
          static_cast<size_t>(depth) >= kMaxNestingDepth) {
        throw FormatError(path.string(), "nesting deeper than " + std::to_string(kMaxNestingDepth) + " levels");
      }
      return true;
    };
    try {
      return Record::parse(content, limit_depth);
    } catch (const Record::parse_error& ex) {
      throw FormatError(path.string(), std::string("invalid JSON: ") + ex.what());
    }
  }

  void write_json_file(const fs::path& path, const Record& document) {
    std::string text;
    try {
      text = document.dump(2);
    } catch (const Record::type_error& ex) {
      // dump refuses strings that are not valid UTF-8
      throw EncodingError("$", ex.what());
    }
    text += '\n';
    write_text_file(path, text);
  }
}
