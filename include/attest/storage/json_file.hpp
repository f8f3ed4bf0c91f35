#pragma once
#include <filesystem>
#include <string>

#include <attest/core/canonical.hpp>

namespace attest::storage {

  // Whole-file read. Throws core::IoError if the file is missing or unreadable.
  std::string read_text_file(const std::filesystem::path& path);

  // Whole-file write, truncating any previous content. Throws core::IoError.
  void write_text_file(const std::filesystem::path& path, const std::string& content);

  /**
   * Read and parse a JSON document, keeping object member order.
   * Throws core::IoError on read failure and core::FormatError on bad JSON,
   * including nesting deeper than core::kMaxNestingDepth.
   */
  attest::core::Record read_json_file(const std::filesystem::path& path);

  // Pretty-printed with a two-space indent and a trailing newline.
  void write_json_file(const std::filesystem::path& path, const attest::core::Record& document);
}
