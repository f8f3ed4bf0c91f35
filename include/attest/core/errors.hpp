#pragma once
#include <stdexcept>
#include <string>

namespace attest::core {

  struct AttestError : std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  // A record holds a value with no deterministic rendering (NaN, Infinity, bad UTF-8).
  class EncodingError : public AttestError {
    public:
      EncodingError(std::string json_path, const std::string& what)
        : AttestError(what + " at " + json_path), path_(std::move(json_path)) {}

      const std::string& path() const { return path_; }

    private:
      std::string path_;
  };

  // Keystore missing, malformed, or holding keys of the wrong length.
  class KeyLoadError : public AttestError {
    public:
      KeyLoadError(std::string keystore_path, const std::string& what)
        : AttestError("keystore " + keystore_path + ": " + what), path_(std::move(keystore_path)) {}

      const std::string& path() const { return path_; }

    private:
      std::string path_;
  };

  struct InvalidKeyError : AttestError {
    using AttestError::AttestError;
  };

  class IoError : public AttestError {
    public:
      IoError(std::string file_path, const std::string& cause)
        : AttestError(file_path + ": " + cause), path_(std::move(file_path)) {}

      const std::string& path() const { return path_; }

    private:
      std::string path_;
  };

  // Structurally invalid JSON document (envelope or record file).
  class FormatError : public AttestError {
    public:
      FormatError(std::string file_path, const std::string& what)
        : AttestError(file_path + ": " + what), path_(std::move(file_path)) {}

      const std::string& path() const { return path_; }

    private:
      std::string path_;
  };
}
