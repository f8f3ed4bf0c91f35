#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <attest/core/canonical.hpp>
#include <attest/core/encoding.hpp>
#include <attest/core/envelope.hpp>
#include <attest/core/hash.hpp>
#include <attest/core/keys.hpp>
#include <attest/core/logger.hpp>
#include <attest/core/tamper.hpp>
#include <attest/storage/json_file.hpp>
#include <attest/storage/key_store.hpp>

using namespace attest::core;
using attest::storage::KeyStore;
namespace fs = std::filesystem;

namespace {
  constexpr int kExitOk = 0;
  constexpr int kExitInvalid = 1;
  constexpr int kExitError = 2;

  struct CliOptions {
    std::string keystore = "oracle_keypair.json";
    std::string log_level = "warn";
    std::string in;
    std::string out;
    std::string against;
    std::string dir = "attest-demo";
    bool force = false;
    std::vector<std::string> positional;
  };

  void print_usage() {
    std::printf(
      "attest - signed sentiment records\n\n"
      "Usage:\n"
      "  attest keygen  [--keystore PATH] [--force]\n"
      "  attest seal    --in RECORD --out ENVELOPE [--keystore PATH]\n"
      "  attest verify  --in ENVELOPE [--against FILE]\n"
      "  attest compare FILE_A FILE_B\n"
      "  attest hash    --in FILE\n"
      "  attest demo    [--dir DIR]\n\n"
      "Options:\n"
      "  --keystore   Keystore file (default: oracle_keypair.json)\n"
      "  --in         Input record or envelope file\n"
      "  --out        Output envelope file\n"
      "  --against    Original record or envelope to diff against\n"
      "  --force      Overwrite an existing keystore\n"
      "  --dir        Working directory for the demo (default: attest-demo)\n"
      "  --log-level  trace|debug|info|warn|error|off (default: warn)\n\n"
      "verify exits 0 when valid, 1 when invalid; compare exits 0 when equal,\n"
      "1 when different; any error exits 2.\n"
    );
  }

  // Accepts "--name value" and "--name=value".
  bool take_option(const std::string& arg, const std::string& name, int& i, int argc, char** argv, std::string& out) {
    const std::string prefix = name + "=";
    if (arg.rfind(prefix, 0) == 0) {
      out = arg.substr(prefix.size());
      return true;
    }
    if (arg == name && i + 1 < argc) {
      out = argv[++i];
      return true;
    }
    return false;
  }

  // Returns false (after printing the reason) on an unknown option.
  bool parse_options(int argc, char** argv, CliOptions& options, bool& help) {
    for (int i = 2; i < argc; ++i) {
      std::string arg = argv[i];
      if (take_option(arg, "--keystore", i, argc, argv, options.keystore) ||
          take_option(arg, "--log-level", i, argc, argv, options.log_level) ||
          take_option(arg, "--in", i, argc, argv, options.in) ||
          take_option(arg, "--out", i, argc, argv, options.out) ||
          take_option(arg, "--against", i, argc, argv, options.against) ||
          take_option(arg, "--dir", i, argc, argv, options.dir)) {
        continue;
      }
      if (arg == "--force") {
        options.force = true;
      } else if (arg == "-h" || arg == "--help") {
        help = true;
      } else if (arg.rfind("--", 0) == 0) {
        std::fprintf(stderr, "Unknown option: %s\n", arg.c_str());
        return false;
      } else {
        options.positional.push_back(arg);
      }
    }
    return true;
  }

  // A record file, or an envelope whose data is taken.
  Record load_record_or_envelope(const fs::path& path) {
    auto document = attest::storage::read_json_file(path);
    if (!looks_like_envelope(document)) return document;

    createLogger("cli")->info("{} is an envelope, using its data", path.string());
    return parse_envelope(std::move(document), path).data;
  }

  bool require(const std::string& value, const char* flag) {
    if (!value.empty()) return true;
    std::fprintf(stderr, "Missing required option %s\n", flag);
    print_usage();
    return false;
  }

  int cmd_keygen(const CliOptions& options) {
    KeyStore store(options.keystore);
    if (store.exists() && !options.force) {
      std::fprintf(stderr, "Keystore %s already exists (use --force to replace it)\n", options.keystore.c_str());
      return kExitError;
    }
    auto key_pair = generate_keypair();
    store.save(key_pair);
    std::cout << "keystore: " << store.path().string() << "\n";
    std::cout << "public_key: " << base64_encode(key_pair.public_key) << "\n";
    return kExitOk;
  }

  int cmd_seal(const CliOptions& options) {
    if (!require(options.in, "--in") || !require(options.out, "--out")) return kExitError;

    auto key_pair = KeyStore(options.keystore).load_or_create();
    auto record = attest::storage::read_json_file(options.in);
    auto envelope = seal(record, key_pair);
    save_envelope(envelope, options.out);

    auto record_digest = digest(record);
    std::cout << "digest: " << to_hex(record_digest) << "\n";
    std::cout << "signature: " << to_hex(envelope.signature) << "\n";
    std::cout << "public_key: " << base64_encode(envelope.public_key) << "\n";
    std::cout << "sealed: " << options.out << "\n";
    return kExitOk;
  }

  int cmd_verify(const CliOptions& options) {
    if (!require(options.in, "--in")) return kExitError;

    auto opened = open_and_verify(options.in);
    if (opened.error != VerifyError::MalformedData) {
      std::cout << "digest: " << to_hex(digest(opened.data)) << "\n";
    }
    if (opened.is_valid) {
      std::cout << "VALID: signed by the embedded oracle key and unmodified\n";
    } else {
      std::cout << "INVALID: " << to_string(opened.error) << "\n";
    }

    if (!options.against.empty()) {
      auto original = load_record_or_envelope(options.against);
      std::cout << "\n" << format_report(compare(original, opened.data));
    }
    return opened.is_valid ? kExitOk : kExitInvalid;
  }

  int cmd_compare(const CliOptions& options) {
    if (options.positional.size() != 2) {
      std::fprintf(stderr, "compare takes exactly two files\n");
      print_usage();
      return kExitError;
    }
    auto record_a = load_record_or_envelope(options.positional[0]);
    auto record_b = load_record_or_envelope(options.positional[1]);
    auto report = compare(record_a, record_b);
    std::cout << format_report(report);
    return report.equal ? kExitOk : kExitInvalid;
  }

  int cmd_hash(const CliOptions& options) {
    if (!require(options.in, "--in")) return kExitError;
    auto record = load_record_or_envelope(options.in);
    std::cout << "canonical: " << canonical_string(record) << "\n";
    std::cout << "sha256: " << to_hex(digest(record)) << "\n";
    return kExitOk;
  }

  int cmd_demo(const CliOptions& options) {
    fs::path dir = options.dir;
    fs::create_directories(dir);

    std::cout << "[1] oracle keypair\n";
    KeyStore store(dir / "oracle_keypair.json");
    bool existed = store.exists();
    auto key_pair = store.load_or_create();
    std::cout << "    " << (existed ? "loaded " : "generated ") << store.path().string() << "\n";
    std::cout << "    public_key: " << base64_encode(key_pair.public_key) << "\n";

    Record record = {
      {"id", "1"},
      {"text", "$AAPL beats earnings estimates, guidance raised"},
      {"date", "2025-03-14T09:30:00Z"},
      {"username", "market_watch"},
      {"source", "twitter"},
      {"label", "POSITIVE"},
      {"score", 0.87},
    };
    auto record_path = dir / "sample_sentiment.json";
    attest::storage::write_json_file(record_path, record);

    std::cout << "[2] canonical form and digest\n";
    std::cout << "    " << canonical_string(record) << "\n";
    std::cout << "    sha256: " << to_hex(digest(record)) << "\n";

    std::cout << "[3] seal and save\n";
    auto envelope = seal(record, key_pair);
    auto original_path = dir / "signed_sentiment_original.json";
    save_envelope(envelope, original_path);
    std::cout << "    signature: " << to_hex(envelope.signature) << "\n";
    std::cout << "    saved " << original_path.string() << "\n";

    std::cout << "[4] verify\n";
    auto opened = open_and_verify(original_path);
    std::cout << "    " << (opened.is_valid ? "VALID" : "INVALID") << "\n";

    std::cout << "[5] tamper with label, keep the old signature\n";
    auto tampered = envelope;
    tampered.data["label"] = "NEGATIVE";
    auto tampered_path = dir / "signed_sentiment.json";
    save_envelope(tampered, tampered_path);
    auto reopened = open_and_verify(tampered_path);
    std::cout << "    " << (reopened.is_valid ? "VALID" : "INVALID") << ": "
              << to_string(reopened.error) << "\n";

    std::cout << "[6] what changed\n";
    std::cout << format_report(compare(envelope, tampered));
    return (opened.is_valid && !reopened.is_valid) ? kExitOk : kExitError;
  }
}

int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage();
    return kExitOk;
  }

  const std::string command = argv[1];
  if (command == "-h" || command == "--help") {
    print_usage();
    return kExitOk;
  }

  CliOptions options;
  bool help = false;
  if (!parse_options(argc, argv, options, help)) {
    print_usage();
    return kExitError;
  }
  if (help) {
    print_usage();
    return kExitOk;
  }
  if (!set_log_level(options.log_level)) {
    std::fprintf(stderr, "Unknown log level: %s\n", options.log_level.c_str());
    return kExitError;
  }

  if (!crypto_init()) {
    std::fprintf(stderr, "crypto_init failed\n");
    return kExitError;
  }

  try {
    if (command == "keygen") return cmd_keygen(options);
    if (command == "seal") return cmd_seal(options);
    if (command == "verify") return cmd_verify(options);
    if (command == "compare") return cmd_compare(options);
    if (command == "hash") return cmd_hash(options);
    if (command == "demo") return cmd_demo(options);
  } catch (const std::exception& ex) {
    std::fprintf(stderr, "Error: %s\n", ex.what());
    return kExitError;
  }

  std::fprintf(stderr, "Unknown command: %s\n", command.c_str());
  print_usage();
  return kExitError;
}
