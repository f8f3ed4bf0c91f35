#include "attest/core/tamper.hpp"

#include <algorithm>
#include <sstream>

namespace attest::core {
  namespace {
    bool byte_less(const std::string& a, const std::string& b) {
      return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
        [](char x, char y) { return static_cast<unsigned char>(x) < static_cast<unsigned char>(y); });
    }

    std::optional<Record> member(const Record& record, const std::string& key) {
      auto it = record.find(key);
      if (it == record.end()) return std::nullopt;
      return *it;
    }

    bool same_value(const std::optional<Record>& a, const std::optional<Record>& b) {
      if (!a || !b) return a.has_value() == b.has_value();
      return canonical_string(*a) == canonical_string(*b);
    }

    std::string render(const std::optional<Record>& value) {
      return value ? canonical_string(*value) : "<absent>";
    }
  }

  ComparisonReport compare(const Record& record_a, const Record& record_b) {
    ComparisonReport report;
    report.digest_a = digest(record_a);
    report.digest_b = digest(record_b);
    report.equal = report.digest_a == report.digest_b;

    if (!record_a.is_object() || !record_b.is_object()) {
      if (!report.equal) report.differing_fields.push_back({"$", record_a, record_b});
      return report;
    }

    std::vector<std::string> keys;
    keys.reserve(record_a.size() + record_b.size());
    for (auto it = record_a.begin(); it != record_a.end(); ++it) keys.push_back(it.key());
    for (auto it = record_b.begin(); it != record_b.end(); ++it) keys.push_back(it.key());
    std::sort(keys.begin(), keys.end(), byte_less);
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());

    for (const auto& key : keys) {
      auto value_a = member(record_a, key);
      auto value_b = member(record_b, key);
      if (!same_value(value_a, value_b)) {
        report.differing_fields.push_back({key, std::move(value_a), std::move(value_b)});
      }
    }
    return report;
  }

  std::string format_report(const ComparisonReport& report) {
    std::ostringstream oss;
    oss << "digest A: " << to_hex(report.digest_a) << "\n";
    oss << "digest B: " << to_hex(report.digest_b) << "\n";
    oss << (report.equal ? "digests match: records are identical\n"
                         : "digests differ: records have been modified\n");
    if (report.differing_fields.empty()) {
      oss << "no field differences\n";
      return oss.str();
    }
    oss << "changed fields:\n";
    for (const auto& diff : report.differing_fields) {
      oss << "  - " << diff.field << ": " << render(diff.value_a) << " -> " << render(diff.value_b) << "\n";
    }
    return oss.str();
  }
}
