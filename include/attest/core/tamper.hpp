#pragma once
#include <optional>
#include <string>
#include <vector>

#include "attest/core/canonical.hpp"
#include "attest/core/envelope.hpp"
#include "attest/core/hash.hpp"

namespace attest::core {

  // std::nullopt marks a field absent from that side, as opposed to JSON null.
  struct FieldDifference {
    std::string field;
    std::optional<Record> value_a;
    std::optional<Record> value_b;
  };

  struct ComparisonReport {
    Hash256 digest_a{};
    Hash256 digest_b{};
    bool equal = false;
    // sorted by field name, byte order
    std::vector<FieldDifference> differing_fields;
  };

  /**
   * Digest both records for the verdict, then diff the union of their
   * top-level fields by canonical value. When either side is not an object
   * the whole values are compared and reported under the field name "$".
   * Purely diagnostic; verification never consults it.
   */
  ComparisonReport compare(const Record& record_a, const Record& record_b);

  inline ComparisonReport compare(const SignedRecord& envelope_a, const SignedRecord& envelope_b) {
    return compare(envelope_a.data, envelope_b.data);
  }

  std::string format_report(const ComparisonReport& report);
}
