#include <gtest/gtest.h>
#include "attest/core/tamper.hpp"

using namespace attest::core;

TEST(Tamper, IdenticalRecordsReportNothing) {
  Record a = {{"id", "1"}, {"label", "POSITIVE"}, {"score", 0.87}};
  Record b = {{"score", 0.87}, {"label", "POSITIVE"}, {"id", "1"}};
  auto report = compare(a, b);
  EXPECT_TRUE(report.equal);
  EXPECT_EQ(report.digest_a, report.digest_b);
  EXPECT_TRUE(report.differing_fields.empty());
}

TEST(Tamper, SingleFieldChange) {
  Record original = {{"id", "1"}, {"label", "POSITIVE"}, {"score", 0.87}};
  Record tampered = original;
  tampered["label"] = "NEGATIVE";

  auto report = compare(original, tampered);
  EXPECT_FALSE(report.equal);
  EXPECT_NE(report.digest_a, report.digest_b);
  EXPECT_EQ(report.digest_a, digest(original));
  ASSERT_EQ(report.differing_fields.size(), 1u);
  EXPECT_EQ(report.differing_fields[0].field, "label");
  EXPECT_EQ(*report.differing_fields[0].value_a, "POSITIVE");
  EXPECT_EQ(*report.differing_fields[0].value_b, "NEGATIVE");
}

TEST(Tamper, ReportsEveryDifferenceInKeyOrder) {
  Record a = {{"zeta", 1}, {"id", "1"}, {"only_a", "x"}, {"score", 0.5}, {"same", {1, 2}}};
  Record b = {{"only_b", nullptr}, {"same", {1, 2}}, {"score", 0.75}, {"id", "1"}, {"zeta", 2}};

  auto report = compare(a, b);
  EXPECT_FALSE(report.equal);
  ASSERT_EQ(report.differing_fields.size(), 4u);
  EXPECT_EQ(report.differing_fields[0].field, "only_a");
  EXPECT_EQ(report.differing_fields[1].field, "only_b");
  EXPECT_EQ(report.differing_fields[2].field, "score");
  EXPECT_EQ(report.differing_fields[3].field, "zeta");

  // absent is not the same as null
  EXPECT_TRUE(report.differing_fields[0].value_a.has_value());
  EXPECT_FALSE(report.differing_fields[0].value_b.has_value());
  EXPECT_FALSE(report.differing_fields[1].value_a.has_value());
  ASSERT_TRUE(report.differing_fields[1].value_b.has_value());
  EXPECT_TRUE(report.differing_fields[1].value_b->is_null());
}

TEST(Tamper, NestedValuesComparedCanonically) {
  Record a = {{"meta", {{"lang", "en"}, {"src", "twitter"}}}, {"n", 1}};
  Record b = {{"meta", {{"src", "twitter"}, {"lang", "en"}}}, {"n", 1.0}};
  auto report = compare(a, b);
  EXPECT_TRUE(report.equal);
  EXPECT_TRUE(report.differing_fields.empty());

  b["meta"]["lang"] = "de";
  report = compare(a, b);
  ASSERT_EQ(report.differing_fields.size(), 1u);
  EXPECT_EQ(report.differing_fields[0].field, "meta");
}

TEST(Tamper, NonObjectRecordsComparedWhole) {
  auto report = compare(Record::array({1, 2}), Record::array({2, 1}));
  EXPECT_FALSE(report.equal);
  ASSERT_EQ(report.differing_fields.size(), 1u);
  EXPECT_EQ(report.differing_fields[0].field, "$");
}

TEST(Tamper, FormatReportListsChanges) {
  Record original = {{"id", "1"}, {"label", "POSITIVE"}};
  Record tampered = {{"id", "1"}, {"label", "NEGATIVE"}, {"note", "added"}};
  auto text = format_report(compare(original, tampered));
  EXPECT_NE(text.find("digests differ"), std::string::npos);
  EXPECT_NE(text.find("  - label: \"POSITIVE\" -> \"NEGATIVE\""), std::string::npos);
  EXPECT_NE(text.find("  - note: <absent> -> \"added\""), std::string::npos);
  EXPECT_NE(text.find(to_hex(digest(original))), std::string::npos);

  auto same = format_report(compare(original, original));
  EXPECT_NE(same.find("records are identical"), std::string::npos);
  EXPECT_NE(same.find("no field differences"), std::string::npos);
}
