/**
 * @file cache_key_test.cpp
 * @brief Unit tests for lookup fields and key canonicalization
 */

#include "cache/cache_key.h"

#include <gtest/gtest.h>

namespace semcache::cache {

using utils::ErrorCode;

TEST(KeyCanonicalizerTest, QueryLookupCanonicalForm) {
  auto key = KeyCanonicalizer::Canonicalize(QueryLookup{"hello world", false}.ToFields());
  ASSERT_TRUE(key) << key.error().to_string();
  EXPECT_EQ(*key, "query/v1|query=11:hello world|is_first_message=5:false");
}

TEST(KeyCanonicalizerTest, DomainLookupsProduceDistinctSchemas) {
  auto financial = KeyCanonicalizer::Canonicalize(FinancialLookup{"AAPL"}.ToFields());
  auto ticker = KeyCanonicalizer::Canonicalize(TickerLookup{"AAPL"}.ToFields());
  auto probe = KeyCanonicalizer::Canonicalize(ProbeLookup{"p-1"}.ToFields());
  ASSERT_TRUE(financial && ticker && probe);

  EXPECT_EQ(*financial, "financial/v1|ticker=4:AAPL|data_type=8:llm_data");
  EXPECT_EQ(*ticker, "ticker/v1|company_name=4:AAPL");
  EXPECT_EQ(*probe, "probe/v1|probe_id=3:p-1");
}

TEST(KeyCanonicalizerTest, DeterministicAcrossCalls) {
  auto first = KeyCanonicalizer::Canonicalize(QueryLookup{"tech stocks", true}.ToFields());
  auto second = KeyCanonicalizer::Canonicalize(QueryLookup{"tech stocks", true}.ToFields());
  ASSERT_TRUE(first && second);
  EXPECT_EQ(*first, *second);
}

TEST(KeyCanonicalizerTest, FirstMessageFlagIsPartOfIdentity) {
  auto first = KeyCanonicalizer::Canonicalize(QueryLookup{"q", true}.ToFields());
  auto later = KeyCanonicalizer::Canonicalize(QueryLookup{"q", false}.ToFields());
  ASSERT_TRUE(first && later);
  EXPECT_NE(*first, *later);
}

TEST(KeyCanonicalizerTest, LengthPrefixPreventsDelimiterCollisions) {
  // Field values that contain the separators of the encoding itself
  LookupFields a{"custom", 1, {}};
  a.Add("x", "1|y=1:2").Add("y", "3");
  LookupFields b{"custom", 1, {}};
  b.Add("x", "1").Add("y", "2|y=1:3");

  auto key_a = KeyCanonicalizer::Canonicalize(a);
  auto key_b = KeyCanonicalizer::Canonicalize(b);
  ASSERT_TRUE(key_a && key_b);
  EXPECT_NE(*key_a, *key_b);
}

TEST(KeyCanonicalizerTest, VersionAndFieldOrderMatter) {
  LookupFields v1{"custom", 1, {}};
  v1.Add("a", "1").Add("b", "2");
  LookupFields v2 = v1;
  v2.version = 2;
  LookupFields reordered{"custom", 1, {}};
  reordered.Add("b", "2").Add("a", "1");

  auto k1 = KeyCanonicalizer::Canonicalize(v1);
  auto k2 = KeyCanonicalizer::Canonicalize(v2);
  auto k3 = KeyCanonicalizer::Canonicalize(reordered);
  ASSERT_TRUE(k1 && k2 && k3);
  EXPECT_NE(*k1, *k2);
  EXPECT_NE(*k1, *k3);
}

TEST(KeyCanonicalizerTest, EmptyValuesAreAllowed) {
  auto key = KeyCanonicalizer::Canonicalize(TickerLookup{""}.ToFields());
  ASSERT_TRUE(key);
  EXPECT_EQ(*key, "ticker/v1|company_name=0:");
}

TEST(KeyCanonicalizerTest, RejectsMalformedLookups) {
  auto expect_invalid = [](const LookupFields& lookup) {
    auto key = KeyCanonicalizer::Canonicalize(lookup);
    ASSERT_FALSE(key);
    EXPECT_EQ(key.error().code(), ErrorCode::kCacheInvalidLookup);
  };

  LookupFields empty_schema{"", 1, {}};
  empty_schema.Add("a", "1");
  expect_invalid(empty_schema);

  LookupFields bad_schema{"a|b", 1, {}};
  bad_schema.Add("a", "1");
  expect_invalid(bad_schema);

  LookupFields zero_version{"custom", 0, {}};
  zero_version.Add("a", "1");
  expect_invalid(zero_version);

  expect_invalid(LookupFields{"custom", 1, {}});

  LookupFields empty_name{"custom", 1, {}};
  empty_name.Add("", "1");
  expect_invalid(empty_name);

  LookupFields duplicate{"custom", 1, {}};
  duplicate.Add("a", "1").Add("a", "2");
  expect_invalid(duplicate);

  for (const char* name : {"a|b", "a=b", "a:b"}) {
    LookupFields reserved{"custom", 1, {}};
    reserved.Add(name, "1");
    expect_invalid(reserved);
  }
}

TEST(LookupFieldsTest, JsonFormRoundTrips) {
  auto fields = FinancialLookup{"MSFT", "fundamentals"}.ToFields();
  auto parsed = LookupFields::FromJson(fields.ToJson());
  ASSERT_TRUE(parsed) << parsed.error().to_string();

  auto original_key = KeyCanonicalizer::Canonicalize(fields);
  auto parsed_key = KeyCanonicalizer::Canonicalize(*parsed);
  ASSERT_TRUE(original_key && parsed_key);
  EXPECT_EQ(*original_key, *parsed_key);
}

TEST(LookupFieldsTest, FromJsonRejectsWrongShape) {
  EXPECT_FALSE(LookupFields::FromJson(nlohmann::json::array()));
  EXPECT_FALSE(LookupFields::FromJson({{"fields", nlohmann::json::array()}}));
  EXPECT_FALSE(LookupFields::FromJson({{"schema", "x"}, {"fields", "not-an-array"}}));
  EXPECT_FALSE(LookupFields::FromJson({{"schema", "x"}, {"version", -1}, {"fields", nlohmann::json::array()}}));

  auto bad_field = LookupFields::FromJson(
      {{"schema", "x"}, {"fields", nlohmann::json::array({{{"name", "a"}, {"value", 1}}})}});
  ASSERT_FALSE(bad_field);
  EXPECT_EQ(bad_field.error().code(), ErrorCode::kCacheInvalidLookup);
}

}  // namespace semcache::cache
