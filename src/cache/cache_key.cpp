/**
 * @file cache_key.cpp
 * @brief Canonical cache key construction
 */

#include "cache/cache_key.h"

#include <unordered_set>

namespace semcache::cache {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

constexpr const char* kFieldSeparator = "|";

bool HasReservedChar(const std::string& name) {
  return name.find_first_of("|=:") != std::string::npos;
}

}  // namespace

// ============================================================================
// LookupFields JSON form
// ============================================================================

nlohmann::json LookupFields::ToJson() const {
  nlohmann::json field_array = nlohmann::json::array();
  for (const auto& field : fields) {
    field_array.push_back({{"name", field.name}, {"value", field.value}});
  }
  return {{"schema", schema}, {"version", version}, {"fields", std::move(field_array)}};
}

utils::Expected<LookupFields, utils::Error> LookupFields::FromJson(const nlohmann::json& json) {
  if (!json.is_object()) {
    return MakeUnexpected(MakeError(ErrorCode::kCacheInvalidLookup, "Lookup must be a JSON object"));
  }

  auto schema_iter = json.find("schema");
  if (schema_iter == json.end() || !schema_iter->is_string()) {
    return MakeUnexpected(MakeError(ErrorCode::kCacheInvalidLookup, "Lookup 'schema' must be a string"));
  }

  LookupFields lookup;
  lookup.schema = schema_iter->get<std::string>();

  auto version_iter = json.find("version");
  if (version_iter != json.end()) {
    if (!version_iter->is_number_unsigned()) {
      return MakeUnexpected(MakeError(ErrorCode::kCacheInvalidLookup, "Lookup 'version' must be an unsigned integer"));
    }
    lookup.version = version_iter->get<uint32_t>();
  }

  auto fields_iter = json.find("fields");
  if (fields_iter == json.end() || !fields_iter->is_array()) {
    return MakeUnexpected(MakeError(ErrorCode::kCacheInvalidLookup, "Lookup 'fields' must be an array"));
  }
  for (const auto& field : *fields_iter) {
    if (!field.is_object() || !field.contains("name") || !field.contains("value") || !field["name"].is_string() ||
        !field["value"].is_string()) {
      return MakeUnexpected(
          MakeError(ErrorCode::kCacheInvalidLookup, "Lookup field must be {\"name\": string, \"value\": string}"));
    }
    lookup.Add(field["name"].get<std::string>(), field["value"].get<std::string>());
  }

  return lookup;
}

// ============================================================================
// Per-domain lookups
// ============================================================================

LookupFields QueryLookup::ToFields() const {
  LookupFields lookup{"query", 1, {}};
  lookup.Add("query", query).Add("is_first_message", is_first_message ? "true" : "false");
  return lookup;
}

LookupFields FinancialLookup::ToFields() const {
  LookupFields lookup{"financial", 1, {}};
  lookup.Add("ticker", ticker).Add("data_type", data_type);
  return lookup;
}

LookupFields TickerLookup::ToFields() const {
  LookupFields lookup{"ticker", 1, {}};
  lookup.Add("company_name", company_name);
  return lookup;
}

LookupFields ProbeLookup::ToFields() const {
  LookupFields lookup{"probe", 1, {}};
  lookup.Add("probe_id", probe_id);
  return lookup;
}

// ============================================================================
// KeyCanonicalizer
// ============================================================================

utils::Expected<std::string, utils::Error> KeyCanonicalizer::Canonicalize(const LookupFields& lookup) {
  if (lookup.schema.empty() || lookup.schema.find(kFieldSeparator) != std::string::npos) {
    return MakeUnexpected(MakeError(ErrorCode::kCacheInvalidLookup, "Invalid lookup schema name", lookup.schema));
  }
  if (lookup.version == 0) {
    return MakeUnexpected(MakeError(ErrorCode::kCacheInvalidLookup, "Lookup schema version must be >= 1",
                                    lookup.schema));
  }
  if (lookup.fields.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kCacheInvalidLookup, "Lookup has no fields", lookup.schema));
  }

  std::string key = lookup.schema + "/v" + std::to_string(lookup.version);
  std::unordered_set<std::string> seen;
  for (const auto& field : lookup.fields) {
    if (field.name.empty() || HasReservedChar(field.name)) {
      return MakeUnexpected(
          MakeError(ErrorCode::kCacheInvalidLookup, "Invalid lookup field name '" + field.name + "'", lookup.schema));
    }
    if (!seen.insert(field.name).second) {
      return MakeUnexpected(
          MakeError(ErrorCode::kCacheInvalidLookup, "Duplicate lookup field '" + field.name + "'", lookup.schema));
    }

    key += kFieldSeparator;
    key += field.name;
    key += '=';
    key += std::to_string(field.value.size());
    key += ':';
    key += field.value;
  }

  return key;
}

}  // namespace semcache::cache
