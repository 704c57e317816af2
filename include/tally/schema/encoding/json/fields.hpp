#pragma once
#include <json/json.h>
#include <tally/schema/primitives.hpp>
#include <optional>
#include <string>
#include <vector>

// Field readers shared by the record codecs. Each returns false when the
// field is missing or has the wrong JSON type.
namespace tally::schema::encoding::json {

bool read_string(const Json::Value& in, const char* field, std::string& out);

/// String field where `UNDEFINED`, null or absence mean "unset".
bool read_optional_string(const Json::Value& in,
                          const char* field,
                          std::optional<std::string>& out);

void write_optional_string(const std::optional<std::string>& value,
                           Json::Value& out);

bool read_string_list(const Json::Value& in, std::vector<std::string>& out);

}  // namespace tally::schema::encoding::json
