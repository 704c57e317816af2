#include <tally/schema/encoding/json/fields.hpp>

namespace tally::schema::encoding::json {

bool read_string(const Json::Value& in, const char* field, std::string& out) {
  const auto& value = in[field];
  if (!value.isString()) {
    return false;
  }
  out = value.asString();
  return true;
}

bool read_optional_string(const Json::Value& in,
                          const char* field,
                          std::optional<std::string>& out) {
  const auto& value = in[field];
  if (value.isNull()) {
    out.reset();
    return true;
  }
  if (!value.isString()) {
    return false;
  }
  auto text = value.asString();
  if (text == kUndefined) {
    out.reset();
  } else {
    out = std::move(text);
  }
  return true;
}

void write_optional_string(const std::optional<std::string>& value,
                           Json::Value& out) {
  out = value.value_or(std::string{kUndefined});
}

bool read_string_list(const Json::Value& in, std::vector<std::string>& out) {
  out.clear();
  if (in.isNull()) {
    return true;
  }
  if (!in.isArray()) {
    return false;
  }
  out.reserve(in.size());
  for (const auto& entry : in) {
    if (!entry.isString()) {
      return false;
    }
    out.push_back(entry.asString());
  }
  return true;
}

}  // namespace tally::schema::encoding::json
