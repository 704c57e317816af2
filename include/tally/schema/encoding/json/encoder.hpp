#pragma once
#include <json/json.h>
#include <tally/common/critical.hpp>
#include <tally/schema/encoding/encoder.hpp>
#include <tally/schema/encoding/json/account.hpp>
#include <tally/schema/encoding/json/decimal.hpp>
#include <tally/schema/encoding/json/index_record.hpp>
#include <tally/schema/encoding/json/invoice.hpp>
#include <tally/schema/encoding/json/reconcile_report.hpp>
#include <memory>
#include <string>

namespace tally::schema::encoding {

struct json_encoder_tag {};

namespace json {

/// Compact UTF-8 rendering of a JSON document.
tally::schema::bytes_t write_document(const Json::Value& root);

/// Parse a complete JSON document; trailing garbage and duplicate keys are
/// rejected.
std::optional<Json::Value> read_document(
    const tally::schema::bytes_view_t& bytes);

}  // namespace json

template <>
struct encoder<json_encoder_tag> final {
  template <typename T>
  tally::schema::bytes_t encode(const T& obj);

  /// Encode a sequence of records as one JSON array.
  template <typename T>
  tally::schema::bytes_t encode_list(const std::vector<T>& objs);

  template <typename T>
  T decode(const tally::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const tally::schema::bytes_view_t& bytes);
};

template <typename T>
tally::schema::bytes_t encoder<json_encoder_tag>::encode(const T& obj) {
  auto root = Json::Value{};
  json::encode(obj, root);
  return json::write_document(root);
}

template <typename T>
tally::schema::bytes_t encoder<json_encoder_tag>::encode_list(
    const std::vector<T>& objs) {
  auto root = Json::Value{Json::arrayValue};
  for (const auto& obj : objs) {
    auto entry = Json::Value{};
    json::encode(obj, entry);
    root.append(std::move(entry));
  }
  return json::write_document(root);
}

template <typename T>
T encoder<json_encoder_tag>::decode(const tally::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    tally::common::critical("failed to decode JSON record");
  }
  return std::move(*decoded);
}

template <typename T>
std::optional<T> encoder<json_encoder_tag>::try_decode(
    const tally::schema::bytes_view_t& bytes) {
  auto root = json::read_document(bytes);
  if (!root) {
    return std::nullopt;
  }
  auto out = T{};
  if (!json::decode(*root, out)) {
    return std::nullopt;
  }
  return out;
}

}  // namespace tally::schema::encoding
