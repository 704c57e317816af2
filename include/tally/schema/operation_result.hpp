#pragma once

#include <tally/schema/error_code.hpp>
#include <tally/schema/primitives.hpp>

#include <cstdint>
#include <string>
#include <utility>

// Schema type: operation result.
// Envelope returned by both verbs: payload bytes on success, or a numeric
// error code with a short log line and the failing key/field in info.
namespace tally::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
};

using operation_result_t = operation_result<1>;

inline operation_result_t make_success(bytes_t data = {}) {
  auto result = operation_result_t{};
  result.data = std::move(data);
  return result;
}

inline operation_result_t make_failure(const error_code code,
                                       std::string log,
                                       std::string info) {
  auto result = operation_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  return result;
}

}  // namespace tally::schema
