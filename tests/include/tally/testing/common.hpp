#pragma once

#include <tally/schema/decimal.hpp>
#include <tally/schema/encoding/json/encoder.hpp>
#include <tally/schema/operation_result.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/storage/memory/storage.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace tally::testing {

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

inline tally::schema::decimal_t make_decimal(const std::string_view text) {
  return *tally::schema::try_parse_decimal(text);
}

inline uint32_t code_of(const tally::schema::error_code code) {
  return static_cast<uint32_t>(code);
}

inline std::string data_of(const tally::schema::operation_result_t& result) {
  return tally::schema::make_string(result.data);
}

/// Parsed JSON payload of a successful result; null when it is not JSON.
inline Json::Value json_of(const tally::schema::operation_result_t& result) {
  auto root = tally::schema::encoding::json::read_document(
      tally::schema::make_bytes_view(result.data));
  return root.value_or(Json::Value{});
}

/// Fault injector that fails the first write to `key` and nothing after.
inline tally::storage::fault_injector_t fail_once_at(const std::string_view key) {
  auto fired = std::make_shared<bool>(false);
  return [fired, target = tally::schema::make_bytes(key)](
             const tally::storage::write_entry& entry) {
    if (*fired || entry.key != target) {
      return false;
    }
    *fired = true;
    return true;
  };
}

/// Fault injector that fails every write to `key`.
inline tally::storage::fault_injector_t fail_always_at(
    const std::string_view key) {
  return [target = tally::schema::make_bytes(key)](
             const tally::storage::write_entry& entry) {
    return entry.key == target;
  };
}

}  // namespace tally::testing
