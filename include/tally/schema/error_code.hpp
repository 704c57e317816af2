#pragma once

#include <cstdint>

// Schema type: operation error code.
// Stable numeric failure taxonomy shared by the invoke and query verbs.
namespace tally::schema {

enum class error_code : uint32_t {
  validation_failed = 1,
  not_found = 2,
  already_exists = 3,
  permission_denied = 4,
  insufficient_funds = 5,
  invalid_state = 6,
  corrupt_record = 7,
  storage_failure = 8,
  unknown_operation = 9,
};

}  // namespace tally::schema
