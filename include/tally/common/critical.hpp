#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace tally::common {

/// Log an unrecoverable fault and stop the process.
///
/// Reserved for failures the ledger cannot report back through an
/// operation result (the store cannot be opened, a read fails for a reason
/// other than a missing key).
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace tally::common
