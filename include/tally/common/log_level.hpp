#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace tally::common {

/// Map a level name to an spdlog level. Unknown names yield std::nullopt
/// rather than spdlog's fallback of `off`.
inline std::optional<spdlog::level::level_enum> try_parse_log_level(
    const std::string_view name) {
  auto level = spdlog::level::from_str(std::string{name});
  if (level == spdlog::level::off && name != "off") {
    return std::nullopt;
  }
  return level;
}

}  // namespace tally::common
