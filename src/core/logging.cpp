#include "worldvault/core/logging.hpp"

#include <spdlog/spdlog.h>

#include <string>

namespace worldvault::core {

auto apply_log_level(std::string_view level) -> std::expected<void, error> {
  const std::string name(level);
  const auto parsed = spdlog::level::from_str(name);
  // from_str maps unknown names to off; only accept off when asked for explicitly.
  if (parsed == spdlog::level::off && name != "off") {
    return std::unexpected(error{error_code::config_invalid, "unknown log level \"" + name + "\"", "core.logging"});
  }
  spdlog::set_level(parsed);
  return {};
}

} // namespace worldvault::core
