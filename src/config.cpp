#include "optiview/config.hpp"

#include <cmath>
#include <cstdlib>
#include <string_view>

namespace optiview {

namespace {

constexpr std::string_view kAddressFlag = "--address=";
constexpr std::string_view kDefaultRateFlag = "--default-rate=";
constexpr std::string_view kMaxGridPointsFlag = "--max-grid-points=";

Result<double> parse_rate(const std::string& text) {
  char* end = nullptr;
  const double value = std::strtod(text.c_str(), &end);
  if (text.empty() || end == nullptr || *end != '\0' || !std::isfinite(value)) {
    return validation_error("invalid default rate '" + text + "'");
  }
  return value;
}

Result<std::size_t> parse_grid_points(const std::string& text) {
  char* end = nullptr;
  const unsigned long long value = std::strtoull(text.c_str(), &end, 10);
  if (text.empty() || text.front() == '-' || end == nullptr || *end != '\0') {
    return validation_error("invalid max grid points '" + text + "'");
  }
  if (value < 2 || value > kMaxGridPoints) {
    return validation_error(
      "max grid points must be in [2, " + std::to_string(kMaxGridPoints) + "], got " + text);
  }
  return static_cast<std::size_t>(value);
}

}  // namespace

Result<ServerConfig> parse_server_config(int argc, const char* const* argv) {
  ServerConfig config;

  if (const char* address = std::getenv("OPTIVIEW_ADDRESS"); address != nullptr && *address != '\0') {
    config.address = address;
  }
  if (const char* rate = std::getenv("OPTIVIEW_DEFAULT_RATE"); rate != nullptr && *rate != '\0') {
    auto parsed = parse_rate(rate);
    if (!parsed) {
      return parsed.error();
    }
    config.default_rate = parsed.value();
  }

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg.starts_with(kAddressFlag)) {
      config.address = std::string(arg.substr(kAddressFlag.size()));
      if (config.address.empty()) {
        return validation_error("--address must not be empty");
      }
    } else if (arg.starts_with(kDefaultRateFlag)) {
      auto parsed = parse_rate(std::string(arg.substr(kDefaultRateFlag.size())));
      if (!parsed) {
        return parsed.error();
      }
      config.default_rate = parsed.value();
    } else if (arg.starts_with(kMaxGridPointsFlag)) {
      auto parsed = parse_grid_points(std::string(arg.substr(kMaxGridPointsFlag.size())));
      if (!parsed) {
        return parsed.error();
      }
      config.max_grid_points = parsed.value();
    } else if (arg.starts_with("-")) {
      return validation_error("unknown option '" + std::string(arg) + "'");
    } else {
      config.address = std::string(arg);
    }
  }

  return config;
}

}  // namespace optiview
