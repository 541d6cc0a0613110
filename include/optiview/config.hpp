#pragma once

#include <cstddef>
#include <string>

#include "optiview/errors.hpp"
#include "optiview/surface.hpp"

namespace optiview {

struct ServerConfig {
  std::string address = "0.0.0.0:50051";
  // Used when a request does not carry a risk-free rate.
  double default_rate = 0.05;
  std::size_t max_grid_points = kMaxGridPoints;
};

// Environment (OPTIVIEW_ADDRESS, OPTIVIEW_DEFAULT_RATE) first, then the
// command line: a bare argument is the listen address, and
// --address=, --default-rate=, --max-grid-points= override.
Result<ServerConfig> parse_server_config(int argc, const char* const* argv);

}  // namespace optiview
