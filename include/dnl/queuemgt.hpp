#pragma once

#include "dnl/shared.hpp"
#include "dnl/transport.hpp"
#include "kbharvest.hpp"
#include <istream>

namespace kbharvest::dnl {

// main entry point for a harvest. Reads urls from `input` and fetches them with `tp` into
// cli.output_dir. Returns every outcome once all units have completed. Item failures are reported
// and collected, only an orchestration failure throws.
harvest_summary run(const cli_config_t& cli, std::istream& input, transport& tp);

} // namespace kbharvest::dnl
