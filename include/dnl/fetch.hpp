#pragma once

#include "dnl/transport.hpp"
#include "kbharvest.hpp"
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace kbharvest::dnl {

using outcome_fn_t = std::function<void(fetch_outcome&&)>;

// throws harvest_error: transport_error or http_status
void check_download(const std::string& url, const response& resp);

// Creates or truncates `target` and writes `body` to it, byte for byte.
// throws harvest_error(filesystem_error)
void write_body(const std::filesystem::path& target, const std::vector<char>& body);

// Fetches `job.url` into `job.target`: header check first when `check` is set, then the full
// transfer and the write. `done` is called exactly once, with `job` marked as succeeded or failed.
// A failed check never touches `job.target`.
void fetch(transport& tp, fetch_outcome job, bool check, outcome_fn_t done);

} // namespace kbharvest::dnl
