#pragma once

#include "dnl/fetch.hpp"
#include "dnl/line_source.hpp"
#include "dnl/transport.hpp"
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>

namespace kbharvest::dnl {

struct pipeline_config {
  std::filesystem::path output_dir;
  std::size_t           workers = 5;
  bool                  check   = true;
};

// Bounded single-producer/single-consumer handoff of input lines. push() blocks while full,
// try_pop() never blocks. abort() releases a blocked producer for good.
class line_handoff {
public:
  explicit line_handoff(std::size_t capacity) : capacity_(capacity) {}

  bool                      push(input_line&& line); // false once aborted
  std::optional<input_line> try_pop();
  void                      abort();

private:
  std::mutex              mutex_;
  std::condition_variable not_full_;
  std::deque<input_line>  lines_;
  std::size_t             capacity_;
  bool                    aborted_ = false;
};

// Drives the lines of a line_source through filename derivation and fetch, keeping at most
// `workers` units in flight. A unit holds its slot from the moment its line is taken until its
// outcome has been handed to the sink. Blank and unreadable lines produce no outcome.
//
// The source is read on a thread of its own, at most `workers` lines ahead, so a slow input never
// stalls the transfers. Everything else, the sink included, runs on the thread which calls run().
class pipeline {
public:
  pipeline(line_source& source, transport& tp, pipeline_config cfg, outcome_fn_t sink);

  // returns once the source is exhausted and every unit has delivered its outcome
  void run();

  [[nodiscard]] std::size_t peak_active() const { return peak_active_; }

private:
  void read_lines();
  void fill_slots();
  void start_unit(const input_line& line);
  void finish_unit(fetch_outcome&& outcome);

  line_source&    source_; // NOLINT reference
  transport&      tp_;     // NOLINT reference
  pipeline_config cfg_;
  outcome_fn_t    sink_;
  line_handoff    handoff_;

  // only touched on the run() thread
  std::size_t active_       = 0;
  std::size_t peak_active_  = 0;
  bool        input_closed_ = false;
  bool        exhausted_    = false;
  bool        filling_      = false;
};

} // namespace kbharvest::dnl
