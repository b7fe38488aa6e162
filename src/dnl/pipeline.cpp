#include "dnl/pipeline.hpp"
#include "dnl/fetch.hpp"
#include "dnl/filename.hpp"
#include "dnl/line_source.hpp"
#include "dnl/shared.hpp"
#include "kbharvest.hpp"
#include <algorithm>
#include <exception>
#include <fmt/format.h>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace kbharvest::dnl {

bool line_handoff::push(input_line&& line) {
  std::unique_lock lk(mutex_);
  not_full_.wait(lk, [&] { return lines_.size() < capacity_ || aborted_; });
  if (aborted_) return false;
  lines_.emplace_back(std::move(line));
  return true;
}

std::optional<input_line> line_handoff::try_pop() {
  std::optional<input_line> line;
  {
    const std::lock_guard lk(mutex_);
    if (lines_.empty()) return std::nullopt;
    line.emplace(std::move(lines_.front()));
    lines_.pop_front();
  }
  not_full_.notify_one();
  return line;
}

void line_handoff::abort() {
  {
    const std::lock_guard lk(mutex_);
    aborted_ = true;
  }
  not_full_.notify_all();
}

pipeline::pipeline(line_source& source, transport& tp, pipeline_config cfg, outcome_fn_t sink)
    : source_(source), tp_(tp), cfg_(std::move(cfg)), sink_(std::move(sink)),
      handoff_(cfg_.workers) {
  if (cfg_.workers == 0) {
    throw std::invalid_argument("pipeline: workers must be at least 1");
  }
}

void pipeline::run() {
  tp_.keep_alive(true); // until the reader says the input is done
  {
    std::jthread reader([this] {
      set_thread_name("reader");
      try {
        read_lines();
      } catch (...) {
        // rethrown on the loop thread, which ends run()
        tp_.post([e = std::current_exception()] { std::rethrow_exception(e); });
      }
    });

    try {
      tp_.run();
    } catch (...) {
      handoff_.abort(); // reader may be blocked on a full handoff
      throw;            // after joining the reader
    }
  }

  if (!exhausted_ || active_ != 0) {
    throw std::runtime_error(fmt::format("unexpected condition: transport finished with {} units "
                                         "still active",
                                         active_));
  }
}

// reader thread. Blank and unreadable lines are dropped here, they never take a slot.
void pipeline::read_lines() {
  while (auto line = source_.next()) {
    if (!line->ok()) {
      logger.log(fmt::format("skipping line {}: {}", line->number, line->error));
      continue;
    }
    line->text = trim(line->text);
    if (line->text.empty()) continue;

    if (!handoff_.push(std::move(*line))) return; // aborted, nobody is listening any more
    tp_.post([this] { fill_slots(); });
  }
  // the last post, after it the transport is only kept running by transfers in flight
  tp_.post([this] {
    logger.log("input exhausted");
    input_closed_ = true;
    fill_slots();
  });
}

// Takes lines until all slots are busy or the handoff is empty. Completions call back in here,
// and a fetch which fails synchronously would recurse, so nested calls return immediately and
// leave the work to the outer loop.
void pipeline::fill_slots() {
  if (filling_ || exhausted_) return;
  filling_ = true;

  while (active_ != cfg_.workers) {
    auto line = handoff_.try_pop();
    if (!line) {
      // input_closed_ is set after the reader's last push, so an empty handoff is final
      if (input_closed_) {
        exhausted_ = true;
        tp_.keep_alive(false);
      }
      break;
    }
    start_unit(*line);
  }
  filling_ = false;
}

void pipeline::start_unit(const input_line& line) {
  ++active_;
  peak_active_ = std::max(peak_active_, active_);

  fetch_outcome job{.line_number = line.number, .url = line.text};
  try {
    job.target = derive_target_path(parse_url(job.url), cfg_.output_dir);
  } catch (const harvest_error& e) {
    job.error   = e.kind();
    job.message = e.what();
    finish_unit(std::move(job));
    return;
  }

  fetch(tp_, std::move(job), cfg_.check, [this](fetch_outcome&& outcome) {
    finish_unit(std::move(outcome));
    fill_slots();
  });
}

void pipeline::finish_unit(fetch_outcome&& outcome) {
  --active_;
  sink_(std::move(outcome));
}

} // namespace kbharvest::dnl
