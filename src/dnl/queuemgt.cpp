#include "dnl/queuemgt.hpp"
#include "dnl/line_source.hpp"
#include "dnl/pipeline.hpp"
#include "dnl/shared.hpp"
#include "kbharvest.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <fmt/chrono.h> // IWYU pragma: keep
#include <fmt/format.h>
#include <iostream>
#include <istream>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>

// queue management

// We have 2 threads:
//
// 1. the `requests` thread, which runs the pipeline: it pulls lines from the input, admits up to
// `workers` units, and drives the curl/libevent event loop which fetches and writes the files.
//
// 2. the `queuemgt` thread, which receives the outcome of every unit through the `msg_queue`,
// reports failures and keeps the tally.
//
// The `msg_queue` is the minimal communication interface between the two threads. It is
// append-only from the requests side. Outcomes arrive in completion order, not input order, and
// nothing downstream depends on the order.

namespace kbharvest::dnl {

namespace qmgt {

using clk = std::chrono::high_resolution_clock;

struct outcome_queue {
  std::mutex                  msgmutex;
  std::queue<fetch_outcome>   msg_queue;
  std::condition_variable_any msg_cv; // _any for stop_token
  bool                        finished = false;

  // msg API called by requests thread
  void enqueue(fetch_outcome&& outcome) {
    {
      const std::lock_guard lk(msgmutex);
      logger.log(fmt::format("enqueue(): acquired lock, outcome for line {}, notifying queuemgt "
                             "thread",
                             outcome.line_number));
      msg_queue.emplace(std::move(outcome));
    }
    msg_cv.notify_one();
  }

  // msg API called by requests thread
  void finish() {
    {
      const std::lock_guard lk(msgmutex);
      finished = true;
      logger.log("finish(): acquired lock, set finished = true, notifying queuemgt thread");
    }
    msg_cv.notify_one();
  }
};

struct progress_meter {
  clk::time_point start_time = clk::now();
  std::size_t     bytes      = 0;
  bool            enabled    = false;

  void print(const harvest_summary& summary) const {
    if (!enabled) return;

    auto elapsed       = clk::now() - start_time;
    auto elapsed_trunc = floor<std::chrono::seconds>(elapsed);
    auto elapsed_sec   = duration_cast<std::chrono::duration<double>>(elapsed).count();

    const std::lock_guard lk(cerr_mutex);
    std::cerr << fmt::format("Elapsed: {:%H:%M:%S}  Done: {} files  Failed: {}  {:.1f}MB/s\r",
                             elapsed_trunc, summary.succeeded, summary.failed,
                             static_cast<double>(bytes) / (1U << 20U) / elapsed_sec);
  }
};

void record(harvest_summary& summary, progress_meter& progress, fetch_outcome&& outcome) {
  if (outcome.success()) {
    ++summary.succeeded;
    progress.bytes += outcome.bytes;
  } else {
    ++summary.failed;
    if (progress.enabled) {
      const std::lock_guard lk(cerr_mutex);
      std::cerr << '\n'; // keep the progress line
    }
    logger.error(fmt::format("{}: {}: {}", outcome.url, to_string(*outcome.error), outcome.message));
  }
  summary.outcomes.emplace_back(std::move(outcome));
}

bool handle_exception(const std::exception_ptr& exception_ptr, const char* thrname) {
  if (exception_ptr) {
    try {
      std::rethrow_exception(exception_ptr);
    } catch (const std::exception& e) {
      logger.error(fmt::format("Caught exception in {} thread: {}", thrname, e.what()));
    }
    return true;
  }
  return false;
}

} // namespace qmgt

void service_queue(qmgt::outcome_queue& queue, harvest_summary& summary, bool show_progress,
                   std::stop_token stoken) { // NOLINT stoken
  qmgt::progress_meter progress{.enabled = show_progress};

  while (true) {
    std::unique_lock lk(queue.msgmutex);
    queue.msg_cv.wait(lk, stoken, [&] { return !queue.msg_queue.empty() || queue.finished; });

    if (stoken.stop_requested()) {
      logger.log("stop request received: bailing out");
      break;
    }

    // take the messages so the requests thread is not held up by the reporting
    std::queue<fetch_outcome> batch;
    batch.swap(queue.msg_queue);
    const bool finished = queue.finished;
    lk.unlock();

    logger.log(fmt::format("processing {} outcomes", batch.size()));
    while (!batch.empty()) {
      qmgt::record(summary, progress, std::move(batch.front()));
      batch.pop();
    }
    progress.print(summary);

    if (finished) break; // normal finish, requests thread enqueues nothing after finish()
  }
  if (show_progress) {
    std::cerr << "\n"; // clear line after progress if being shown, bit nasty
  }
}

harvest_summary run(const cli_config_t& cli, std::istream& input, transport& tp) {
  std::exception_ptr requests_exception;
  std::exception_ptr queuemgt_exception;

  qmgt::outcome_queue queue;
  harvest_summary     summary;
  line_source         source(input);

  {
    std::stop_source que_stop_source;

    std::jthread requests_thread([&]() {
      set_thread_name("requests");
      try {
        pipeline pl(source, tp,
                    pipeline_config{.output_dir = cli.output_dir,
                                    .workers    = cli.workers,
                                    .check      = cli.check},
                    [&](fetch_outcome&& outcome) { queue.enqueue(std::move(outcome)); });
        pl.run();
        logger.log(fmt::format("pipeline done, peak of {} units in flight", pl.peak_active()));
        queue.finish();
      } catch (...) {
        requests_exception = std::current_exception();
        logger.log("exception caught: requesting stop of queuemgt thread via stop_token");
        que_stop_source.request_stop();
      }
    });

    std::jthread queuemgt_thread([&]() {
      set_thread_name("queuemgt");
      try {
        service_queue(queue, summary, cli.progress, que_stop_source.get_token());
      } catch (...) {
        // requests thread runs to completion regardless, units can't be cancelled
        queuemgt_exception = std::current_exception();
      }
    });

  } // wait here until threads join

  // use temps to avoid short cct eval
  const bool ex_requests = qmgt::handle_exception(requests_exception, "requests");
  const bool ex_queuemgt = qmgt::handle_exception(queuemgt_exception, "queuemgt");
  if (ex_requests || ex_queuemgt) {
    throw std::runtime_error("Thread exceptions thrown as above. Sorry, we are aborting.");
  }
  return summary;
}

} // namespace kbharvest::dnl
