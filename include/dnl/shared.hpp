#pragma once

#include <chrono>
#include <cstddef>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace kbharvest::dnl {

// app wide cli_config

struct cli_config_t {
  std::string input_filename; // empty => stdin
  std::string output_dir;
  std::size_t workers  = 5;
  bool        check    = true; // validate the kbart header before downloading
  bool        debug    = false;
  bool        progress = false;
  bool        quiet    = false;
};

// simple logging

extern std::mutex                                       cerr_mutex;
extern std::unordered_map<std::thread::id, std::string> thrnames;

void set_thread_name(const std::string& name);

struct thread_logger {
  void log(const std::string& msg) const {
    if (debug) write("debug", msg);
  }
  void info(const std::string& msg) const {
    if (!quiet) write("info", msg);
  }
  void error(const std::string& msg) const { write("error", msg); }

  bool debug = false;
  bool quiet = false;

private:
  static void write(const char* level, const std::string& msg) {
    const std::lock_guard lk(cerr_mutex);
    // can't portably use high resolution clock here
    auto timestamp = std::chrono::system_clock::now();
    auto thrname   = thrnames.find(std::this_thread::get_id());
    std::cerr << fmt::format("{:%Y-%m-%d %H:%M:%S} {:>5} thread: {:>9}: {}\n", timestamp, level,
                             thrname != thrnames.end() ? thrname->second : "main", msg);
  }
};

extern thread_logger logger;

} // namespace kbharvest::dnl
