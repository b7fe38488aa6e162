#include "dnl/requests.hpp"
#include "gtest/gtest.h"
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace dnl = kbharvest::dnl;

// No test here leaves the local machine.

namespace {

dnl::response fetch_one(dnl::curl_transport& tp, std::string url) {
  dnl::response result;
  bool          completed = false;
  tp.submit(dnl::request{.url = std::move(url), .range = {}, .headers = {}},
            [&](dnl::response&& resp) {
              result    = std::move(resp);
              completed = true;
            });
  tp.run();
  EXPECT_TRUE(completed);
  return result;
}

} // namespace

TEST(requests, local_files_are_refused) { // NOLINT
  auto path = std::filesystem::temp_directory_path() /
              fmt::format("kbharvest_local_{}.kbart", std::random_device{}());
  {
    std::ofstream os(path);
    os << "secret\n";
  }

  dnl::curl_transport tp;
  auto                resp = fetch_one(tp, "file://" + path.string());
  std::filesystem::remove(path);

  EXPECT_TRUE(resp.failed());
  EXPECT_TRUE(resp.body.empty());
  EXPECT_EQ(resp.status, 0);
}

TEST(requests, other_schemes_are_refused) { // NOLINT
  dnl::curl_transport tp;
  EXPECT_TRUE(fetch_one(tp, "dict://127.0.0.1:1/x").failed());
  EXPECT_TRUE(fetch_one(tp, "gopher://127.0.0.1:1/x").failed());
}

TEST(requests, connection_refused_is_a_failed_response) { // NOLINT
  dnl::curl_transport tp;
  auto                resp = fetch_one(tp, "http://127.0.0.1:1/list.kbart");
  EXPECT_TRUE(resp.failed());
  EXPECT_FALSE(resp.error.empty());
}

TEST(requests, posted_task_runs_on_the_loop) { // NOLINT
  dnl::curl_transport tp;
  auto                loop_id = std::this_thread::get_id();
  std::thread::id     ran_on;

  tp.keep_alive(true);
  std::jthread poster([&] {
    tp.post([&] {
      ran_on = std::this_thread::get_id();
      tp.keep_alive(false);
    });
  });
  tp.run(); // returns only once the posted task has released the loop
  EXPECT_EQ(ran_on, loop_id);
}

TEST(requests, exception_from_callback_is_rethrown_by_run) { // NOLINT
  dnl::curl_transport tp;
  tp.submit(dnl::request{.url = "http://127.0.0.1:1/x", .range = {}, .headers = {}},
            [](dnl::response&& /*resp*/) { throw std::runtime_error("callback failed"); });
  EXPECT_THROW(tp.run(), std::runtime_error);
}
