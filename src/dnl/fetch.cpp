#include "dnl/fetch.hpp"
#include "dnl/shared.hpp"
#include "dnl/transport.hpp"
#include "dnl/validate.hpp"
#include "kbharvest.hpp"
#include <cerrno>
#include <cstring>
#include <exception>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <ios>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace kbharvest::dnl {

namespace {

// shared between the stages of one fetch, std::function needs copyable lambdas
struct fetch_state {
  fetch_outcome outcome;
  outcome_fn_t  done;
};

using state_ptr = std::shared_ptr<fetch_state>;

void succeed(const state_ptr& st) { st->done(std::move(st->outcome)); }

void fail(const state_ptr& st, error_kind kind, std::string message) {
  st->outcome.error   = kind;
  st->outcome.message = std::move(message);
  st->done(std::move(st->outcome));
}

void download_completed(const state_ptr& st, const response& resp) {
  try {
    check_download(st->outcome.url, resp);
    write_body(st->outcome.target, resp.body);
  } catch (const harvest_error& e) {
    fail(st, e.kind(), e.what());
    return;
  }
  st->outcome.bytes = resp.body.size();
  logger.log(fmt::format("wrote {} bytes to {}", resp.body.size(), st->outcome.target.string()));
  succeed(st);
}

void start_download(transport& tp, const state_ptr& st) {
  logger.info(fmt::format("downloading {}", st->outcome.url));
  try {
    tp.submit(request{.url = st->outcome.url, .range = {}, .headers = {}},
              [st](response&& resp) { download_completed(st, resp); });
  } catch (const std::exception& e) {
    fail(st, error_kind::transport_error, e.what());
  }
}

void sniff_completed(transport& tp, const state_ptr& st, const response& sniff) {
  try {
    check_header(st->outcome.url, sniff);
  } catch (const harvest_error& e) {
    fail(st, e.kind(), e.what());
    return;
  }
  start_download(tp, st);
}

void start_sniff(transport& tp, const state_ptr& st) {
  logger.info(fmt::format("checking kbart header of {}", st->outcome.url));
  try {
    tp.submit(make_sniff_request(st->outcome.url),
              [&tp, st](response&& sniff) { sniff_completed(tp, st, sniff); });
  } catch (const std::exception& e) {
    fail(st, error_kind::transport_error, e.what());
  }
}

} // namespace

void check_download(const std::string& url, const response& resp) {
  if (resp.failed()) {
    throw harvest_error(error_kind::transport_error,
                        fmt::format("downloading {} failed: {}", url, resp.error));
  }
  if (resp.status >= 400) {
    throw harvest_error(error_kind::http_status,
                        fmt::format("downloading {} returned HTTP {}", url, resp.status));
  }
}

void write_body(const std::filesystem::path& target, const std::vector<char>& body) {
  std::ofstream os(target, std::ios_base::binary | std::ios_base::trunc);
  if (!os) {
    throw harvest_error(error_kind::filesystem_error,
                        fmt::format("Error opening '{}' for writing. Because: \"{}\".",
                                    target.string(), std::strerror(errno))); // NOLINT errno
  }
  os.write(body.data(), static_cast<std::streamsize>(body.size()));
  os.close();
  if (!os) {
    throw harvest_error(error_kind::filesystem_error,
                        fmt::format("Error writing {} bytes to '{}'.", body.size(), target.string()));
  }
}

void fetch(transport& tp, fetch_outcome job, bool check, outcome_fn_t done) {
  auto st = std::make_shared<fetch_state>(fetch_state{std::move(job), std::move(done)});
  if (check) {
    start_sniff(tp, st);
  } else {
    start_download(tp, st);
  }
}

} // namespace kbharvest::dnl
