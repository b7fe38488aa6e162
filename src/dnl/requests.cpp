#include "dnl/requests.hpp"
#include "dnl/shared.hpp"
#include "dnl/transport.hpp"
#include <algorithm>
#include <cstddef>
#include <curl/curl.h>
#include <curl/multi.h>
#include <event2/event.h>
#include <event2/thread.h>
#include <exception>
#include <fmt/format.h>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace kbharvest::dnl {

// one in-flight request. owns the easy handle and the header list curl holds pointers into
struct curl_transport::transfer {
  transfer(CURL* easy_, done_fn_t done_) : easy(easy_), done(std::move(done_)) {}
  transfer(const transfer&)            = delete;
  transfer& operator=(const transfer&) = delete;
  transfer(transfer&&)                 = delete;
  transfer& operator=(transfer&&)      = delete;
  ~transfer() {
    curl_easy_cleanup(easy);
    curl_slist_free_all(headers);
  }

  CURL*       easy;
  curl_slist* headers = nullptr;
  done_fn_t   done;
  response    resp;
  std::string range;
  char        errbuf[CURL_ERROR_SIZE]{}; // NOLINT c-array for curl API
};

// connects an event with a socketfd
struct curl_transport::curl_context_t {
  curl_transport* owner;
  struct event*   event;
  curl_socket_t   sockfd;
};

curl_transport::curl_transport() {
  if (curl_global_init(CURL_GLOBAL_ALL) != 0) {
    throw std::runtime_error("Error: Could not init curl");
  }

  // post() activates the wakeup event from other threads, the base needs locking for that
  static const int evthread_status = evthread_use_pthreads();
  if (evthread_status != 0) {
    curl_global_cleanup();
    throw std::runtime_error("Error: Could not enable libevent pthreads support");
  }

  ebase_ = event_base_new();
  if (ebase_ == nullptr) {
    curl_global_cleanup();
    throw std::runtime_error("Error: Could not create libevent event_base");
  }
  timeout_ = evtimer_new(ebase_, timeout_event_cb, this);
  wakeup_  = event_new(ebase_, -1, EV_PERSIST, wakeup_event_cb, this);

  curl_multi_handle_ = curl_multi_init();
  curl_multi_setopt(curl_multi_handle_, CURLMOPT_PIPELINING, CURLPIPE_MULTIPLEX);
  curl_multi_setopt(curl_multi_handle_, CURLMOPT_SOCKETFUNCTION, handle_socket_curl_cb);
  curl_multi_setopt(curl_multi_handle_, CURLMOPT_SOCKETDATA, this);
  curl_multi_setopt(curl_multi_handle_, CURLMOPT_TIMERFUNCTION, start_timeout_curl_cb);
  curl_multi_setopt(curl_multi_handle_, CURLMOPT_TIMERDATA, this);
}

curl_transport::~curl_transport() {
  for (auto& [easy, xfer]: transfers_) {
    if (auto res = curl_multi_remove_handle(curl_multi_handle_, easy); res != CURLM_OK) {
      std::cerr << fmt::format("error in curl_multi_remove_handle(): '{}'\n",
                               curl_multi_strerror(res));
    }
  }
  transfers_.clear(); // more efficient to clear all at once

  if (auto res = curl_multi_cleanup(curl_multi_handle_); res != CURLM_OK) {
    std::cerr << fmt::format("error: curl_multi_cleanup: '{}'\n", curl_multi_strerror(res));
  }

  event_free(wakeup_);
  event_free(timeout_);
  event_base_free(ebase_);
  curl_global_cleanup();
}

void curl_transport::submit(request req, done_fn_t done) {
  CURL* easy = curl_easy_init();
  if (easy == nullptr) {
    throw std::runtime_error(fmt::format("{}: curl_easy_init failed", req.url));
  }
  auto xfer = std::make_unique<transfer>(easy, std::move(done));

  for (const auto& header: req.headers) {
    xfer->headers = curl_slist_append(xfer->headers, header.c_str());
  }

  curl_easy_setopt(easy, CURLOPT_PIPEWAIT, 1L); // wait for multiplexing! key for perf
  curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, write_data_curl_cb);
  curl_easy_setopt(easy, CURLOPT_WRITEDATA, xfer.get());
  curl_easy_setopt(easy, CURLOPT_PRIVATE, xfer.get());
  curl_easy_setopt(easy, CURLOPT_ERRORBUFFER, xfer->errbuf);
  curl_easy_setopt(easy, CURLOPT_URL, req.url.c_str()); // curl copies the string
  curl_easy_setopt(easy, CURLOPT_PROTOCOLS_STR, "http,https");
  curl_easy_setopt(easy, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
  curl_easy_setopt(easy, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(easy, CURLOPT_MAXREDIRS, 10L);
  curl_easy_setopt(easy, CURLOPT_HTTPHEADER, xfer->headers);
  if (req.range) {
    xfer->range = fmt::format("{}-{}", req.range->first, req.range->second);
    curl_easy_setopt(easy, CURLOPT_RANGE, xfer->range.c_str());
  }
  // abort if slower than 1000 bytes/sec during 30 seconds
  curl_easy_setopt(easy, CURLOPT_LOW_SPEED_TIME, 30L);
  curl_easy_setopt(easy, CURLOPT_LOW_SPEED_LIMIT, 1000L);

  auto [iter, inserted] = transfers_.emplace(easy, std::move(xfer));
  if (!inserted) {
    throw std::runtime_error(fmt::format("unexpected condition: easy handle for {} already existed",
                                         req.url));
  }
  if (auto res = curl_multi_add_handle(curl_multi_handle_, easy); res != CURLM_OK) {
    transfers_.erase(iter);
    throw std::runtime_error(
        fmt::format("{}: curl_multi_add_handle: '{}'", req.url, curl_multi_strerror(res)));
  }
  logger.log(fmt::format("submitted {} ({} transfers active)", req.url, transfers_.size()));
}

void curl_transport::run() {
  callback_exception_ = nullptr;
  event_base_dispatch(ebase_);
  if (callback_exception_) {
    std::rethrow_exception(std::exchange(callback_exception_, nullptr));
  }
}

void curl_transport::post(task_fn_t task) {
  {
    const std::lock_guard lk(posted_mutex_);
    posted_.push_back(std::move(task));
  }
  event_active(wakeup_, 0, 0);
}

// an added wakeup_ event keeps event_base_dispatch() running while no transfer is in flight
void curl_transport::keep_alive(bool on) {
  if (on) {
    event_add(wakeup_, nullptr);
    return;
  }
  event_del(wakeup_); // also drops a pending activation
  const std::lock_guard lk(posted_mutex_);
  if (!posted_.empty()) event_active(wakeup_, 0, 0);
}

void curl_transport::run_posted_tasks() {
  std::vector<task_fn_t> tasks;
  {
    const std::lock_guard lk(posted_mutex_);
    tasks.swap(posted_);
  }
  for (auto& task: tasks) task();
}

void curl_transport::process_curl_done_msg(CURLMsg* message) {
  CURL* easy_handle = message->easy_handle;
  auto  result      = message->data.result;

  curl_multi_remove_handle(curl_multi_handle_, easy_handle);
  auto nh = transfers_.extract(easy_handle);
  if (nh.empty()) {
    throw std::runtime_error("unexpected condition: completed transfer was not registered");
  }
  auto& xfer = *nh.mapped();

  curl_easy_getinfo(easy_handle, CURLINFO_RESPONSE_CODE, &xfer.resp.status);

  char* content_type = nullptr;
  curl_easy_getinfo(easy_handle, CURLINFO_CONTENT_TYPE, &content_type);
  if (content_type != nullptr) xfer.resp.content_type = content_type;

  if (result != CURLE_OK) {
    xfer.resp.error = xfer.errbuf[0] != '\0'
                          ? fmt::format("{}: {}", curl_easy_strerror(result), xfer.errbuf)
                          : curl_easy_strerror(result);
    xfer.resp.body.clear(); // throw away anything that was returned
  }

  char* url = nullptr;
  curl_easy_getinfo(easy_handle, CURLINFO_EFFECTIVE_URL, &url);
  logger.log(fmt::format("transfer {} complete: status {}, {} bytes, result '{}'",
                         url != nullptr ? url : "?", xfer.resp.status, xfer.resp.body.size(),
                         curl_easy_strerror(result)));

  xfer.done(std::move(xfer.resp)); // may submit new transfers
}

void curl_transport::process_curl_messages() {
  CURLMsg* message = nullptr;
  int      pending = 0;

  while ((message = curl_multi_info_read(curl_multi_handle_, &pending)) != nullptr) {
    switch (message->msg) {
    case CURLMSG_DONE:
      // exceptions must not unwind through libevent's C frames
      try {
        process_curl_done_msg(message);
      } catch (...) {
        callback_exception_ = std::current_exception();
        event_base_loopbreak(ebase_);
        return;
      }
      break;

    default:
      logger.log("CURLMSG default");
      break;
    }
  }
}

// event callbacks

void curl_transport::curl_perform_event_cb(evutil_socket_t /*fd*/, short event, void* arg) {
  int running_handles = 0;
  int flags           = 0;

  if (event & EV_READ) flags |= CURL_CSELECT_IN;   // NOLINT -> bool & bitwise
  if (event & EV_WRITE) flags |= CURL_CSELECT_OUT; // NOLINT -> bool & bitwise

  auto* context = static_cast<curl_context_t*>(arg);
  auto* owner   = context->owner; // context may be destroyed by socket_action

  curl_multi_socket_action(owner->curl_multi_handle_, context->sockfd, flags, &running_handles);

  owner->process_curl_messages();
}

void curl_transport::timeout_event_cb(evutil_socket_t /*fd*/, short /*events*/, void* arg) {
  auto* owner           = static_cast<curl_transport*>(arg);
  int   running_handles = 0;
  curl_multi_socket_action(owner->curl_multi_handle_, CURL_SOCKET_TIMEOUT, 0, &running_handles);
  owner->process_curl_messages();
}

void curl_transport::wakeup_event_cb(evutil_socket_t /*fd*/, short /*events*/, void* arg) {
  auto* owner = static_cast<curl_transport*>(arg);
  // exceptions must not unwind through libevent's C frames
  try {
    owner->run_posted_tasks();
  } catch (...) {
    owner->callback_exception_ = std::current_exception();
    event_base_loopbreak(owner->ebase_);
  }
}

// CURL callbacks

std::size_t curl_transport::write_data_curl_cb(char* ptr, std::size_t size, std::size_t nmemb,
                                               void* userdata) {
  auto* xfer     = static_cast<transfer*>(userdata);
  auto  realsize = size * nmemb;
  std::copy(ptr, ptr + realsize, std::back_inserter(xfer->resp.body));

  return realsize;
}

int curl_transport::start_timeout_curl_cb(CURLM* /*multi*/, long timeout_ms, void* userp) {
  auto* owner = static_cast<curl_transport*>(userp);
  if (timeout_ms < 0) {
    evtimer_del(owner->timeout_);
  } else {
    if (timeout_ms == 0) timeout_ms = 1; /* 0 means call socket_action asap */
    timeval tv{};
    tv.tv_sec  = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;

    evtimer_del(owner->timeout_);
    evtimer_add(owner->timeout_, &tv);
  }
  return 0;
}

curl_transport::curl_context_t* curl_transport::create_curl_context(curl_socket_t sockfd) {
  auto* context = new curl_context_t; // NOLINT manual new and delete

  context->owner  = this;
  context->sockfd = sockfd;
  context->event  = event_new(ebase_, static_cast<evutil_socket_t>(sockfd), 0,
                              curl_perform_event_cb, context);

  return context;
}

void curl_transport::destroy_curl_context(curl_context_t* context) {
  event_del(context->event);
  event_free(context->event);
  delete context; // NOLINT manual new and delete
}

int curl_transport::handle_socket_curl_cb(CURL* /*easy*/, curl_socket_t s, int action, void* userp,
                                          void* socketp) {
  auto*           owner        = static_cast<curl_transport*>(userp);
  curl_context_t* curl_context = nullptr;
  short           events       = 0;

  switch (action) {
  case CURL_POLL_IN:
  case CURL_POLL_OUT:
  case CURL_POLL_INOUT:
    curl_context = (socketp != nullptr) ? static_cast<curl_context_t*>(socketp)
                                        : owner->create_curl_context(s);

    curl_multi_assign(owner->curl_multi_handle_, s, curl_context);

    if (action != CURL_POLL_IN) events |= EV_WRITE; // NOLINT signed-bool-ops
    if (action != CURL_POLL_OUT) events |= EV_READ; // NOLINT signed-bool-ops

    events |= EV_PERSIST; // NOLINT signed bitwise

    event_del(curl_context->event);
    event_assign(curl_context->event, owner->ebase_,
                 static_cast<evutil_socket_t>(curl_context->sockfd), events, curl_perform_event_cb,
                 curl_context);
    event_add(curl_context->event, nullptr);

    break;
  case CURL_POLL_REMOVE:
    if (socketp != nullptr) {
      curl_context = static_cast<curl_context_t*>(socketp);
      destroy_curl_context(curl_context);
      curl_multi_assign(owner->curl_multi_handle_, s, nullptr);
    }
    break;
  default:
    // returning -1 makes curl fail the transfer, we can't throw through curl
    logger.error(fmt::format("handle_socket_curl_cb: unknown action {} received.", action));
    return -1;
  }
  return 0;
}

} // namespace kbharvest::dnl
