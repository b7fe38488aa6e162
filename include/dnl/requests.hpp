#pragma once

#include "dnl/transport.hpp"
#include <cstddef>
#include <curl/curl.h>
#include <event2/util.h>
#include <exception>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

struct event;
struct event_base;

namespace kbharvest::dnl {

// Transport implemented with the curl multi socket API driven by a libevent event loop. Only http
// and https are allowed, also for redirects.
class curl_transport : public transport {
public:
  curl_transport();
  curl_transport(const curl_transport&)            = delete;
  curl_transport& operator=(const curl_transport&) = delete;
  curl_transport(curl_transport&&)                 = delete;
  curl_transport& operator=(curl_transport&&)      = delete;
  ~curl_transport() override;

  void submit(request req, done_fn_t done) override;
  void run() override;
  void post(task_fn_t task) override;
  void keep_alive(bool on) override;

private:
  struct transfer;
  struct curl_context_t;

  curl_context_t* create_curl_context(curl_socket_t sockfd);
  void            process_curl_done_msg(CURLMsg* message);
  void            process_curl_messages();
  void            run_posted_tasks();

  static void        destroy_curl_context(curl_context_t* context);
  static std::size_t write_data_curl_cb(char* ptr, std::size_t size, std::size_t nmemb,
                                        void* userdata);
  static void curl_perform_event_cb(evutil_socket_t fd, short event, void* arg);
  static void timeout_event_cb(evutil_socket_t fd, short events, void* arg);
  static void wakeup_event_cb(evutil_socket_t fd, short events, void* arg);
  static int  start_timeout_curl_cb(CURLM* multi, long timeout_ms, void* userp);
  static int  handle_socket_curl_cb(CURL* easy, curl_socket_t s, int action, void* userp,
                                    void* socketp);

  CURLM*      curl_multi_handle_ = nullptr;
  event_base* ebase_             = nullptr;
  event*      timeout_           = nullptr;
  event*      wakeup_            = nullptr; // user event, activated by post()

  std::mutex             posted_mutex_;
  std::vector<task_fn_t> posted_;

  // keyed on the easy handle, unique_ptr for address stability as curl holds raw pointers
  std::unordered_map<CURL*, std::unique_ptr<transfer>> transfers_;

  // exception thrown by a completion callback or posted task, rethrown from run()
  std::exception_ptr callback_exception_;
};

} // namespace kbharvest::dnl
