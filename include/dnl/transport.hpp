#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kbharvest::dnl {

struct request {
  std::string url;
  // inclusive byte range, servers are free to ignore it
  std::optional<std::pair<std::size_t, std::size_t>> range;
  std::vector<std::string>                           headers; // "Name: value"
};

struct response {
  long              status = 0;
  std::string       content_type;
  std::vector<char> body;
  std::string       error; // non-empty when the transfer itself failed (connect, timeout, tls..)

  [[nodiscard]] bool failed() const { return !error.empty(); }
};

// prefer use of std::function (ie stdlib type erasure) rather than templates to keep .hpp interface
// clean
using done_fn_t = std::function<void(response&&)>;
using task_fn_t = std::function<void()>;

// The asynchronous transfer service. submit() starts a transfer and returns immediately. run()
// drives every submitted transfer to completion, calling each `done` exactly once on the thread
// which called run(). A `done` may submit further transfers; run() only returns when there are
// none left, no posted task is waiting and the transport is not held open by keep_alive().
//
// post() is the only member which may be called from another thread. It wakes run() and has
// `task` executed on the run() thread.
class transport {
public:
  transport()                                = default;
  transport(const transport&)                = delete;
  transport& operator=(const transport&)     = delete;
  transport(transport&&) noexcept            = delete;
  transport& operator=(transport&&) noexcept = delete;
  virtual ~transport()                       = default;

  virtual void submit(request req, done_fn_t done) = 0;
  virtual void run()                               = 0;
  virtual void post(task_fn_t task)                = 0;
  virtual void keep_alive(bool on)                 = 0;
};

} // namespace kbharvest::dnl
