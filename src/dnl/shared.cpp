#include "dnl/shared.hpp"
#include "kbharvest.hpp"
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>

namespace kbharvest {

std::string_view to_string(error_kind kind) {
  switch (kind) {
  case error_kind::missing_path:
    return "MissingPath";
  case error_kind::invalid_format:
    return "InvalidFormat";
  case error_kind::parse_error:
    return "ParseError";
  case error_kind::transport_error:
    return "TransportError";
  case error_kind::http_status:
    return "HttpStatus";
  case error_kind::filesystem_error:
    return "FilesystemError";
  }
  return "Unknown";
}

namespace dnl {

std::mutex cerr_mutex; // threaded app needs mutex for stdio

std::unordered_map<std::thread::id, std::string> thrnames; // labels for threads

void set_thread_name(const std::string& name) {
  const std::lock_guard lk(cerr_mutex);
  thrnames[std::this_thread::get_id()] = name;
}

thread_logger logger;

} // namespace dnl

} // namespace kbharvest
