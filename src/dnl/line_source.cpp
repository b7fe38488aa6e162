#include "dnl/line_source.hpp"
#include "dnl/shared.hpp"
#include <cstddef>
#include <cstdint>
#include <fmt/format.h>
#include <optional>
#include <string>
#include <utility>

namespace kbharvest::dnl {

std::optional<input_line> line_source::next() {
  std::string line;
  if (!std::getline(is_, line)) {
    if (is_.bad()) {
      logger.error(fmt::format("input stream failed after line {}, no more urls will be read",
                               line_number_));
    }
    return std::nullopt;
  }
  ++line_number_;
  line.erase(line.find_last_not_of('\r') + 1);

  input_line result{.number = line_number_, .text = {}, .error = {}};
  if (is_valid_utf8(line)) {
    result.text = std::move(line);
  } else {
    result.error = "stream did not contain valid UTF-8";
  }
  return result;
}

bool is_valid_utf8(const std::string& s) {
  std::size_t i = 0;
  while (i != s.size()) {
    auto c = static_cast<unsigned char>(s[i]);

    std::size_t   len = 0;
    std::uint32_t cp  = 0;
    if (c < 0x80U) {
      ++i;
      continue;
    }
    if ((c & 0xE0U) == 0xC0U) {
      len = 2;
      cp  = c & 0x1FU;
    } else if ((c & 0xF0U) == 0xE0U) {
      len = 3;
      cp  = c & 0x0FU;
    } else if ((c & 0xF8U) == 0xF0U) {
      len = 4;
      cp  = c & 0x07U;
    } else {
      return false;
    }
    if (s.size() - i < len) return false;

    for (std::size_t j = 1; j != len; ++j) {
      auto cc = static_cast<unsigned char>(s[i + j]);
      if ((cc & 0xC0U) != 0x80U) return false;
      cp = (cp << 6U) | (cc & 0x3FU);
    }
    // overlong, surrogates and out of range
    if ((len == 2 && cp < 0x80U) || (len == 3 && cp < 0x800U) || (len == 4 && cp < 0x10000U) ||
        (cp >= 0xD800U && cp <= 0xDFFFU) || cp > 0x10FFFFU) {
      return false;
    }
    i += len;
  }
  return true;
}

std::string trim(const std::string& s) {
  constexpr const char* whitespace = " \t\n\r\f\v";

  auto first = s.find_first_not_of(whitespace);
  if (first == std::string::npos) return {};
  auto last = s.find_last_not_of(whitespace);
  return s.substr(first, last - first + 1);
}

} // namespace kbharvest::dnl
