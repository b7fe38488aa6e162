#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <string>

namespace kbharvest::dnl {

struct input_line {
  std::size_t number = 0; // 1 based
  std::string text;
  std::string error; // non-empty when this line could not be read

  [[nodiscard]] bool ok() const { return error.empty(); }
};

// Lazily yields the lines of a stream. A line which isn't valid utf-8 is returned as a failed line
// and reading continues. The sequence ends at eof, or when the stream goes bad.
class line_source {
public:
  explicit line_source(std::istream& is) : is_(is) {}

  std::optional<input_line> next();

private:
  std::istream& is_; // NOLINT reference
  std::size_t   line_number_ = 0;
};

bool is_valid_utf8(const std::string& s);

// strips leading and trailing whitespace
std::string trim(const std::string& s);

} // namespace kbharvest::dnl
