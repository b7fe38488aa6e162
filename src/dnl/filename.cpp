#include "dnl/filename.hpp"
#include "kbharvest.hpp"
#include <algorithm>
#include <array>
#include <boost/url/parse.hpp>
#include <boost/url/scheme.hpp>
#include <boost/url/url.hpp>
#include <boost/url/url_view.hpp>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <fmt/format.h>
#include <string>
#include <string_view>
#include <utility>

namespace kbharvest::dnl {

namespace {

constexpr std::size_t      max_filename_bytes = 255;
constexpr std::string_view illegal_chars      = "/?<>\\:*|\"";

constexpr std::array<boost::urls::scheme, 6> special_schemes = {
    boost::urls::scheme::http, boost::urls::scheme::https, boost::urls::scheme::ftp,
    boost::urls::scheme::ws,   boost::urls::scheme::wss,   boost::urls::scheme::file};

bool is_control(char c) {
  auto uc = static_cast<unsigned char>(c);
  return uc < 0x20U || uc == 0x7FU;
}

std::string to_lower(std::string_view s) {
  std::string lower(s);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lower;
}

// con, prn, aux, nul, com0-9, lpt0-9, optionally followed by an extension
bool is_windows_reserved(std::string_view name) {
  auto base = to_lower(name.substr(0, name.find('.')));
  if (base == "con" || base == "prn" || base == "aux" || base == "nul") return true;
  return base.size() == 4 && (base.starts_with("com") || base.starts_with("lpt")) &&
         std::isdigit(static_cast<unsigned char>(base[3])) != 0;
}

void truncate_utf8(std::string& s, std::size_t max_bytes) {
  if (s.size() <= max_bytes) return;
  auto n = max_bytes;
  while (n > 0 && (static_cast<unsigned char>(s[n]) & 0xC0U) == 0x80U) --n; // continuation byte
  s.resize(n);
}

std::string sanitize_pass(std::string_view in) {
  std::string out;
  out.reserve(in.size());
  for (char c: in) {
    if (is_control(c) || illegal_chars.find(c) != std::string_view::npos) continue;
    out += c;
  }
  if (out == "." || out == ".." || is_windows_reserved(out)) out.clear();

  auto last = out.find_last_not_of(". ");
  out.erase(last == std::string::npos ? 0 : last + 1);

  truncate_utf8(out, max_filename_bytes);
  return out;
}

} // namespace

boost::urls::url parse_url(std::string_view text) {
  auto parsed = boost::urls::parse_absolute_uri(text);
  if (!parsed) {
    throw harvest_error(error_kind::parse_error,
                        fmt::format("'{}': {}", text, parsed.error().message()));
  }
  boost::urls::url url(*parsed);

  auto id = url.scheme_id();
  if (std::find(special_schemes.begin(), special_schemes.end(), id) != special_schemes.end() &&
      !url.has_authority()) {
    throw harvest_error(error_kind::parse_error,
                        fmt::format("'{}': expected '//' after '{}:'", text,
                                    std::string_view{url.scheme()}));
  }

  // the grammar allows any number of digits, port_number() is 0 when they don't fit
  if (auto port = std::string_view{url.port()};
      url.has_port() && port.find_first_not_of('0') != std::string_view::npos &&
      url.port_number() == 0) {
    throw harvest_error(error_kind::parse_error, fmt::format("'{}': invalid port number", text));
  }
  return url;
}

std::string sanitize_filename(std::string_view segment) {
  // each pass only removes characters, so this terminates
  std::string current(segment);
  while (true) {
    auto next = sanitize_pass(current);
    if (next == current) return next;
    current = std::move(next);
  }
}

std::filesystem::path derive_target_path(boost::urls::url_view url,
                                         const std::filesystem::path& output_dir) {
  // a rootless path ("mailto:x", "urn:isbn:0451450523") has no segments to name a file after
  auto segments = url.encoded_segments();
  if (!url.is_path_absolute() || segments.empty() || segments.back().empty()) {
    throw harvest_error(error_kind::missing_path,
                        "The URL must have a path. The last path part is used to name the file "
                        "(after sanitization)");
  }

  const std::string_view last{segments.back().data(), segments.back().size()};
  auto                   filename = sanitize_filename(last);
  if (filename.empty()) {
    throw harvest_error(error_kind::missing_path,
                        fmt::format("last path segment '{}' is empty after sanitization", last));
  }
  return output_dir / filename;
}

} // namespace kbharvest::dnl
