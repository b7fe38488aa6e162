#include "dnl/validate.hpp"
#include "dnl/transport.hpp"
#include "kbharvest.hpp"
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <fmt/format.h>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kbharvest::dnl {

namespace {

enum class text_encoding { as_is, utf16le, utf16be };

std::string lowercase(std::string_view s) {
  std::string lower(s);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lower;
}

// "text/plain; charset=UTF-16LE" -> utf16le
text_encoding charset_encoding(std::string_view content_type) {
  auto ct  = lowercase(content_type);
  auto pos = ct.find("charset=");
  if (pos == std::string::npos) return text_encoding::as_is;

  auto charset = std::string_view{ct}.substr(pos + 8);
  charset      = charset.substr(0, charset.find_first_of("; "));
  if (charset.size() >= 2 && charset.front() == '"' && charset.back() == '"') {
    charset = charset.substr(1, charset.size() - 2);
  }
  if (charset == "utf-16be") return text_encoding::utf16be;
  if (charset == "utf-16" || charset == "utf-16le") return text_encoding::utf16le;
  return text_encoding::as_is;
}

void append_utf8(std::string& out, std::uint32_t cp) {
  if (cp < 0x80U) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800U) {
    out += static_cast<char>(0xC0U | (cp >> 6U));
    out += static_cast<char>(0x80U | (cp & 0x3FU));
  } else if (cp < 0x10000U) {
    out += static_cast<char>(0xE0U | (cp >> 12U));
    out += static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU));
    out += static_cast<char>(0x80U | (cp & 0x3FU));
  } else {
    out += static_cast<char>(0xF0U | (cp >> 18U));
    out += static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU));
    out += static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU));
    out += static_cast<char>(0x80U | (cp & 0x3FU));
  }
}

std::string utf16_to_utf8(const char* begin, const char* end, bool big_endian) {
  constexpr std::uint32_t replacement = 0xFFFDU;

  auto unit_at = [big_endian](const char* p) {
    auto b0 = static_cast<std::uint32_t>(static_cast<unsigned char>(p[0]));
    auto b1 = static_cast<std::uint32_t>(static_cast<unsigned char>(p[1]));
    return big_endian ? (b0 << 8U) | b1 : (b1 << 8U) | b0;
  };

  std::string out;
  out.reserve(static_cast<std::size_t>(end - begin) / 2);

  // a trailing odd byte is what's left of a unit cut in half by the range, drop it
  for (const char* p = begin; end - p >= 2; p += 2) {
    auto unit = unit_at(p);
    if (unit >= 0xD800U && unit <= 0xDBFFU) { // high surrogate
      if (end - p >= 4) {
        auto low = unit_at(p + 2);
        if (low >= 0xDC00U && low <= 0xDFFFU) {
          append_utf8(out, 0x10000U + ((unit - 0xD800U) << 10U) + (low - 0xDC00U));
          p += 2;
          continue;
        }
      }
      append_utf8(out, replacement);
    } else if (unit >= 0xDC00U && unit <= 0xDFFFU) { // lone low surrogate
      append_utf8(out, replacement);
    } else {
      append_utf8(out, unit);
    }
  }
  return out;
}

bool starts_with_bytes(const std::vector<char>& body, std::string_view bytes) {
  return body.size() >= bytes.size() && std::equal(bytes.begin(), bytes.end(), body.begin());
}

} // namespace

std::size_t sniff_length() {
  std::size_t longest = 0;
  for (auto header: kbart_headers) longest = std::max(longest, header.size());
  return longest * 2;
}

request make_sniff_request(const std::string& url) {
  return request{.url     = url,
                 .range   = std::make_pair(std::size_t{0}, sniff_length()),
                 .headers = {"Accept-Charset: utf-8"}};
}

std::string decode_text(const std::vector<char>& body, std::string_view content_type) {
  const char* begin = body.data();
  const char* end   = body.data() + body.size();

  if (starts_with_bytes(body, "\xEF\xBB\xBF")) return {begin + 3, end};
  if (starts_with_bytes(body, "\xFF\xFE")) return utf16_to_utf8(begin + 2, end, false);
  if (starts_with_bytes(body, "\xFE\xFF")) return utf16_to_utf8(begin + 2, end, true);

  switch (charset_encoding(content_type)) {
  case text_encoding::utf16le:
    return utf16_to_utf8(begin, end, false);
  case text_encoding::utf16be:
    return utf16_to_utf8(begin, end, true);
  case text_encoding::as_is:
    break;
  }
  return {begin, end};
}

bool has_kbart_header(std::string_view text) {
  return std::any_of(std::begin(kbart_headers), std::end(kbart_headers),
                     [text](std::string_view header) { return text.starts_with(header); });
}

void check_header(const std::string& url, const response& sniff) {
  if (sniff.failed()) {
    throw harvest_error(error_kind::transport_error,
                        fmt::format("header check of {} failed: {}", url, sniff.error));
  }
  if (sniff.status == 416) {
    // a range starting at byte 0 is unsatisfiable only for an empty resource
    throw harvest_error(error_kind::invalid_format, fmt::format("{} is empty", url));
  }
  if (sniff.status >= 400) {
    throw harvest_error(error_kind::http_status,
                        fmt::format("header check of {} returned HTTP {}", url, sniff.status));
  }
  if (!has_kbart_header(decode_text(sniff.body, sniff.content_type))) {
    throw harvest_error(error_kind::invalid_format,
                        fmt::format("{} has an invalid kbart header", url));
  }
}

} // namespace kbharvest::dnl
