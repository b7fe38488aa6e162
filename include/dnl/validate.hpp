#pragma once

#include "dnl/transport.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace kbharvest::dnl {

// Bytes requested by the header sniff. Doubled as some providers serve UTF-16.
std::size_t sniff_length();

// ranged GET of the first sniff_length() bytes, asking for utf-8
request make_sniff_request(const std::string& url);

// Decodes a (possibly truncated) body into utf-8. A byte order mark takes precedence over the
// charset parameter of `content_type`. Anything which is not utf-16 is returned as is.
std::string decode_text(const std::vector<char>& body, std::string_view content_type);

// exact, case-sensitive prefix match against either known kbart header
bool has_kbart_header(std::string_view text);

// Throws harvest_error: transport_error, http_status or invalid_format. A 200 is as good as a 206
// as servers which don't support ranges return the whole document.
void check_header(const std::string& url, const response& sniff);

} // namespace kbharvest::dnl
