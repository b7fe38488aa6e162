#pragma once

#include <boost/url/url.hpp>
#include <boost/url/url_view.hpp>
#include <filesystem>
#include <string>
#include <string_view>

namespace kbharvest::dnl {

// Parses an absolute URL (RFC 3986). http, https, ftp, ws, wss and file must have an authority
// ("//"), and a port must fit in 16 bits.
// throws harvest_error(parse_error)
boost::urls::url parse_url(std::string_view text);

// idempotent: sanitize_filename(sanitize_filename(s)) == sanitize_filename(s)
std::string sanitize_filename(std::string_view segment);

// Joins the sanitized last path segment onto `output_dir`. Segments are used raw, "%2F" never
// becomes a separator.
// throws harvest_error(missing_path) when there is no usable last path segment
std::filesystem::path derive_target_path(boost::urls::url_view url,
                                         const std::filesystem::path& output_dir);

} // namespace kbharvest::dnl
