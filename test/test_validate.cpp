#include "dnl/transport.hpp"
#include "dnl/validate.hpp"
#include "kbharvest.hpp"
#include "gtest/gtest.h"
#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace dnl = kbharvest::dnl;
using kbharvest::error_kind;

namespace {

std::vector<char> bytes(std::string_view s) { return {s.begin(), s.end()}; }

// ascii only
std::vector<char> utf16(std::string_view s, bool big_endian) {
  std::vector<char> out;
  for (char c: s) {
    if (big_endian) out.push_back('\0');
    out.push_back(c);
    if (!big_endian) out.push_back('\0');
  }
  return out;
}

const std::string rows = "\nSome Journal\t1234-5678\t\t2001-01-01\n";

error_kind check_error(const dnl::response& sniff) {
  try {
    dnl::check_header("https://host/list.kbart", sniff);
  } catch (const kbharvest::harvest_error& e) {
    return e.kind();
  }
  ADD_FAILURE() << "check_header passed";
  return error_kind::filesystem_error;
}

} // namespace

TEST(validate, sniff_request) { // NOLINT
  EXPECT_EQ(dnl::sniff_length(), kbharvest::kbart_header_5321.size() * 2);
  EXPECT_GT(kbharvest::kbart_header_5321.size(), kbharvest::kbart_header.size());

  auto req = dnl::make_sniff_request("https://host/list.kbart");
  EXPECT_EQ(req.url, "https://host/list.kbart");
  ASSERT_TRUE(req.range);
  EXPECT_EQ(req.range->first, 0U);
  EXPECT_EQ(req.range->second, dnl::sniff_length());
  EXPECT_EQ(req.headers, std::vector<std::string>{"Accept-Charset: utf-8"});
}

TEST(validate, headers_have_17_tab_separated_fields) { // NOLINT
  for (auto header: kbharvest::kbart_headers) {
    EXPECT_EQ(std::count(header.begin(), header.end(), '\t'), 16);
  }
}

TEST(validate, recognises_both_headers) { // NOLINT
  EXPECT_TRUE(dnl::has_kbart_header(kbharvest::kbart_header));
  EXPECT_TRUE(dnl::has_kbart_header(kbharvest::kbart_header_5321));
  EXPECT_TRUE(dnl::has_kbart_header(std::string(kbharvest::kbart_header) + rows));
  EXPECT_TRUE(dnl::has_kbart_header(std::string(kbharvest::kbart_header_5321) + rows));
}

TEST(validate, rejects_everything_else) { // NOLINT
  EXPECT_FALSE(dnl::has_kbart_header(""));
  EXPECT_FALSE(dnl::has_kbart_header("<!DOCTYPE html><html></html>"));
  EXPECT_FALSE(dnl::has_kbart_header(kbharvest::kbart_header.substr(0, 100)));

  std::string upper(kbharvest::kbart_header);
  upper[0] = 'P';
  EXPECT_FALSE(dnl::has_kbart_header(upper));

  std::string leading_space = " " + std::string(kbharvest::kbart_header);
  EXPECT_FALSE(dnl::has_kbart_header(leading_space));
}

TEST(validate, decode_text) { // NOLINT
  const std::string header(kbharvest::kbart_header);

  EXPECT_EQ(dnl::decode_text(bytes(header), "text/plain"), header);
  EXPECT_EQ(dnl::decode_text(bytes("\xEF\xBB\xBF" + header), ""), header);

  auto le = utf16(header, false);
  le.insert(le.begin(), {'\xFF', '\xFE'});
  EXPECT_EQ(dnl::decode_text(le, "text/plain"), header);

  auto be = utf16(header, true);
  EXPECT_EQ(dnl::decode_text(be, "text/tab-separated-values; charset=\"UTF-16BE\""), header);
  EXPECT_EQ(dnl::decode_text(utf16(header, false), "text/plain;charset=utf-16"), header);
}

TEST(validate, decode_text_truncated_utf16) { // NOLINT
  auto le = utf16("abc", false);
  le.pop_back(); // range cut the last unit in half
  EXPECT_EQ(dnl::decode_text(le, "text/plain; charset=utf-16le"), "ab");

  // a lone high surrogate, then a surrogate pair
  std::vector<char> surrogates{'\x3D', '\xD8', '\x3D', '\xD8', '\x00', '\xDE'};
  EXPECT_EQ(dnl::decode_text(surrogates, "text/plain; charset=utf-16le"),
            "\xEF\xBF\xBD\xF0\x9F\x98\x80");
}

TEST(validate, check_header_accepts_partial_and_full_bodies) { // NOLINT
  dnl::response partial{.status = 206, .content_type = "text/plain",
                        .body = bytes(kbharvest::kbart_header_5321), .error = {}};
  EXPECT_NO_THROW(dnl::check_header("https://host/list.kbart", partial));

  dnl::response full{.status = 200, .content_type = "text/plain",
                     .body = bytes(std::string(kbharvest::kbart_header) + rows), .error = {}};
  EXPECT_NO_THROW(dnl::check_header("https://host/list.kbart", full));

  auto le = utf16(kbharvest::kbart_header, false);
  le.insert(le.begin(), {'\xFF', '\xFE'});
  dnl::response wide{.status = 206, .content_type = "text/plain", .body = le, .error = {}};
  EXPECT_NO_THROW(dnl::check_header("https://host/list.kbart", wide));
}

TEST(validate, check_header_failures) { // NOLINT
  dnl::response html{.status = 200, .content_type = "text/html", .body = bytes("<html>"),
                     .error = {}};
  EXPECT_EQ(check_error(html), error_kind::invalid_format);

  dnl::response not_found{.status = 404, .content_type = "text/html",
                          .body = bytes(kbharvest::kbart_header), .error = {}};
  EXPECT_EQ(check_error(not_found), error_kind::http_status);

  dnl::response refused{.status = 0, .content_type = {}, .body = {},
                        .error = "Couldn't connect to server"};
  EXPECT_EQ(check_error(refused), error_kind::transport_error);
}

TEST(validate, empty_remote_file_is_invalid_format) { // NOLINT
  dnl::response unsatisfiable{.status = 416, .content_type = "text/html",
                              .body = bytes("<html>416</html>"), .error = {}};
  EXPECT_EQ(check_error(unsatisfiable), error_kind::invalid_format);

  dnl::response empty{.status = 200, .content_type = "text/plain", .body = {}, .error = {}};
  EXPECT_EQ(check_error(empty), error_kind::invalid_format);
}
