#include "dnl/line_source.hpp"
#include "gtest/gtest.h"
#include <sstream>
#include <string>

namespace dnl = kbharvest::dnl;

TEST(line_source, yields_lines_lazily) { // NOLINT
  std::istringstream is("https://host/a.kbart\r\n\nhttps://host/b.kbart");
  dnl::line_source   source(is);

  auto first = source.next();
  ASSERT_TRUE(first);
  EXPECT_TRUE(first->ok());
  EXPECT_EQ(first->number, 1U);
  EXPECT_EQ(first->text, "https://host/a.kbart");
  EXPECT_EQ(is.tellg(), std::streampos(22)); // nothing read ahead

  auto blank = source.next();
  ASSERT_TRUE(blank);
  EXPECT_EQ(blank->text, "");

  auto last = source.next();
  ASSERT_TRUE(last);
  EXPECT_EQ(last->number, 3U);
  EXPECT_EQ(last->text, "https://host/b.kbart");

  EXPECT_FALSE(source.next());
  EXPECT_FALSE(source.next());
}

TEST(line_source, invalid_utf8_line_fails_alone) { // NOLINT
  std::istringstream is("https://host/\xFF\xFE.kbart\nhttps://host/ok.kbart\n");
  dnl::line_source   source(is);

  auto bad = source.next();
  ASSERT_TRUE(bad);
  EXPECT_FALSE(bad->ok());
  EXPECT_TRUE(bad->text.empty());

  auto good = source.next();
  ASSERT_TRUE(good);
  EXPECT_TRUE(good->ok());
  EXPECT_EQ(good->number, 2U);
  EXPECT_EQ(good->text, "https://host/ok.kbart");
}

TEST(line_source, utf8_validation) { // NOLINT
  EXPECT_TRUE(dnl::is_valid_utf8(""));
  EXPECT_TRUE(dnl::is_valid_utf8("https://host/caf\xC3\xA9.kbart"));
  EXPECT_TRUE(dnl::is_valid_utf8("\xE2\x82\xAC \xF0\x9F\x98\x80"));
  EXPECT_FALSE(dnl::is_valid_utf8("\xC3"));             // truncated
  EXPECT_FALSE(dnl::is_valid_utf8("\xC0\xAF"));         // overlong '/'
  EXPECT_FALSE(dnl::is_valid_utf8("\xED\xA0\x80"));     // surrogate
  EXPECT_FALSE(dnl::is_valid_utf8("\xF4\x90\x80\x80")); // > U+10FFFF
  EXPECT_FALSE(dnl::is_valid_utf8("\x80"));
}

TEST(line_source, trim) { // NOLINT
  EXPECT_EQ(dnl::trim("  https://host/a.kbart\t "), "https://host/a.kbart");
  EXPECT_EQ(dnl::trim(" \t \f"), "");
  EXPECT_EQ(dnl::trim(""), "");
  EXPECT_EQ(dnl::trim("x"), "x");
}
