#include <gtest/gtest.h>
#include <filesystem>
#include <regex>
#include "utils/file_utils.hpp"

using namespace safestore::utils;

TEST(FileUtilsTest, SanitizeUtf8KeepsValidText) {
  const std::string text = "plain ascii, caf\xC3\xA9, \xE2\x82\xAC, \xF0\x9F\x98\x80";
  EXPECT_EQ(sanitize_utf8(text), text);
}

TEST(FileUtilsTest, SanitizeUtf8ReplacesInvalidSequences) {
  const std::string replacement = "\xEF\xBF\xBD";

  EXPECT_EQ(sanitize_utf8("a\xFF" "b"), "a" + replacement + "b");
  // Truncated two-byte sequence at end of input
  EXPECT_EQ(sanitize_utf8("x\xC3"), "x" + replacement);
  // Overlong encoding of '/'
  EXPECT_EQ(sanitize_utf8("\xC0\xAF"), replacement + replacement);
  // UTF-16 surrogate half
  EXPECT_EQ(sanitize_utf8("\xED\xA0\x80"), replacement + replacement + replacement);
}

TEST(FileUtilsTest, HumanReadableSize) {
  EXPECT_EQ(human_readable_size(0), "0 B");
  EXPECT_EQ(human_readable_size(1023), "1023 B");
  EXPECT_EQ(human_readable_size(1536), "1.5 KB");
  EXPECT_EQ(human_readable_size(5ull * 1024 * 1024), "5.0 MB");
}

TEST(FileUtilsTest, GuessMimeType) {
  EXPECT_EQ(guess_mime_type("notes/readme.md"), "text/markdown");
  EXPECT_EQ(guess_mime_type("IMAGE.PNG"), "image/png");
  EXPECT_EQ(guess_mime_type("data.unknownext"), "application/octet-stream");
  EXPECT_EQ(guess_mime_type("Makefile"), "application/octet-stream");
}

TEST(FileUtilsTest, TempNamesAreRecognized) {
  const std::string name = make_temp_name("report.txt", 42);
  EXPECT_EQ(name, ".report.txt.tmp.42");
  EXPECT_TRUE(is_temp_name(name));
  EXPECT_FALSE(is_temp_name("report.txt"));
  EXPECT_FALSE(is_temp_name(".gitkeep"));
  EXPECT_FALSE(is_temp_name("report.tmp.1"));
}

TEST(FileUtilsTest, FlattenedNames) {
  EXPECT_EQ(flatten_relative_path("notes/a.txt"), "notes_a.txt");
  EXPECT_EQ(flatten_relative_path("/leading/b.md"), "leading_b.md");
  EXPECT_EQ(flatten_relative_path(""), "root");
  EXPECT_EQ(flatten_relative_path("a/b_c.txt"), "a_b%5Fc.txt");
  EXPECT_EQ(flatten_relative_path("a_b/c.txt"), "a%5Fb_c.txt");
  EXPECT_EQ(flatten_relative_path("100%/x"), "100%25_x");
  EXPECT_NE(flatten_relative_path("a/b_c.txt"), flatten_relative_path("a_b/c.txt"));
  EXPECT_EQ(timestamped_name("notes/a.txt", "20240102_030405"), "notes_a_20240102_030405.txt");
  EXPECT_TRUE(std::regex_match(file_timestamp(), std::regex("[0-9]{8}_[0-9]{6}")));
}

TEST(FileUtilsTest, PermissionString) {
  using std::filesystem::perms;
  EXPECT_EQ(permission_string(perms(0755)), "rwxr-xr-x");
  EXPECT_EQ(permission_string(perms(0640)), "rw-r-----");
  EXPECT_EQ(permission_string(perms::none), "---------");
}
