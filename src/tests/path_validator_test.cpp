#include <gtest/gtest.h>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "store/path_validator.hpp"
#include "test_utils.hpp"

using namespace safestore::store;
using safestore::logging::SecurityLog;

class PathValidatorTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<SecurityLog> security_log;
  std::unique_ptr<PathValidator> validator;

  void SetUp() override {
    init_test_logging();
    test_dir = std::filesystem::canonical(make_test_dir("validator_test"));
    security_log = std::make_unique<SecurityLog>(test_dir / "logs" / "security.log");
    validator = std::make_unique<PathValidator>(test_dir, *security_log);
  }

  void TearDown() override {
    validator.reset();
    security_log.reset();
    std::filesystem::remove_all(test_dir);
  }
};

TEST_F(PathValidatorTest, AcceptsOrdinaryRelativePaths) {
  EXPECT_TRUE(validator->is_safe("notes/a.txt"));
  EXPECT_TRUE(validator->is_safe("reports/2024/summary.md"));
  EXPECT_TRUE(validator->is_safe(""));
  EXPECT_TRUE(validator->is_safe("notes/../a.txt"));
  EXPECT_EQ(security_log->event_count(), 0u);
}

TEST_F(PathValidatorTest, RejectsDirectoryEscape) {
  const std::vector<std::string> escapes = {
    "../outside.txt",
    "../../etc/passwd",
    "notes/../../outside.txt",
    "/tmp/elsewhere.txt",
    "a/b/../../../x"
  };

  for (const auto& path : escapes) {
    EXPECT_FALSE(validator->is_safe(path)) << "Escape accepted: " << path;
  }
  EXPECT_EQ(security_log->event_count(), escapes.size());
}

TEST_F(PathValidatorTest, RejectsDeniedPatterns) {
  EXPECT_FALSE(validator->is_safe("data/../../x"));
  EXPECT_FALSE(validator->is_safe("mirror/etc/passwd"));
  EXPECT_FALSE(validator->is_safe("proc/../mirror/proc/self"));
  EXPECT_FALSE(validator->is_safe("C:\\Windows\\system.ini"));
  EXPECT_FALSE(validator->is_safe(".git/config"));
  EXPECT_FALSE(validator->is_safe("project/.svn/entries"));
  EXPECT_FALSE(validator->is_safe(".env"));
  EXPECT_FALSE(validator->is_safe("config/.env.production"));
}

TEST_F(PathValidatorTest, RejectsHiddenFilesExceptWhitelist) {
  EXPECT_FALSE(validator->is_safe(".bashrc"));
  EXPECT_FALSE(validator->is_safe("notes/.secret"));
  EXPECT_TRUE(validator->is_safe("notes/.gitkeep"));
  EXPECT_TRUE(validator->is_safe("site/.htaccess"));
}

TEST_F(PathValidatorTest, RejectsSymlinkLeadingOutside) {
  auto outside = make_test_dir("validator_outside");
  std::filesystem::create_directory_symlink(outside, test_dir / "link");

  EXPECT_FALSE(validator->is_safe("link/file.txt"));

  std::filesystem::remove_all(outside);
}

TEST_F(PathValidatorTest, RejectionsAreWrittenToSecurityLog) {
  ASSERT_FALSE(validator->is_safe("../escape.txt"));

  const std::string log = read_whole_file(security_log->path());
  EXPECT_NE(log.find("PATH_REJECTED"), std::string::npos);
  EXPECT_NE(log.find("../escape.txt"), std::string::npos);
}

TEST_F(PathValidatorTest, ResolveStaysBelowBase) {
  EXPECT_EQ(validator->resolve("notes/a.txt"), test_dir / "notes" / "a.txt");
  EXPECT_EQ(validator->resolve(""), test_dir);
  EXPECT_EQ(validator->relative_to_base(test_dir / "notes" / "a.txt").generic_string(), "notes/a.txt");
}
