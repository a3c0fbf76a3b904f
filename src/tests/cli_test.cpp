#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <memory>
#include <sstream>
#include "cli/cli.hpp"
#include "test_utils.hpp"

using namespace safestore;
using ::testing::HasSubstr;
using ::testing::Not;

class CLITest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<store::FileStore> file_store;
  std::istringstream input;
  std::ostringstream output;
  std::unique_ptr<cli::CLI> shell;

  void SetUp() override {
    init_test_logging();
    test_dir = make_test_dir("cli_test");
    file_store = std::make_unique<store::FileStore>(test_dir.string());
    shell = std::make_unique<cli::CLI>(*file_store, input, output);
  }

  void TearDown() override {
    shell.reset();
    file_store.reset();
    std::filesystem::remove_all(test_dir);
  }

  std::string run(const std::string& line) {
    output.str("");
    output.clear();
    EXPECT_TRUE(shell->execute(line));
    return output.str();
  }
};

TEST_F(CLITest, WriteKeepsRestOfLineVerbatim) {
  EXPECT_THAT(run("write notes/todo.txt buy  milk and eggs"), HasSubstr("Wrote notes/todo.txt"));
  EXPECT_EQ(read_whole_file(file_store->base_path() / "notes" / "todo.txt"), "buy  milk and eggs");

  run("append notes/todo.txt !");
  EXPECT_THAT(run("read notes/todo.txt"), HasSubstr("buy  milk and eggs!"));
}

TEST_F(CLITest, ListShowsFilesAndDirectories) {
  run("write reports/2024.txt q1");
  run("mkdir reports/old");

  const std::string listing = run("ls reports");
  EXPECT_THAT(listing, HasSubstr("[FILE] 2024.txt"));
  EXPECT_THAT(listing, HasSubstr("[DIR]  old"));
}

TEST_F(CLITest, ErrorsAreReportedWithKind) {
  EXPECT_THAT(run("read missing.txt"), HasSubstr("NotFound"));
  EXPECT_THAT(run("write ../escape.txt x"), HasSubstr("AccessDenied"));
  EXPECT_THAT(run("read"), HasSubstr("Invalid input"));
  EXPECT_THAT(run("frobnicate a.txt"), HasSubstr("Unknown command"));
}

TEST_F(CLITest, DeleteMoveAndCopy) {
  run("write a.txt alpha");
  EXPECT_THAT(run("cp a.txt b.txt"), HasSubstr("Copied a.txt to b.txt"));
  EXPECT_THAT(run("mv b.txt sub/c.txt"), HasSubstr("Moved b.txt to sub/c.txt"));
  EXPECT_THAT(run("rm a.txt"), HasSubstr("File archived successfully"));
  EXPECT_THAT(run("purge sub/c.txt"), HasSubstr("File deleted permanently"));

  EXPECT_FALSE(std::filesystem::exists(file_store->base_path() / "a.txt"));
  EXPECT_FALSE(std::filesystem::exists(file_store->base_path() / "sub" / "c.txt"));
}

TEST_F(CLITest, InfoSearchAndVersions) {
  run("write src/main.py one");
  run("write src/main.py two");

  const std::string info = run("info src/main.py");
  EXPECT_THAT(info, HasSubstr("checksum:"));
  EXPECT_THAT(info, HasSubstr("last access: -"));
  EXPECT_THAT(run("search main"), HasSubstr("1 match(es)"));
  EXPECT_THAT(run("versions src/main.py"), HasSubstr("src_main_"));
}

TEST_F(CLITest, MaintenanceCommands) {
  EXPECT_THAT(run("health"), HasSubstr("status: healthy"));
  EXPECT_THAT(run("metrics"), HasSubstr("security_events="));
  EXPECT_THAT(run("cleanup 30"), HasSubstr("Removed 0 archive entries"));
  EXPECT_THAT(run("cleanup soon"), HasSubstr("Invalid number of days"));
  EXPECT_THAT(run("help"), Not(HasSubstr("Unknown command")));
}

TEST_F(CLITest, QuitStopsTheLoop) {
  input.str("write a.txt x\nquit\nwrite b.txt y\n");
  shell->run();

  EXPECT_TRUE(std::filesystem::exists(file_store->base_path() / "a.txt"));
  EXPECT_FALSE(std::filesystem::exists(file_store->base_path() / "b.txt"));
  EXPECT_FALSE(shell->execute("exit"));
}
