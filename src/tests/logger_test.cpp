#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include "logger/logger.hpp"
#include "logger/security_log.hpp"
#include "test_utils.hpp"

using namespace safestore::logging;

class LoggerTest : public ::testing::Test {
protected:
    std::filesystem::path log_dir;

    void SetUp() override {
        log_dir = make_test_dir("logger_test");
        init_logging(log_dir.string());
        set_log_level(boost::log::trivial::trace);
    }

    void TearDown() override {
        // Ensure all logs are written
        boost::log::core::get()->flush();
        init_test_logging();
        std::filesystem::remove_all(log_dir);
    }

    bool log_contains(const std::string& text, int max_retries = 3) {
        for (int retry = 0; retry < max_retries; ++retry) {
            flush();
            for (const auto& entry : std::filesystem::directory_iterator(log_dir)) {
                if (entry.path().extension() == ".log" &&
                    read_whole_file(entry.path()).find(text) != std::string::npos) {
                    return true;
                }
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50 * (retry + 1)));
        }
        return false;
    }
};

TEST_F(LoggerTest, WritesOperationsLog) {
    BOOST_LOG_TRIVIAL(info) << "operations log probe";

    EXPECT_TRUE(log_contains("operations log probe"));

    bool found_operations_file = false;
    for (const auto& entry : std::filesystem::directory_iterator(log_dir)) {
        if (entry.path().filename().string().rfind("operations_", 0) == 0) {
            found_operations_file = true;
        }
    }
    EXPECT_TRUE(found_operations_file);
}

TEST_F(LoggerTest, RecordsSeverityAndThread) {
    BOOST_LOG_TRIVIAL(error) << "severity probe";

    EXPECT_TRUE(log_contains("[error]"));
    EXPECT_TRUE(log_contains("[Thread "));
}

TEST_F(LoggerTest, FiltersBelowConfiguredLevel) {
    set_log_level(boost::log::trivial::warning);
    BOOST_LOG_TRIVIAL(debug) << "filtered probe";
    BOOST_LOG_TRIVIAL(warning) << "visible probe";

    EXPECT_TRUE(log_contains("visible probe"));
    EXPECT_FALSE(log_contains("filtered probe", 1));
}

TEST_F(LoggerTest, ParsesSeverityNames) {
    EXPECT_EQ(parse_severity("DEBUG"), boost::log::trivial::debug);
    EXPECT_EQ(parse_severity("warn"), boost::log::trivial::warning);
    EXPECT_EQ(parse_severity("Error"), boost::log::trivial::error);
    EXPECT_EQ(parse_severity("verbose"), boost::log::trivial::info);
}

TEST_F(LoggerTest, SecurityLogAppendsOneLinePerEvent) {
    SecurityLog security_log(log_dir / "security.log");
    security_log.record("PATH_REJECTED", "'../x' (outside base directory)");
    security_log.record("INTEGRITY_VIOLATION", "/base/a.txt");

    EXPECT_EQ(security_log.event_count(), 2u);

    const std::string content = read_whole_file(security_log.path());
    EXPECT_NE(content.find("| PATH_REJECTED | '../x'"), std::string::npos);
    EXPECT_NE(content.find("| INTEGRITY_VIOLATION | /base/a.txt"), std::string::npos);
    EXPECT_EQ(std::count(content.begin(), content.end(), '\n'), 2);

    // Security events are mirrored to the operations log
    EXPECT_TRUE(log_contains("Security: PATH_REJECTED"));
}
