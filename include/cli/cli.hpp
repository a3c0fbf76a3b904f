#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "store/file_store.hpp"

namespace safestore {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    explicit CLI(store::FileStore& store, std::istream& in = std::cin, std::ostream& out = std::cout);


    // ---- STARTUP ----
    // Reads commands until "quit" or end of input
    void run();
    // Executes one command line; false once the user asked to quit
    bool execute(const std::string& line);

private:
    // ---- PARAMETERS ----
    store::FileStore& store_;
    std::istream& in_;
    std::ostream& out_;
    bool running_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::vector<std::string>& args,
                         const std::string& rest);
    void handle_read_command(const std::string& path);
    void handle_write_command(const std::string& path, const std::string& content, bool append);
    void handle_list_command(const std::vector<std::string>& args);
    void handle_delete_command(const std::string& path, bool archive);
    void handle_info_command(const std::string& path);
    void handle_search_command(const std::vector<std::string>& args);
    void handle_versions_command(const std::string& path);
    void handle_metrics_command();
    void handle_health_command();
    void handle_cleanup_command(const std::vector<std::string>& args);
    void handle_help_command();
    void report(bool success, const std::string& error, const std::string& message);
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace safestore
