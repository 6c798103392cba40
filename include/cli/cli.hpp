#pragma once

#include <iostream>
#include <string>
#include "store/page_store.hpp"

namespace pagestore {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    explicit CLI(store::PageStore& store, std::istream& input = std::cin, std::ostream& output = std::cout);


    // ---- STARTUP ----
    void run();

private:
    // ---- PARAMETERS ----
    bool running_;
    // System components
    store::PageStore& store_;
    std::istream& input_;
    std::ostream& output_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::string& key, const std::string& argument);
    void handle_get_command(const std::string& key);
    void handle_exists_command(const std::string& key);
    void handle_path_command(const std::string& key);
    void handle_put_command(const std::string& key, const std::string& filename);
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace pagestore
