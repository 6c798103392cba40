#include "cli/cli.hpp"
#include <fstream>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace pagestore {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================
  
CLI::CLI(store::PageStore& store, std::istream& input, std::ostream& output)
  : running_(false)
  , store_(store)
  , input_(input)
  , output_(output) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;
  
  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  output_ << "pagestore> " << std::flush;
  
  while (running_ && std::getline(input_, line)) {
    std::istringstream iss(line);
    std::string command, key, argument;
    iss >> command >> key >> argument;

    if (command == "quit") {
      running_ = false;
      continue;
    }

    if (!command.empty()) {
      process_command(command, key, argument);
    }

    if (running_) {
      output_ << "pagestore> " << std::flush;
    }
  }
  
  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}


//==============================================
// COMMAND PROCESSING 
//==============================================

void CLI::process_command(const std::string& command, const std::string& key, const std::string& argument) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with key: " << key;

  if (command == "help") {
    handle_help_command();
  }
  else if (key.empty()) {
    output_ << "Invalid input. Usage: <command> <key> [file]" << std::endl;
  }
  else if (command == "get") {
    handle_get_command(key);
  }
  else if (command == "exists") {
    handle_exists_command(key);
  }
  else if (command == "path") {
    handle_path_command(key);
  }
  else if (command == "put" && !argument.empty()) {
    handle_put_command(key, argument);
  }
  else {
    output_ << "Unknown command or invalid arguments" << std::endl;
  }
}

void CLI::handle_get_command(const std::string& key) {
  try {
    std::optional<YAML::Node> document = store_.get(key);
    if (!document) {
      output_ << "Not found: " << key << std::endl;
      return;
    }
    output_ << store_.codec().encode(*document);
  } catch (const std::exception& e) {
    log_and_display_error("Error reading document", e.what());
  }
}

void CLI::handle_exists_command(const std::string& key) {
  output_ << (store_.exists(key) ? "true" : "false") << std::endl;
}

void CLI::handle_path_command(const std::string& key) {
  output_ << store_.key_to_path(key).string() << std::endl;
}

void CLI::handle_put_command(const std::string& key, const std::string& filename) {
  std::ifstream file(filename);
  if (!file) {
    output_ << "Error opening file: " << filename << std::endl;
    return;
  }

  try {
    std::stringstream content;
    content << file.rdbuf();
    store_.put(key, store_.codec().decode(content.str()));
    output_ << "Stored " << key << " at " << store_.key_to_path(key).string() << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error storing document", e.what());
  }
}

void CLI::handle_help_command() {
  output_ << "Available commands:" << std::endl;
  output_ << "  help              Display this help message" << std::endl;
  output_ << "  get <key>         Print the document stored under <key>" << std::endl;
  output_ << "  exists <key>      Check whether <key> is stored" << std::endl;
  output_ << "  path <key>        Print the file path used for <key>" << std::endl;
  output_ << "  put <key> <file>  Store the YAML <file> under <key>" << std::endl;
  output_ << "  quit              Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  output_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace pagestore
