#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include "store/page_store.hpp"
#include <iostream>
#include <string>
#include <unordered_map>
#include <boost/algorithm/string.hpp>

struct ProgramOptions {
  pagestore::store::StoreOptions store;
  std::string log_file;
  pagestore::logging::severity_level log_level{boost::log::trivial::info};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [options]\n"
        << "Options:\n"
        << "  -r, --root <dir>         Root directory (default: .)\n"
        << "  -b, --backend <type>     single or multi (default: single)\n"
        << "  -e, --ext <extension>    File extension (default: yaml)\n"
        << "  -d, --delimiter <text>   Path delimiter for the single backend (default: ^)\n"
        << "  -l, --log <file>         Write logs to <file>\n"
        << "  -v, --log-level <level>  trace, debug, info, warning, error or fatal\n"
        << "Example: " << program_name << " -r ./content -b multi\n";
}

pagestore::filter::FilterRegistry default_filters() {
  return {
    {"upper", [](const std::string& value) { return boost::algorithm::to_upper_copy(value); }},
    {"lower", [](const std::string& value) { return boost::algorithm::to_lower_copy(value); }},
    {"trim", [](const std::string& value) { return boost::algorithm::trim_copy(value); }}
  };
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_map<std::string, std::string> flag_map = {
    {"-r", "root"}, {"--root", "root"},
    {"-b", "backend"}, {"--backend", "backend"},
    {"-e", "ext"}, {"--ext", "ext"},
    {"-d", "delimiter"}, {"--delimiter", "delimiter"},
    {"-l", "log"}, {"--log", "log"},
    {"-v", "log-level"}, {"--log-level", "log-level"}
  };

  ProgramOptions options;

  if (argc % 2 == 0) {
    std::cerr << "Error: Missing value for argument: " << argv[argc - 1] << '\n';
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    auto it = flag_map.find(flag);
    if (it == flag_map.end()) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    try {
      if (it->second == "root") {
        options.store.root_dir = value;
      } else if (it->second == "backend") {
        options.store.backend = pagestore::store::parse_backend_type(value);
      } else if (it->second == "ext") {
        options.store.file_extension = value;
      } else if (it->second == "delimiter") {
        options.store.path_delimiter = value;
      } else if (it->second == "log") {
        options.log_file = value;
      } else if (it->second == "log-level") {
        options.log_level = pagestore::logging::Logger::parse_level(value);
      }
    } catch (const std::exception& e) {
      std::cerr << "Error: " << e.what() << '\n';
      print_usage(argv[0]);
      return options;
    }
  }

  options.valid = true;
  return options;
}

bool run_shell(ProgramOptions& options) {
  if (options.log_file.empty()) {
    // Keep the console quiet unless something goes wrong
    pagestore::logging::Logger::set_level(boost::log::trivial::warning);
  } else {
    pagestore::logging::Logger::init(options.log_file, options.log_level);
  }

  try {
    options.store.filters = default_filters();
    pagestore::store::PageStore store(std::move(options.store));
    pagestore::cli::CLI cli(store);
    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start store: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_shell(options)) {
    return 1;
  }
  return 0;
}
