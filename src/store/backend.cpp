#include "store/backend.hpp"
#include <fstream>
#include <sstream>
#include <system_error>
#include <boost/locale/encoding_utf.hpp>
#include <boost/log/trivial.hpp>

namespace pagestore {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Backend::Backend(const std::filesystem::path& root_dir, const std::string& file_extension)
  : root_dir_(root_dir)
  , file_extension_(normalize_extension(file_extension)) {
  BOOST_LOG_TRIVIAL(debug) << "Backend: Root directory " << root_dir_.string()
                           << ", extension '" << file_extension_ << "'";
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

bool Backend::exists(const std::string& key) const {
  std::filesystem::path file_path = key_to_path(key);

  std::error_code ec;
  bool found = std::filesystem::is_regular_file(file_path, ec);

  BOOST_LOG_TRIVIAL(debug) << "Backend: Key " << key << (found ? " exists" : " not found")
                           << " at path: " << file_path.string();
  return found;
}

std::optional<std::string> Backend::get(const std::string& key) const {
  std::filesystem::path file_path = key_to_path(key);
  BOOST_LOG_TRIVIAL(debug) << "Backend: Reading key " << key << " from " << file_path.string();

  std::error_code ec;
  if (!std::filesystem::is_regular_file(file_path, ec)) {
    BOOST_LOG_TRIVIAL(debug) << "Backend: No file for key: " << key;
    return std::nullopt;
  }

  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    // Unreadable files count as absent
    BOOST_LOG_TRIVIAL(warning) << "Backend: Failed to open file: " << file_path.string();
    return std::nullopt;
  }

  std::ostringstream content;
  char buffer[4096];

  while (file.read(buffer, sizeof(buffer))) {
    content.write(buffer, file.gcount());
  }
  if (file.gcount() > 0) {
    content.write(buffer, file.gcount());
  }

  if (file.bad()) {
    BOOST_LOG_TRIVIAL(warning) << "Backend: Read error on file: " << file_path.string();
    return std::nullopt;
  }

  std::string text = content.str();
  try {
    boost::locale::conv::utf_to_utf<char>(text, boost::locale::conv::stop);
  } catch (const boost::locale::conv::conversion_error&) {
    BOOST_LOG_TRIVIAL(warning) << "Backend: File is not valid UTF-8: " << file_path.string();
    return std::nullopt;
  }

  BOOST_LOG_TRIVIAL(debug) << "Backend: Read " << text.size() << " bytes for key: " << key;
  return text;
}

void Backend::put(const std::string& key, const std::string& text) const {
  std::filesystem::path file_path = key_to_path(key);
  BOOST_LOG_TRIVIAL(debug) << "Backend: Writing key " << key << " to " << file_path.string();

  // Directory creation errors propagate as filesystem_error
  std::filesystem::path parent = file_path.parent_path();
  if (!parent.empty() && !std::filesystem::exists(parent)) {
    std::filesystem::create_directories(parent);
  }

  std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Backend: Failed to create file: " << file_path.string();
    throw WriteError("failed to create file " + file_path.string());
  }

  file.write(text.data(), static_cast<std::streamsize>(text.size()));
  file.close();
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Backend: Failed to write file: " << file_path.string();
    throw WriteError("failed to write file " + file_path.string());
  }

  BOOST_LOG_TRIVIAL(debug) << "Backend: Wrote " << text.size() << " bytes for key: " << key;
}


//==============================================
// UTILITY METHODS
//==============================================

std::string Backend::normalize_extension(const std::string& extension) {
  std::size_t start = extension.find_first_not_of('.');
  if (start == std::string::npos) {
    return "";
  }
  return "." + extension.substr(start);
}

std::filesystem::path Backend::root_file_path() const {
  return std::filesystem::path(root_dir_.string() + file_extension_);
}

} // namespace store
} // namespace pagestore
