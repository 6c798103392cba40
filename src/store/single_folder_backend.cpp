#include "store/single_folder_backend.hpp"
#include <boost/log/trivial.hpp>

namespace pagestore {
namespace store {

SingleFolderBackend::SingleFolderBackend(const std::filesystem::path& root_dir,
                                         const std::string& file_extension,
                                         const std::string& path_delimiter)
  : Backend(root_dir, file_extension)
  , path_delimiter_(path_delimiter) {
  if (path_delimiter_.empty() || path_delimiter_.find('/') != std::string::npos) {
    BOOST_LOG_TRIVIAL(error) << "SingleFolderBackend: Invalid path delimiter: '" << path_delimiter_ << "'";
    throw ConfigError("path delimiter must be non-empty and must not contain '/'");
  }
  BOOST_LOG_TRIVIAL(debug) << "SingleFolderBackend: Using delimiter '" << path_delimiter_ << "'";
}

std::filesystem::path SingleFolderBackend::key_to_path(const std::string& key) const {
  std::size_t start = key.find_first_not_of('/');
  if (start == std::string::npos) {
    return root_file_path();
  }

  std::string filename;
  filename.reserve(key.size() - start);
  for (std::size_t i = start; i < key.size(); ++i) {
    if (key[i] == '/') {
      filename += path_delimiter_;
    } else {
      filename += key[i];
    }
  }

  return root_dir() / (filename + file_extension());
}

} // namespace store
} // namespace pagestore
