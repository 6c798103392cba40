#include "store/multi_folder_backend.hpp"
#include <utility>
#include <boost/log/trivial.hpp>

namespace pagestore {
namespace store {

MultiFolderBackend::MultiFolderBackend(const std::filesystem::path& root_dir,
                                       const std::string& file_extension)
  : Backend(root_dir, file_extension) {}

std::filesystem::path MultiFolderBackend::key_to_path(const std::string& key) const {
  std::vector<std::string> segments = split_segments(key);
  if (segments.empty()) {
    return root_file_path();
  }

  std::filesystem::path path = root_dir();
  for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
    path /= segments[i];
  }
  path /= segments.back() + file_extension();

  BOOST_LOG_TRIVIAL(trace) << "MultiFolderBackend: Key " << key << " -> " << path.string();
  return path;
}

std::vector<std::string> MultiFolderBackend::split_segments(const std::string& key) {
  std::vector<std::string> segments;
  std::size_t pos = 0;

  while (pos <= key.size()) {
    std::size_t next = key.find('/', pos);
    if (next == std::string::npos) {
      next = key.size();
    }
    std::string segment = key.substr(pos, next - pos);
    pos = next + 1;

    if (segment.empty() || segment == ".") {
      continue;
    }
    if (segment == "..") {
      // Leading ".." would escape the root, so it is dropped
      if (!segments.empty()) {
        segments.pop_back();
      }
      continue;
    }
    segments.push_back(std::move(segment));
  }
  return segments;
}

} // namespace store
} // namespace pagestore
