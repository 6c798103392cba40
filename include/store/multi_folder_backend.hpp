#pragma once

#include <string>
#include <vector>
#include "store/backend.hpp"

namespace pagestore {
namespace store {

// Nested directories mirroring the key: "a/b/c" -> "<root>/a/b/c.yaml"
class MultiFolderBackend : public Backend {
public:
  explicit MultiFolderBackend(const std::filesystem::path& root_dir,
                              const std::string& file_extension = "yaml");

  std::filesystem::path key_to_path(const std::string& key) const override;

  // Lexically normalizes a key into segments. "." and empty segments are
  // dropped, ".." removes the previous segment and never climbs above the root.
  static std::vector<std::string> split_segments(const std::string& key);
};

} // namespace store
} // namespace pagestore
