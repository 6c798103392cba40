#pragma once

#include <string>
#include "store/backend.hpp"

namespace pagestore {
namespace store {

// One flat file per key: "a/b/c" -> "<root>/a^b^c.yaml"
class SingleFolderBackend : public Backend {
public:
  static constexpr const char* DEFAULT_DELIMITER = "^";

  explicit SingleFolderBackend(const std::filesystem::path& root_dir,
                               const std::string& file_extension = "yaml",
                               const std::string& path_delimiter = DEFAULT_DELIMITER);

  std::filesystem::path key_to_path(const std::string& key) const override;

  const std::string& path_delimiter() const { return path_delimiter_; }

private:
  const std::string path_delimiter_;
};

} // namespace store
} // namespace pagestore
