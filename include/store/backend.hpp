#pragma once

#include <string>
#include <filesystem>
#include <memory>
#include <optional>
#include "store/store_error.hpp"

namespace pagestore {
namespace store {

// Maps a logical key to a file under root_dir and performs the raw I/O there.
// Subclasses only decide the key to path mapping.
class Backend {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Backend(const std::filesystem::path& root_dir, const std::string& file_extension);
  virtual ~Backend() = default;

  Backend(const Backend&) = delete;
  Backend& operator=(const Backend&) = delete;


  // ---- CORE STORAGE OPERATIONS ----
  // True only if the derived path is a regular file
  virtual bool exists(const std::string& key) const;
  // Returns the stored text, or nullopt if missing, unreadable or not UTF-8
  virtual std::optional<std::string> get(const std::string& key) const;
  // Writes text to the derived path, creating parent directories first
  virtual void put(const std::string& key, const std::string& text) const;


  // ---- PATH MAPPING ----
  virtual std::filesystem::path key_to_path(const std::string& key) const = 0;


  // ---- GETTERS ----
  const std::filesystem::path& root_dir() const { return root_dir_; }
  const std::string& file_extension() const { return file_extension_; }

  // Normalizes "yaml", ".yaml" and "..yaml" to ".yaml"; empty stays empty
  static std::string normalize_extension(const std::string& extension);

protected:
  // "<root><extension>", used when a key has no usable segment
  std::filesystem::path root_file_path() const;

private:
  // ---- PARAMETERS ----
  const std::filesystem::path root_dir_;
  const std::string file_extension_;
};

using BackendPtr = std::unique_ptr<Backend>;

} // namespace store
} // namespace pagestore
