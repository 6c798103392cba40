#pragma once

#include <string>
#include <filesystem>
#include <optional>
#include <yaml-cpp/yaml.h>
#include "store/backend.hpp"
#include "codec/document_codec.hpp"
#include "filter/filter_pipeline.hpp"

namespace pagestore {
namespace store {

enum class BackendType {
  SingleFolder,
  MultiFolder
};

// Parses "single" or "multi", throws ConfigError otherwise
BackendType parse_backend_type(const std::string& name);
const char* backend_type_to_string(BackendType type);

struct StoreOptions {
  std::filesystem::path root_dir{"."};
  BackendType backend{BackendType::SingleFolder};
  std::string file_extension{"yaml"};
  // SingleFolder only
  std::string path_delimiter{"^"};
  filter::FilterRegistry filters;
};

// Builds the backend selected by options.backend
BackendPtr make_backend(const StoreOptions& options);

class PageStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit PageStore(StoreOptions options = StoreOptions());


  // ---- CORE STORAGE OPERATIONS ----
  // Checks if a document is stored under key
  bool exists(const std::string& key) const;
  // Reads, decodes and filters the document. Absent documents give nullopt,
  // corrupt ones throw codec::DecodeError.
  std::optional<YAML::Node> get(const std::string& key) const;
  // Encodes data and writes it under key, replacing any previous document
  void put(const std::string& key, const codec::OrderedFields& data) const;
  void put(const std::string& key, const codec::Mapping& data) const;
  void put(const std::string& key, const YAML::Node& data) const;


  // ---- QUERY OPERATIONS ----
  std::filesystem::path key_to_path(const std::string& key) const;

  const codec::DocumentCodec& codec() const { return codec_; }

private:
  // ---- PARAMETERS ----
  BackendPtr backend_;
  codec::DocumentCodec codec_;
  filter::FilterPipeline filters_;

  void write(const std::string& key, const std::string& text) const;
};

} // namespace store
} // namespace pagestore
