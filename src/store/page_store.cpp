#include "store/page_store.hpp"
#include "store/single_folder_backend.hpp"
#include "store/multi_folder_backend.hpp"
#include <boost/log/trivial.hpp>

namespace pagestore {
namespace store {

//==============================================
// BACKEND SELECTION
//==============================================

BackendType parse_backend_type(const std::string& name) {
  if (name == "single") {
    return BackendType::SingleFolder;
  }
  if (name == "multi") {
    return BackendType::MultiFolder;
  }
  throw ConfigError("unknown backend '" + name + "' (expected 'single' or 'multi')");
}

const char* backend_type_to_string(BackendType type) {
  switch (type) {
    case BackendType::SingleFolder: return "single";
    case BackendType::MultiFolder:  return "multi";
    default:                        return "unknown";
  }
}

BackendPtr make_backend(const StoreOptions& options) {
  switch (options.backend) {
    case BackendType::SingleFolder:
      return std::make_unique<SingleFolderBackend>(options.root_dir, options.file_extension,
                                                   options.path_delimiter);
    case BackendType::MultiFolder:
      return std::make_unique<MultiFolderBackend>(options.root_dir, options.file_extension);
  }
  throw ConfigError("unsupported backend type");
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

PageStore::PageStore(StoreOptions options)
  : backend_(make_backend(options))
  , filters_(std::move(options.filters)) {
  BOOST_LOG_TRIVIAL(info) << "PageStore: Initializing " << backend_type_to_string(options.backend)
                          << " folder store at: " << options.root_dir.string();
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

bool PageStore::exists(const std::string& key) const {
  return backend_->exists(key);
}

std::optional<YAML::Node> PageStore::get(const std::string& key) const {
  BOOST_LOG_TRIVIAL(info) << "PageStore: Retrieving document for key: " << key;

  std::optional<std::string> text = backend_->get(key);
  if (!text) {
    BOOST_LOG_TRIVIAL(info) << "PageStore: Document not found for key: " << key;
    return std::nullopt;
  }

  YAML::Node document = codec_.decode(*text);
  return filters_.apply(document);
}

void PageStore::put(const std::string& key, const codec::OrderedFields& data) const {
  write(key, codec_.encode(data));
}

void PageStore::put(const std::string& key, const codec::Mapping& data) const {
  write(key, codec_.encode(data));
}

void PageStore::put(const std::string& key, const YAML::Node& data) const {
  write(key, codec_.encode(data));
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::filesystem::path PageStore::key_to_path(const std::string& key) const {
  return backend_->key_to_path(key);
}


//==============================================
// UTILITY METHODS
//==============================================

void PageStore::write(const std::string& key, const std::string& text) const {
  BOOST_LOG_TRIVIAL(info) << "PageStore: Storing document with key: " << key;
  backend_->put(key, text);
  BOOST_LOG_TRIVIAL(info) << "PageStore: Stored " << text.size() << " bytes with key: " << key;
}

} // namespace store
} // namespace pagestore
