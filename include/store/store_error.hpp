#ifndef PAGESTORE_STORE_ERROR_HPP
#define PAGESTORE_STORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace pagestore {
namespace store {

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// Raised when a document cannot be written to its derived path
class WriteError : public StoreError {
public:
  explicit WriteError(const std::string& message)
    : StoreError("Write error: " + message) {}
};

class ConfigError : public StoreError {
public:
  explicit ConfigError(const std::string& message)
    : StoreError("Configuration error: " + message) {}
};

} // namespace store
} // namespace pagestore

#endif // PAGESTORE_STORE_ERROR_HPP
