#ifndef PAGESTORE_CODEC_DOCUMENT_CODEC_HPP
#define PAGESTORE_CODEC_DOCUMENT_CODEC_HPP

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <yaml-cpp/yaml.h>
#include "codec/codec_error.hpp"

namespace pagestore::codec {

// Type aliases for the accepted document shapes
using Field = std::pair<std::string, YAML::Node>;
using OrderedFields = std::vector<Field>;
using Mapping = std::unordered_map<std::string, YAML::Node>;

// Emitter configuration, owned by each codec instance
struct EmitterSettings {
  int indent{4};
  // -1 disables line folding
  int width{-1};
  bool unicode{true};
};

class DocumentCodec {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit DocumentCodec(EmitterSettings settings = EmitterSettings());


  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Encodes fields in the given order
  std::string encode(const OrderedFields& fields) const;
  // Encodes fields sorted ascending by name
  std::string encode(const Mapping& mapping) const;
  // Encodes a map node in its own order, a list of [name, value] pairs as
  // fields, and anything else as an opaque value
  std::string encode(const YAML::Node& document) const;
  // Parses text, throws DecodeError on malformed input or more than one document
  YAML::Node decode(const std::string& text) const;


  // ---- FIELD HANDLING ----
  // Returns the fields of a pair-shaped node, nullopt otherwise
  static std::optional<OrderedFields> as_fields(const YAML::Node& node);
  // Strips '\r', expands tabs and trims trailing whitespace on every line
  static std::string prepare_literal(const std::string& value);

private:
  // ---- PARAMETERS ----
  EmitterSettings settings_;

  std::string emit_fields(const OrderedFields& fields) const;
  std::string emit_opaque(const YAML::Node& node) const;
};

} // namespace pagestore::codec

#endif // PAGESTORE_CODEC_DOCUMENT_CODEC_HPP
