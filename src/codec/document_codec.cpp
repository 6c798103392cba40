#include "codec/document_codec.hpp"
#include <algorithm>
#include <unordered_map>
#include <yaml.h>
#include <boost/log/trivial.hpp>

namespace pagestore::codec {

namespace {

//=================================================
// RAII WRAPPER AROUND THE LIBYAML EMITTER
//=================================================

class EventWriter {
public:
  explicit EventWriter(const EmitterSettings& settings) {
    if (!yaml_emitter_initialize(&emitter_)) {
      throw EncodeError("failed to initialize emitter");
    }
    yaml_emitter_set_output(&emitter_, &EventWriter::write_handler, &output_);
    yaml_emitter_set_indent(&emitter_, settings.indent);
    yaml_emitter_set_width(&emitter_, settings.width);
    yaml_emitter_set_unicode(&emitter_, settings.unicode ? 1 : 0);
  }

  ~EventWriter() {
    yaml_emitter_delete(&emitter_);
  }

  EventWriter(const EventWriter&) = delete;
  EventWriter& operator=(const EventWriter&) = delete;

  void begin_document() {
    yaml_event_t event;
    check(yaml_stream_start_event_initialize(&event, YAML_UTF8_ENCODING), "stream start");
    emit(event);
    check(yaml_document_start_event_initialize(&event, nullptr, nullptr, nullptr, 1), "document start");
    emit(event);
  }

  void end_document() {
    yaml_event_t event;
    check(yaml_document_end_event_initialize(&event, 1), "document end");
    emit(event);
    check(yaml_stream_end_event_initialize(&event), "stream end");
    emit(event);
  }

  void begin_mapping() {
    yaml_event_t event;
    check(yaml_mapping_start_event_initialize(&event, nullptr, nullptr, 1, YAML_BLOCK_MAPPING_STYLE),
          "mapping start");
    emit(event);
  }

  void end_mapping() {
    yaml_event_t event;
    check(yaml_mapping_end_event_initialize(&event), "mapping end");
    emit(event);
  }

  void begin_sequence() {
    yaml_event_t event;
    check(yaml_sequence_start_event_initialize(&event, nullptr, nullptr, 1, YAML_BLOCK_SEQUENCE_STYLE),
          "sequence start");
    emit(event);
  }

  void end_sequence() {
    yaml_event_t event;
    check(yaml_sequence_end_event_initialize(&event), "sequence end");
    emit(event);
  }

  // A string the parser would read back as null cannot be written plain,
  // so the emitter falls back to quoting it.
  void write_string(const std::string& value, yaml_scalar_style_t style) {
    write_scalar(value, nullptr, !resolves_to_null(value), style);
  }

  void write_null() {
    write_scalar("null", nullptr, true, YAML_PLAIN_SCALAR_STYLE);
  }

  void write_node(const YAML::Node& value) {
    switch (value.Type()) {
      case YAML::NodeType::Map:
        begin_mapping();
        for (const auto& entry : value) {
          write_node(entry.first);
          write_node(entry.second);
        }
        end_mapping();
        break;
      case YAML::NodeType::Sequence:
        begin_sequence();
        for (const auto& item : value) {
          write_node(item);
        }
        end_sequence();
        break;
      case YAML::NodeType::Scalar:
        if (has_explicit_tag(value)) {
          write_scalar(value.Scalar(), value.Tag().c_str(), false, YAML_ANY_SCALAR_STYLE);
        } else {
          write_string(value.Scalar(), YAML_ANY_SCALAR_STYLE);
        }
        break;
      case YAML::NodeType::Null:
      case YAML::NodeType::Undefined:
        write_null();
        break;
    }
  }

  std::string take() { return std::move(output_); }

  static bool has_explicit_tag(const YAML::Node& node) {
    const std::string& tag = node.Tag();
    return !tag.empty() && tag != "?" && tag != "!";
  }

private:
  yaml_emitter_t emitter_;
  std::string output_;

  void write_scalar(const std::string& value, const char* tag, bool plain_implicit, yaml_scalar_style_t style) {
    yaml_event_t event;
    check(yaml_scalar_event_initialize(&event, nullptr,
                                       reinterpret_cast<const yaml_char_t*>(tag),
                                       reinterpret_cast<const yaml_char_t*>(value.data()),
                                       static_cast<int>(value.size()),
                                       plain_implicit ? 1 : 0, tag ? 0 : 1, style),
          "scalar");
    emit(event);
  }

  // yaml_emitter_emit takes ownership of the event, also on failure
  void emit(yaml_event_t& event) {
    if (!yaml_emitter_emit(&emitter_, &event)) {
      std::string problem = emitter_.problem ? emitter_.problem : "unknown emitter error";
      BOOST_LOG_TRIVIAL(error) << "Codec: Emitter failed: " << problem;
      throw EncodeError(problem);
    }
  }

  static void check(int initialized, const char* what) {
    if (!initialized) {
      BOOST_LOG_TRIVIAL(error) << "Codec: Failed to create " << what << " event";
      throw EncodeError(std::string("invalid ") + what + " event (is the text valid UTF-8?)");
    }
  }

  static bool resolves_to_null(const std::string& value) {
    return value.empty() || value == "~" || value == "null" || value == "Null" || value == "NULL";
  }

  static int write_handler(void* data, unsigned char* buffer, size_t size) {
    static_cast<std::string*>(data)->append(reinterpret_cast<const char*>(buffer), size);
    return 1;
  }
};

// Later duplicates overwrite the value but keep the first position.
// YAML::Node assignment rebinds shared nodes, so fields are only copy-constructed.
OrderedFields merge_duplicates(const OrderedFields& fields) {
  std::unordered_map<std::string, std::size_t> last_index;
  for (std::size_t i = 0; i < fields.size(); ++i) {
    last_index[fields[i].first] = i;
  }

  OrderedFields merged;
  merged.reserve(last_index.size());
  for (const auto& field : fields) {
    auto it = last_index.find(field.first);
    if (it == last_index.end()) {
      continue;  // already emitted
    }
    merged.emplace_back(field.first, fields[it->second].second);
    last_index.erase(it);
  }
  return merged;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

DocumentCodec::DocumentCodec(EmitterSettings settings)
  : settings_(settings) {}


//==============================================
// SERIALIZATION AND DESERIALIZATION
//==============================================

std::string DocumentCodec::encode(const OrderedFields& fields) const {
  return emit_fields(merge_duplicates(fields));
}

std::string DocumentCodec::encode(const Mapping& mapping) const {
  std::vector<const Mapping::value_type*> entries;
  entries.reserve(mapping.size());
  for (const auto& entry : mapping) {
    entries.push_back(&entry);
  }
  std::sort(entries.begin(), entries.end(),
            [](const Mapping::value_type* a, const Mapping::value_type* b) { return a->first < b->first; });

  OrderedFields fields;
  fields.reserve(entries.size());
  for (const auto* entry : entries) {
    fields.emplace_back(entry->first, entry->second);
  }
  return emit_fields(fields);
}

std::string DocumentCodec::encode(const YAML::Node& document) const {
  if (auto fields = as_fields(document)) {
    return emit_fields(merge_duplicates(*fields));
  }
  BOOST_LOG_TRIVIAL(debug) << "Codec: Document is not pair-shaped, encoding as opaque value";
  return emit_opaque(document);
}

YAML::Node DocumentCodec::decode(const std::string& text) const {
  std::vector<YAML::Node> documents;
  try {
    documents = YAML::LoadAll(text);
  } catch (const YAML::Exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to parse document: " << e.what();
    throw DecodeError(e.what());
  }

  // A page is exactly one document
  if (documents.size() > 1) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Expected a single document, found " << documents.size();
    throw DecodeError("expected a single document, found " + std::to_string(documents.size()));
  }
  return documents.empty() ? YAML::Node() : documents.front();
}


//==============================================
// FIELD HANDLING
//==============================================

std::optional<OrderedFields> DocumentCodec::as_fields(const YAML::Node& node) {
  OrderedFields fields;

  if (node.IsMap()) {
    for (const auto& entry : node) {
      if (!entry.first.IsScalar()) {
        return std::nullopt;
      }
      fields.emplace_back(entry.first.Scalar(), entry.second);
    }
    return fields;
  }

  // An empty list stays a list
  if (!node.IsSequence() || node.size() == 0) {
    return std::nullopt;
  }

  for (const auto& item : node) {
    if (!item.IsSequence() || item.size() != 2 || !item[0].IsScalar()) {
      return std::nullopt;
    }
    fields.emplace_back(item[0].Scalar(), item[1]);
  }
  return fields;
}

std::string DocumentCodec::prepare_literal(const std::string& value) {
  std::string result;
  result.reserve(value.size());

  std::size_t line_start = 0;
  for (char c : value) {
    if (c == '\r') {
      continue;
    }
    if (c == '\t') {
      result.append(4, ' ');
      continue;
    }
    if (c == '\n') {
      std::size_t end = result.find_last_not_of(" \f\v");
      result.erase((end == std::string::npos || end < line_start) ? line_start : end + 1);
      result += '\n';
      line_start = result.size();
      continue;
    }
    result += c;
  }

  std::size_t end = result.find_last_not_of(" \f\v");
  result.erase((end == std::string::npos || end < line_start) ? line_start : end + 1);
  return result;
}


//==============================================
// EMITTING
//==============================================

std::string DocumentCodec::emit_fields(const OrderedFields& fields) const {
  EventWriter writer(settings_);
  writer.begin_document();
  writer.begin_mapping();

  for (const auto& [name, value] : fields) {
    writer.write_string(name, YAML_PLAIN_SCALAR_STYLE);

    if (value.IsScalar() && !EventWriter::has_explicit_tag(value)) {
      const std::string& text = value.Scalar();
      if (text.find('\n') != std::string::npos) {
        writer.write_string(prepare_literal(text), YAML_LITERAL_SCALAR_STYLE);
      } else {
        writer.write_string(text, YAML_PLAIN_SCALAR_STYLE);
      }
    } else {
      writer.write_node(value);
    }
  }

  writer.end_mapping();
  writer.end_document();

  std::string text = writer.take();
  BOOST_LOG_TRIVIAL(debug) << "Codec: Encoded " << fields.size() << " fields into " << text.size() << " bytes";
  return text;
}

std::string DocumentCodec::emit_opaque(const YAML::Node& node) const {
  EventWriter writer(settings_);
  writer.begin_document();
  writer.write_node(node);
  writer.end_document();
  return writer.take();
}

} // namespace pagestore::codec
