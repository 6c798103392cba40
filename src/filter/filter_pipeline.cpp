#include "filter/filter_pipeline.hpp"
#include <optional>
#include <boost/log/trivial.hpp>

namespace pagestore {
namespace filter {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FilterPipeline::FilterPipeline(FilterRegistry registry)
  : registry_(std::move(registry)) {
  BOOST_LOG_TRIVIAL(debug) << "FilterPipeline: Initialized with " << registry_.size() << " filters";
}


//==============================================
// PIPELINE EXECUTION
//==============================================

YAML::Node FilterPipeline::apply(const YAML::Node& document) const {
  if (!document.IsMap()) {
    return document;
  }

  YAML::Node result(YAML::NodeType::Map);
  for (const auto& entry : document) {
    if (!entry.first.IsScalar()) {
      result[entry.first] = entry.second;
      continue;
    }

    const std::string& name = entry.first.Scalar();
    if (name.find(TAG_SEPARATOR) == std::string::npos) {
      result[name] = entry.second;
      continue;
    }

    auto [filtered_name, filtered_value] = apply_field(name, entry.second);
    result[filtered_name] = filtered_value;
  }
  return result;
}

std::pair<std::string, YAML::Node> FilterPipeline::apply_field(const std::string& name,
                                                               const YAML::Node& value) const {
  std::size_t pos = name.find(TAG_SEPARATOR);
  std::string result_name = name.substr(0, pos);

  // Running value as text once a filter has run. The input node is never
  // assigned to, since that would rebind the caller's document.
  std::optional<std::string> text;

  while (pos != std::string::npos) {
    std::size_t next = name.find(TAG_SEPARATOR, pos + 1);
    std::string tag = name.substr(pos + 1, next == std::string::npos ? std::string::npos : next - pos - 1);
    pos = next;

    auto it = registry_.find(tag);
    if (it == registry_.end()) {
      BOOST_LOG_TRIVIAL(debug) << "FilterPipeline: Unknown filter '" << tag << "' kept on field " << result_name;
      result_name += TAG_SEPARATOR + tag;
      continue;
    }

    if (!text && !value.IsScalar()) {
      BOOST_LOG_TRIVIAL(warning) << "FilterPipeline: Filter '" << tag << "' skipped, field "
                                 << result_name << " is not a string";
      result_name += TAG_SEPARATOR + tag;
      continue;
    }

    text = it->second(text ? *text : value.Scalar());
  }

  if (text) {
    return {result_name, YAML::Node(*text)};
  }
  return {result_name, value};
}

} // namespace filter
} // namespace pagestore
