#ifndef PAGESTORE_FILTER_PIPELINE_HPP
#define PAGESTORE_FILTER_PIPELINE_HPP

#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <yaml-cpp/yaml.h>

namespace pagestore {
namespace filter {

// Type aliases for clarity
using FilterFn = std::function<std::string(const std::string&)>;
using FilterRegistry = std::unordered_map<std::string, FilterFn>;

// Separates the base field name from its filter tags: "body|md|upper"
constexpr char TAG_SEPARATOR = '|';

class FilterPipeline {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit FilterPipeline(FilterRegistry registry = FilterRegistry());


  // ---- PIPELINE EXECUTION ----
  // Returns a copy of a map document with every tagged field filtered and
  // renamed. Other documents are returned as they are.
  YAML::Node apply(const YAML::Node& document) const;
  // Folds the tags of one field name over its value, left to right.
  // Unknown tags stay in the returned name.
  std::pair<std::string, YAML::Node> apply_field(const std::string& name,
                                                 const YAML::Node& value) const;


  // ---- GETTERS AND SETTERS ----
  bool has_filter(const std::string& tag) const { return registry_.count(tag) > 0; }

private:
  // ---- PARAMETERS ----
  FilterRegistry registry_;
};

} // namespace filter
} // namespace pagestore

#endif // PAGESTORE_FILTER_PIPELINE_HPP
