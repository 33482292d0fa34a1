#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdlib>

#include "internal/util/errors.hpp"

namespace resolver::config {

namespace pb = resolver::runtime::config;

namespace {

using google::protobuf::Value;

// Plain scalars become bool/number when they read as one. Quoted scalars
// carry the "!" tag and always stay strings ("1" as a country code, "," as
// a delimiter). "nan"/"inf" stay strings too: strtod accepts them.
void ScalarToValue(const YAML::Node& node, Value* out) {
  const std::string& text = node.Scalar();
  if (node.Tag() == "!" || text.empty()) {
    out->set_string_value(text);
    return;
  }
  if (text == "true" || text == "false") {
    out->set_bool_value(text == "true");
    return;
  }

  char*        end    = nullptr;
  const double number = std::strtod(text.c_str(), &end);
  if (end != nullptr && *end == '\0' && std::isfinite(number)) {
    out->set_number_value(number);
    return;
  }
  out->set_string_value(text);
}

void NodeToValue(const YAML::Node& node, Value* out) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      out->set_null_value(google::protobuf::NULL_VALUE);
      return;

    case YAML::NodeType::Scalar:
      ScalarToValue(node, out);
      return;

    case YAML::NodeType::Sequence: {
      auto* list = out->mutable_list_value();
      for (const auto& item : node) NodeToValue(item, list->add_values());
      return;
    }

    case YAML::NodeType::Map: {
      auto& fields = *out->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) NodeToValue(entry.second, &fields[entry.first.Scalar()]);
      return;
    }
  }
  throw util::ConfigurationError("unsupported YAML node at line " + std::to_string(node.Mark().line + 1));
}

// YAML -> google.protobuf.Value -> JSON -> RuntimeConfig. The JSON parser
// rejects unknown keys and wrong value types with a field path.
pb::RuntimeConfig ToRuntimeConfig(const YAML::Node& root, const std::string& origin) {
  if (!root.IsMap()) {
    throw util::ConfigurationError(origin + ": configuration root must be a mapping");
  }

  Value document;
  NodeToValue(root, &document);

  std::string json;
  if (auto status = google::protobuf::util::MessageToJsonString(document, &json); !status.ok()) {
    throw util::ConfigurationError(origin + ": " + std::string(status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  pb::RuntimeConfig config;
  if (auto status = google::protobuf::util::JsonStringToMessage(json, &config, options); !status.ok()) {
    throw util::ConfigurationError(origin + ": invalid configuration: " + std::string(status.message()));
  }
  return config;
}

} // namespace

pb::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw util::ConfigurationError(path + ": " + e.what());
  }
  return ToRuntimeConfig(root, path);
}

pb::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw util::ConfigurationError(std::string("inline config: ") + e.what());
  }
  return ToRuntimeConfig(root, "inline config");
}

} // namespace resolver::config
