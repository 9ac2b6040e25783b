#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

namespace cashgraph::config {

namespace {

using google::protobuf::FieldDescriptor;

bool IsDuration(const FieldDescriptor* field) {
  return field && field->message_type() && field->message_type()->full_name() == "google.protobuf.Duration";
}

// "2d", "36h", "15m", "250ms" -> "<seconds>s" as protobuf JSON expects.
// Anything else is passed through for the JSON parser to judge.
std::string NormalizeDuration(const std::string& text) {
  size_t digits = 0;
  while (digits < text.size() && std::isdigit(static_cast<unsigned char>(text[digits]))) ++digits;
  if (digits == 0 || digits == text.size()) return text;

  const auto unit  = text.substr(digits);
  const auto count = std::stoll(text.substr(0, digits));

  int64_t millis = 0;
  if (unit == "ms") {
    millis = count;
  } else if (unit == "s") {
    millis = count * 1000;
  } else if (unit == "m") {
    millis = count * 60 * 1000;
  } else if (unit == "h") {
    millis = count * 3600 * 1000;
  } else if (unit == "d") {
    millis = count * 86400 * 1000;
  } else {
    return text;
  }
  return fmt::format("{}.{:03}s", millis / 1000, millis % 1000);
}

void SetScalarValue(const YAML::Node& node, const FieldDescriptor* field, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();

  if (IsDuration(field)) {
    value->set_string_value(NormalizeDuration(scalar));
    return;
  }

  // quoted scalars stay strings ("0.0.0.0:50061")
  if (node.Tag() == "!") {
    value->set_string_value(scalar);
    return;
  }

  if (scalar == "true" || scalar == "false") {
    value->set_bool_value(scalar == "true");
    return;
  }

  char*        end    = nullptr;
  const double number = std::strtod(scalar.c_str(), &end);
  if (!scalar.empty() && end && *end == '\0') {
    value->set_number_value(number);
    return;
  }

  value->set_string_value(scalar);
}

// Proto name first, then camelCase JSON name.
const FieldDescriptor* FindField(const google::protobuf::Descriptor& message, const std::string& key) {
  if (const auto* field = message.FindFieldByName(key)) return field;
  for (int i = 0; i < message.field_count(); ++i) {
    if (message.field(i)->json_name() == key) return message.field(i);
  }
  return nullptr;
}

// `message` describes the proto message a map node populates; unknown keys
// are kept so the JSON parser reports them.
void YamlToProtoValue(const YAML::Node& node, const google::protobuf::Descriptor* message, const FieldDescriptor* field,
                      google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, field, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (const auto& item : node) {
        YamlToProtoValue(item, field ? field->message_type() : nullptr, field, list->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* object = value->mutable_struct_value();
      for (const auto& entry : node) {
        const auto  key   = entry.first.Scalar();
        const auto* child = message ? FindField(*message, key) : nullptr;
        YamlToProtoValue(entry.second, child ? child->message_type() : nullptr, child, &(*object->mutable_fields())[key]);
      }
      break;
    }

    default:
      throw std::runtime_error("unsupported YAML node");
  }
}

} // namespace

static cashgraph::runtime::config::RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  cashgraph::runtime::config::RuntimeConfig config;
  if (!yaml || yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, cashgraph::runtime::config::RuntimeConfig::descriptor(), nullptr, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

cashgraph::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

cashgraph::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

void ConfigLoader::Validate(const cashgraph::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path must be set");
  }
  if (database.has_postgres() && database.postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri must be set");
  }

  const auto& matching = config.matching();
  if (matching.similarity_threshold() < 0.0 || matching.similarity_threshold() > 1.0) {
    throw std::runtime_error("Invalid configuration: matching.similarity_threshold must be within [0, 1]");
  }
  if (matching.max_subset_pool() > 24) {
    throw std::runtime_error("Invalid configuration: matching.max_subset_pool above 24 makes subset search intractable");
  }
  if (matching.amount_tolerance_minor() < 0) {
    throw std::runtime_error("Invalid configuration: matching.amount_tolerance_minor must not be negative");
  }
  for (const auto* d : {&matching.settlement_window(), &matching.drift_window(), &matching.in_transit_aging(),
                        &matching.composition_window(), &matching.ops_match_window(), &matching.ghost_aging(),
                        &matching.timing_escalation()}) {
    if (d->seconds() < 0 || d->nanos() < 0) {
      throw std::runtime_error("Invalid configuration: matching durations must not be negative");
    }
  }

  const auto& lookback = config.engine().watermark_lookback();
  if (lookback.seconds() < 0 || lookback.nanos() < 0) {
    throw std::runtime_error("Invalid configuration: engine.watermark_lookback must not be negative");
  }
}

} // namespace cashgraph::config
