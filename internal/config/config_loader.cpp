#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace strands::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

strands::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  strands::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(strands::runtime::config::RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  if (config.loyalty().sweep_interval_ms() == 0) {
    config.mutable_loyalty()->set_sweep_interval_ms(kDefaultSweepIntervalMs);
  }

  if (config.promotions().expiry_sweep_interval_ms() == 0) {
    config.mutable_promotions()->set_expiry_sweep_interval_ms(kDefaultSweepIntervalMs);
  }
  if (config.promotions().loyal_customer_min_visits() == 0) {
    config.mutable_promotions()->set_loyal_customer_min_visits(kDefaultLoyalCustomerMinVisits);
  }

  auto* notifications = config.mutable_notifications();
  if (notifications->sink() == strands::runtime::config::NotificationsConfig::SINK_UNSPECIFIED) {
    notifications->set_sink(strands::runtime::config::NotificationsConfig::LOG);
  }
  if (notifications->sender_email().empty()) {
    notifications->set_sender_email(kDefaultSenderEmail);
  }

  auto* observability = config.mutable_observability();
  if (observability->service_name().empty()) {
    observability->set_service_name(kDefaultServiceName);
  }
  if (observability->transport() == strands::runtime::config::ObservabilityConfig::OTLP_TRANSPORT_UNSPECIFIED) {
    observability->set_transport(strands::runtime::config::ObservabilityConfig::OTLP_TRANSPORT_GRPC);
  }
  // an absent metrics block records every family
  if (!observability->has_metrics()) {
    auto* metrics = observability->mutable_metrics();
    metrics->set_request_metrics_enabled(true);
    metrics->set_route_labels_enabled(true);
    metrics->set_settlement_metrics_enabled(true);
    metrics->set_sweep_metrics_enabled(true);
  }
  if (observability->metrics().collection_interval_ms() == 0) {
    observability->mutable_metrics()->set_collection_interval_ms(kDefaultMetricsIntervalMs);
  }
}

void ConfigLoader::Validate(const strands::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (database.has_postgres() && database.postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }
  const double ratio = config.observability().tracing().sampling_ratio();
  if (ratio < 0.0 || ratio > 1.0) {
    throw std::runtime_error("Invalid configuration: observability.tracing.sampling_ratio must be within [0, 1]");
  }
}

} // namespace strands::config
