#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace bolt::config {

using google::protobuf::util::TimeUtil;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
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

static void DefaultDuration(google::protobuf::Duration* duration, int64_t millis) {
  if (duration->seconds() == 0 && duration->nanos() == 0) {
    *duration = TimeUtil::MillisecondsToDuration(millis);
  }
}

static void DefaultString(std::string* value, const std::string& fallback) {
  if (value->empty()) {
    *value = fallback;
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

bolt::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  bolt::runtime::config::RuntimeConfig config;

  // An empty document means "all defaults".
  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

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
  }

  ApplyDefaults(&config);
  return config;
}

void ConfigLoader::ApplyDefaults(bolt::runtime::config::RuntimeConfig* config) {
  DefaultString(config->mutable_server()->mutable_bind_address(), "127.0.0.1:50151");

  std::string home = ".";
  if (const char* env_home = std::getenv("HOME")) {
    home = env_home;
  }
  const auto base_dir = std::filesystem::path(home) / ".bolt";

  DefaultString(config->mutable_storage()->mutable_data_dir(), base_dir.string());

  auto* lnd = config->mutable_lnd();
  DefaultString(lnd->mutable_binary_path(), "lnd");
  DefaultString(lnd->mutable_lnd_dir(), (base_dir / "lnd").string());
  DefaultString(lnd->mutable_rpc_listen(), "localhost:10009");

  auto* onboarding = config->mutable_onboarding();
  DefaultString(onboarding->mutable_currency(), "bitcoin");
  DefaultString(onboarding->mutable_network(), "testnet");
  DefaultString(onboarding->mutable_wallet(), "wallet-1");

  auto* lifecycle = config->mutable_lifecycle();
  DefaultDuration(lifecycle->mutable_shutdown_timeout(), 10'000);
  DefaultDuration(lifecycle->mutable_quiescence_interval(), 200);
  DefaultDuration(lifecycle->mutable_connect_timeout(), 10'000);
  DefaultDuration(lifecycle->mutable_call_timeout(), 60'000);
  DefaultDuration(lifecycle->mutable_splash_delay(), 1'500);
}

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& duration) {
  return std::chrono::milliseconds(TimeUtil::DurationToMilliseconds(duration));
}

} // namespace bolt::config
