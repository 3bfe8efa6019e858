#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <cstdlib>

namespace dashstream::config {
namespace {

namespace cfg = dashstream::runtime::config;

constexpr const char* kSessionSecretEnv = "DASHSTREAM_SESSION_SECRET";
constexpr const char* kDefaultSecret    = "dashstream-dev-secret";
constexpr const char* kDefaultUrlBase   = "/api/streaming/v1/sessions";

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars carry the non-specific "!" tag and always stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

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

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
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
      throw ConfigError("Unsupported YAML node");
  }
}

bool IsUnset(const google::protobuf::Duration& d) {
  return d.seconds() <= 0 && d.nanos() <= 0;
}

void SetMillis(google::protobuf::Duration* d, int64_t ms) {
  d->set_seconds(ms / 1000);
  d->set_nanos(static_cast<int32_t>((ms % 1000) * 1000000));
}

} // namespace

void ConfigLoader::ApplyDefaults(cfg::RuntimeConfig& config) {
  auto* session = config.mutable_session();
  if (IsUnset(session->ttl())) {
    SetMillis(session->mutable_ttl(), 300000);
  }
  if (IsUnset(session->expired_sweep_interval())) {
    SetMillis(session->mutable_expired_sweep_interval(), 60000);
  }
  if (session->manifest_profile() == dashstream::v1::MANIFEST_PROFILE_UNSPECIFIED) {
    session->set_manifest_profile(dashstream::v1::MANIFEST_PROFILE_STARTUP_SINGLE);
  }
  if (session->manifest_url_base().empty()) {
    session->set_manifest_url_base(kDefaultUrlBase);
  }
  if (const char* secret = std::getenv(kSessionSecretEnv); secret && *secret) {
    session->set_token_secret(secret);
  }
  if (session->token_secret().empty()) {
    session->set_token_secret(kDefaultSecret);
  }

  auto* readiness = config.mutable_readiness();
  if (IsUnset(readiness->poll_interval())) {
    SetMillis(readiness->mutable_poll_interval(), 75);
  }
  if (IsUnset(readiness->phase_timeout())) {
    SetMillis(readiness->mutable_phase_timeout(), 20000);
  }
  if (IsUnset(readiness->segment_timeout())) {
    SetMillis(readiness->mutable_segment_timeout(), 20000);
  }
  if (IsUnset(readiness->segment_microcache_ttl())) {
    SetMillis(readiness->mutable_segment_microcache_ttl(), 1500);
  }

  if (config.repair().worker_threads() == 0) {
    config.mutable_repair()->set_worker_threads(1);
  }
}

cfg::RuntimeConfig ConfigLoader::Defaults() {
  cfg::RuntimeConfig config;
  ApplyDefaults(config);
  return config;
}

cfg::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw ConfigError("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw ConfigError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  cfg::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw ConfigError("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(config);
  return config;
}

} // namespace dashstream::config
