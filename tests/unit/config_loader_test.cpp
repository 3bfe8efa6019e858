#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/time.hpp"

namespace {

using dashstream::config::ConfigError;
using dashstream::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "dashstream_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

long long Millis(const google::protobuf::Duration& d) {
  return dashstream::util::ToMillis(d, std::chrono::milliseconds(-1)).count();
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
library:
  music_root: "/srv/music"
  sqlite:
    path: "/var/lib/dashstream/library.db"
    wal_mode: true
session:
  ttl: "120s"
  token_secret: "from-file"
  manifest_profile: MANIFEST_PROFILE_STEADY_STATE_DUAL
  manifest_url_base: "/stream/sessions"
readiness:
  poll_interval: "0.050s"
  phase_timeout: "15s"
  segment_timeout: "10s"
  segment_microcache_ttl: "2s"
repair:
  worker_threads: 3
)");

  unsetenv("DASHSTREAM_SESSION_SECRET");
  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.library().music_root() == "/srv/music");
  assert(config.library().sqlite().wal_mode());
  assert(Millis(config.session().ttl()) == 120000);
  assert(config.session().token_secret() == "from-file");
  assert(config.session().manifest_profile() == dashstream::v1::MANIFEST_PROFILE_STEADY_STATE_DUAL);
  assert(config.session().manifest_url_base() == "/stream/sessions");
  assert(Millis(config.readiness().poll_interval()) == 50);
  assert(Millis(config.readiness().phase_timeout()) == 15000);
  assert(Millis(config.readiness().segment_timeout()) == 10000);
  assert(Millis(config.readiness().segment_microcache_ttl()) == 2000);
  assert(config.repair().worker_threads() == 3);
}

void TestMissingSectionsGetDefaults() {
  const auto yaml_path = WriteYaml("minimal",
                                   R"(library:
  music_root: "/srv/music"
)");

  unsetenv("DASHSTREAM_SESSION_SECRET");
  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(Millis(config.session().ttl()) == 300000);
  assert(Millis(config.session().expired_sweep_interval()) == 60000);
  assert(config.session().token_secret() == "dashstream-dev-secret");
  assert(config.session().manifest_profile() == dashstream::v1::MANIFEST_PROFILE_STARTUP_SINGLE);
  assert(config.session().manifest_url_base() == "/api/streaming/v1/sessions");
  assert(Millis(config.readiness().poll_interval()) == 75);
  assert(Millis(config.readiness().phase_timeout()) == 20000);
  assert(Millis(config.readiness().segment_timeout()) == 20000);
  assert(Millis(config.readiness().segment_microcache_ttl()) == 1500);
  assert(config.repair().worker_threads() == 1);
}

void TestEnvironmentSecretOverridesFile() {
  const auto yaml_path = WriteYaml("env_secret",
                                   R"(session:
  token_secret: "from-file"
)");

  setenv("DASHSTREAM_SESSION_SECRET", "from-env", 1);
  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  unsetenv("DASHSTREAM_SESSION_SECRET");

  assert(config.session().token_secret() == "from-env");
}

void TestQuotedScalarsStayStrings() {
  const auto yaml_path = WriteYaml("quoted",
                                   R"(library:
  music_root: "12345"
  sqlite:
    path: "C:\\music\\\"quoted\"\\library.db"
session:
  token_secret: "true"
)");

  unsetenv("DASHSTREAM_SESSION_SECRET");
  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.library().music_root() == "12345");
  assert(config.library().sqlite().path() == "C:\\music\\\"quoted\"\\library.db");
  assert(config.session().token_secret() == "true");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(library:
  music_root: "/srv/music"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const ConfigError&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsConfigError() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/dashstream.yaml");
  } catch (const ConfigError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestMissingSectionsGetDefaults();
  TestEnvironmentSecretOverridesFile();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsConfigError();

  std::cout << "dashstream_unit_config_loader: pass\n";
  return 0;
}
