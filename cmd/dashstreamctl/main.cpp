#include <google/protobuf/util/json_util.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#include "dashstream/v1.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/manifest/manifest_parser.hpp"
#include "internal/observability/logging.hpp"
#include "internal/readiness/startup_window.hpp"
#include "internal/session/session_token.hpp"
#include "internal/storage/asset_file_system.hpp"
#include "internal/util/errors.hpp"

using namespace dashstream::v1;

namespace {

constexpr int kExitReady    = 0;
constexpr int kExitUsage    = 1;
constexpr int kExitError    = 2;
constexpr int kExitNotReady = 3;

void Usage() {
  std::cout << "Usage:\n"
            << "  dashstreamctl [--config <config.yaml>] inspect <asset_dir> [startup_single|steady_state_dual]\n"
            << "  dashstreamctl [--config <config.yaml>] timeline <manifest.mpd>\n"
            << "  dashstreamctl [--config <config.yaml>] verify-token <token>\n";
}

std::optional<ManifestProfile> ParseProfile(const std::string& s) {
  if (s == "startup_single") return MANIFEST_PROFILE_STARTUP_SINGLE;
  if (s == "steady_state_dual") return MANIFEST_PROFILE_STEADY_STATE_DUAL;
  return std::nullopt;
}

std::string ReadText(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot read " + path.string());
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

int Inspect(const dashstream::runtime::config::RuntimeConfig& config, const std::filesystem::path& asset_dir, ManifestProfile profile) {
  dashstream::storage::LocalAssetFileSystem fs;

  const auto manifest_path = asset_dir / "manifest.mpd";
  auto       xml           = fs.ReadFile(manifest_path);
  if (!xml) {
    std::cout << "manifest: missing (" << manifest_path.string() << ")\n";
    return kExitNotReady;
  }

  if (profile == MANIFEST_PROFILE_UNSPECIFIED) {
    profile = config.session().manifest_profile();
  }

  auto status = dashstream::readiness::CheckStartupWindow(fs, asset_dir, *xml, profile);
  for (const auto& rep : status.representations) {
    std::cout << "representation " << rep.index << ": timeline=" << rep.timeline_entries << " init=" << (rep.init_present ? "yes" : "no")
              << " chunks=" << rep.chunks_present << "/" << dashstream::readiness::kStartupChunkCount << (rep.Ready() ? " ready" : " pending")
              << "\n";
  }

  std::cout << "startup window: " << (status.Ready() ? "READY" : "NOT_READY") << "\n";
  return status.Ready() ? kExitReady : kExitNotReady;
}

int Timeline(const std::filesystem::path& manifest_path) {
  auto counts = dashstream::manifest::CountTimelineSegments(ReadText(manifest_path));
  for (const auto& [index, entries] : counts) {
    std::cout << "representation " << index << ": " << entries << " segments\n";
  }
  return kExitReady;
}

int VerifyToken(const dashstream::runtime::config::RuntimeConfig& config, const std::string& token) {
  dashstream::session::SessionTokenSigner signer(config.session().token_secret());
  auto                                    claims = signer.Verify(token);

  std::string                                json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  auto status            = google::protobuf::util::MessageToJsonString(claims, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("cannot print claims: " + std::string(status.message()));
  }
  std::cout << json;
  return kExitReady;
}

} // namespace

int main(int argc, char** argv) {
  int         arg = 1;
  std::string config_path;
  if (argc > 2 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
    arg         = 3;
  }

  if (argc - arg < 2) {
    Usage();
    return kExitUsage;
  }

  const std::string cmd = argv[arg];

  try {
    auto config = config_path.empty() ? dashstream::config::ConfigLoader::Defaults() : dashstream::config::ConfigLoader::LoadFromYaml(config_path);
    dashstream::observability::InitializeLogging(config);

    int rc = kExitUsage;
    if (cmd == "inspect") {
      auto profile = MANIFEST_PROFILE_UNSPECIFIED;
      if (argc - arg >= 3) {
        auto parsed = ParseProfile(argv[arg + 2]);
        if (!parsed) {
          std::cerr << "unknown profile '" << argv[arg + 2] << "'\n";
          return kExitUsage;
        }
        profile = *parsed;
      }
      rc = Inspect(config, argv[arg + 1], profile);
    } else if (cmd == "timeline") {
      rc = Timeline(argv[arg + 1]);
    } else if (cmd == "verify-token") {
      rc = VerifyToken(config, argv[arg + 1]);
    } else {
      Usage();
    }

    dashstream::observability::ShutdownLogging();
    return rc;
  } catch (const dashstream::util::StreamingError& e) {
    std::cerr << e.code() << ": " << e.what() << "\n";
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
  }

  dashstream::observability::ShutdownLogging();
  return kExitError;
}
