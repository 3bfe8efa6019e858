#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace dashstream::storage {

/*
  Read-only view of the shared asset volume.

  Readiness checks only ever check and read; the build engine owns writes.
*/
class AssetFileSystem {
 public:
  virtual ~AssetFileSystem() = default;

  virtual bool Exists(const std::filesystem::path& path) const = 0;

  // nullopt when the file is absent or unreadable
  virtual std::optional<std::string> ReadFile(const std::filesystem::path& path) const = 0;
};

class LocalAssetFileSystem final : public AssetFileSystem {
 public:
  bool                       Exists(const std::filesystem::path& path) const override;
  std::optional<std::string> ReadFile(const std::filesystem::path& path) const override;
};

} // namespace dashstream::storage
