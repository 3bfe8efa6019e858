#include "asset_file_system.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace dashstream::storage {

bool LocalAssetFileSystem::Exists(const std::filesystem::path& path) const {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec);
}

std::optional<std::string> LocalAssetFileSystem::ReadFile(const std::filesystem::path& path) const {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream out;
  out << in.rdbuf();
  if (in.bad()) {
    return std::nullopt;
  }
  return out.str();
}

} // namespace dashstream::storage
