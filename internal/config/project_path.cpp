#include "project_path.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

#include "internal/util/errors.hpp"

namespace engram::config {

namespace fs = std::filesystem;

namespace {

constexpr const char* kConfigDir     = ".local-mcp-memory";
constexpr const char* kConfigFile    = "config.json";
constexpr const char* kDataSubDir    = "data";

fs::path HomeDir() {
  const char* home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    throw util::InvalidArgument("HOME is not set");
  }
  return fs::path(home);
}

// Drops the empty trailing component "/a/b/" normalizes to.
fs::path Clean(const fs::path& path) {
  auto normal = path.lexically_normal();
  if (!normal.has_filename() && normal.has_parent_path() && normal != normal.root_path()) {
    normal = normal.parent_path();
  }
  return normal;
}

} // namespace

std::string ExpandTilde(const std::string& path) {
  if (path == "~") {
    return HomeDir().string();
  }
  if (path.rfind("~/", 0) == 0) {
    return (HomeDir() / path.substr(2)).string();
  }
  return path;
}

std::string CanonicalizeProjectId(const std::string& path) {
  if (path.empty()) {
    throw util::InvalidArgument("project path must not be empty");
  }

  std::error_code ec;
  auto            absolute = fs::absolute(fs::path(ExpandTilde(path)), ec);
  if (ec) {
    throw util::InvalidArgument("failed to get absolute path for " + path + ": " + ec.message());
  }
  absolute = Clean(absolute);

  auto canonical = fs::canonical(absolute, ec);
  if (ec) {
    return absolute.string();
  }
  return canonical.string();
}

std::string DefaultConfigPath() {
  return (HomeDir() / kConfigDir / kConfigFile).string();
}

std::string DefaultDataDir() {
  return (HomeDir() / kConfigDir / kDataSubDir).string();
}

} // namespace engram::config
