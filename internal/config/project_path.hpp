#pragma once

#include <string>

namespace engram::config {

// "~" and "~/..." expand to $HOME; "~user" is left as is.
std::string ExpandTilde(const std::string& path);

/*
  Canonical project id for a filesystem path: tilde-expanded, absolute,
  lexically normalized, and symlink-resolved when the path exists. Paths
  that cannot be resolved keep their absolute form.
*/
std::string CanonicalizeProjectId(const std::string& path);

// $HOME/.local-mcp-memory/config.json
std::string DefaultConfigPath();

// $HOME/.local-mcp-memory/data
std::string DefaultDataDir();

} // namespace engram::config
