#pragma once

#include <SDL3/SDL.h>

#include <algorithm>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace Paths {

inline bool pathExists(const std::filesystem::path& p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec) && !ec;
}

// Data files ship in data/ next to the executable or one level up in a build
// tree. Tries the working directory, then argv[0], then SDL's base path, and
// returns the relative path unchanged when nothing matches.
inline std::string resolveAssetPath(std::string_view relativePath, const char* argv0 = nullptr) {
  namespace fs = std::filesystem;

  const fs::path rel(relativePath);
  if (rel.empty() || rel.is_absolute() || pathExists(rel))
    return rel.string();

  std::vector<fs::path> bases;
  if ((argv0 != nullptr) && (*argv0 != 0)) {
    std::error_code ec;
    const fs::path exe = fs::absolute(fs::path(argv0), ec);
    if (!ec)
      bases.push_back(exe.parent_path());
  }
  const char* sdlBase = SDL_GetBasePath();
  if ((sdlBase != nullptr) && (*sdlBase != 0))
    bases.emplace_back(sdlBase);

  for (const fs::path& base : bases) {
    for (const fs::path& candidate : {base / rel, base / ".." / rel}) {
      if (pathExists(candidate))
        return candidate.lexically_normal().string();
    }
  }
  return rel.string();
}

// Every *.toml directly inside dirPath, sorted by file name so registry order
// is stable across platforms.
inline std::vector<std::string> listTomlFiles(std::string_view dirPath) {
  namespace fs = std::filesystem;
  std::vector<fs::path> found;

  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(fs::path(dirPath), ec)) {
    if (entry.is_regular_file(ec) && entry.path().extension() == ".toml")
      found.push_back(entry.path());
  }
  std::ranges::sort(found, {}, [](const fs::path& p) { return p.filename().string(); });

  std::vector<std::string> out;
  out.reserve(found.size());
  for (const fs::path& p : found) {
    out.push_back(p.string());
  }
  return out;
}

}  // namespace Paths
