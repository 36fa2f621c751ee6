#pragma once

#include <array>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <format>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>

#include <toml++/toml.h>

namespace TomlUtil {

inline int& warningCounter() {
  static int counter = 0;
  return counter;
}

inline void resetWarningCount() {
  warningCounter() = 0;
}

inline int warningCount() {
  return warningCounter();
}

inline void warnLine(std::string_view prefix, std::string_view message) {
  static constexpr std::string_view kWarningPrefix = ": warning: ";
  (void)std::fwrite(prefix.data(), 1, prefix.size(), stderr);
  (void)std::fwrite(kWarningPrefix.data(), 1, kWarningPrefix.size(), stderr);
  (void)std::fwrite(message.data(), 1, message.size(), stderr);
  (void)std::fwrite("\n", 1, 1, stderr);
}

template <typename... Args>
inline void warnf(const char* path, std::format_string<Args...> fmt, Args&&... args) {
  ++warningCounter();
  const std::string message = std::format(fmt, std::forward<Args>(args)...);
  const std::string_view prefix =
      (path != nullptr) ? std::string_view{path} : std::string_view{"<toml>"};
  warnLine(prefix, message);
}

inline bool allowedKey(std::string_view key, std::initializer_list<std::string_view> allowed) {
  return std::ranges::any_of(allowed, [key](std::string_view a) { return key == a; });
}

inline void warnUnknownKeys(const toml::table& tbl,
                            const char* path,
                            std::string_view scope,
                            std::initializer_list<std::string_view> allowed) {
  for (const auto& [key, node] : tbl) {
    (void)node;
    std::string_view k = key.str();
    if (allowedKey(k, allowed)) {
      continue;
    }
    warnf(path, "unknown key '{}' in {}", k, scope);
  }
}

// "RRGGBB" or "#RRGGBB".
inline std::optional<std::array<std::uint8_t, 3>> parseHexRgb(std::string_view s) {
  if (!s.empty() && s.front() == '#')
    s.remove_prefix(1);
  if (s.size() != 6)
    return std::nullopt;

  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9')
      return c - '0';
    if (c >= 'a' && c <= 'f')
      return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F')
      return 10 + (c - 'A');
    return -1;
  };

  std::array<std::uint8_t, 3> rgb{};
  for (std::size_t i = 0; i < rgb.size(); ++i) {
    const int hi = nibble(s[i * 2]);
    const int lo = nibble(s[(i * 2) + 1]);
    if (hi < 0 || lo < 0)
      return std::nullopt;
    rgb[i] = static_cast<std::uint8_t>((hi * 16) + lo);
  }
  return rgb;
}

// Writes through "<path>.tmp" and renames over the target.
inline bool writeTableAtomically(const toml::table& tbl, const std::filesystem::path& outPath) {
  namespace fs = std::filesystem;
  const fs::path tmpPath = outPath.string() + ".tmp";

  std::error_code ec;
  if (outPath.has_parent_path())
    fs::create_directories(outPath.parent_path(), ec);

  std::ofstream tmp(tmpPath, std::ios::binary | std::ios::trunc);
  if (!tmp.is_open())
    return false;
  tmp << tbl;
  tmp.close();
  if (!tmp)
    return false;

  fs::rename(tmpPath, outPath, ec);
  if (ec) {
    fs::remove(tmpPath, ec);
    return false;
  }
  return true;
}

}  // namespace TomlUtil
