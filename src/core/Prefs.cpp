#include "core/Prefs.h"

#include <toml++/toml.h>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <string>
#include <system_error>

#include <SDL3/SDL_filesystem.h>
#include <SDL3/SDL_stdinc.h>

#include "util/TomlUtil.h"

namespace {

std::string prefsFilePath() {
  const std::string dir = prefsDirPath();
  if (dir.empty())
    return {};
  return dir + "session.toml";
}

bool removeIfPresent(const std::string& path) {
  namespace fs = std::filesystem;
  std::error_code ec;
  if (!fs::exists(path, ec))
    return true;
  (void)fs::remove(path, ec);
  return !ec;
}

}  // namespace

std::string prefsDirPath() {
  std::string path;
  if (char* prefPath = SDL_GetPrefPath("nutfall", "nutfall")) {
    path = std::string(prefPath);
    SDL_free(prefPath);
  }
  return path;
}

std::string highScoresFilePath() {
  const std::string dir = prefsDirPath();
  if (dir.empty())
    return {};
  return dir + "highscores.toml";
}

bool loadSessionPrefs(SessionPrefs& out) {
  const std::string path = prefsFilePath();
  if (path.empty())
    return false;

  namespace fs = std::filesystem;
  std::error_code ec;
  if (!fs::exists(path, ec))
    return false;

  toml::table tbl;
  try {
    tbl = toml::parse_file(path);
  } catch (const toml::parse_error& err) {
    std::printf("Prefs: parse error in %s: %s\n", path.c_str(), std::string(err.description()).c_str());
    return false;
  }

  TomlUtil::warnUnknownKeys(tbl, path.c_str(), "session prefs",
                            {"version", "character", "player_name", "window_width",
                             "window_height", "panels_open", "time_scale", "gamepad_deadzone"});

  if (auto v = tbl.get("character"))
    out.characterId = v->value_or(out.characterId);
  if (auto v = tbl.get("player_name"))
    out.playerName = v->value_or(out.playerName);
  if (auto v = tbl.get("window_width"))
    out.windowWidth = std::clamp(v->value_or(out.windowWidth), 320, 7680);
  if (auto v = tbl.get("window_height"))
    out.windowHeight = std::clamp(v->value_or(out.windowHeight), 240, 4320);
  if (auto v = tbl.get("panels_open"))
    out.panelsOpen = v->value_or(out.panelsOpen);
  if (auto v = tbl.get("time_scale"))
    out.timeScale = std::clamp(v->value_or(out.timeScale), 0.1F, 2.0F);
  if (auto v = tbl.get("gamepad_deadzone"))
    out.gamepadDeadzone = std::clamp(v->value_or(out.gamepadDeadzone), 0, 32767);

  return true;
}

bool deleteSessionPrefs() {
  const std::string path = prefsFilePath();
  if (path.empty())
    return false;
  return removeIfPresent(path);
}

bool deleteImGuiIni() {
  const std::string dir = prefsDirPath();
  if (dir.empty())
    return false;
  return removeIfPresent(dir + "imgui.ini");
}

bool saveSessionPrefs(const SessionPrefs& prefs) {
  const std::string path = prefsFilePath();
  if (path.empty())
    return false;

  toml::table tbl;
  tbl.insert("version", 1);
  tbl.insert("character", prefs.characterId);
  tbl.insert("player_name", prefs.playerName);
  tbl.insert("window_width", prefs.windowWidth);
  tbl.insert("window_height", prefs.windowHeight);
  tbl.insert("panels_open", prefs.panelsOpen);
  tbl.insert("time_scale", prefs.timeScale);
  tbl.insert("gamepad_deadzone", prefs.gamepadDeadzone);

  return TomlUtil::writeTableAtomically(tbl, path);
}
