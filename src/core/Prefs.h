#pragma once

#include <string>

struct SessionPrefs {
  std::string characterId = "pistachio";
  std::string playerName;
  int windowWidth = 800;
  int windowHeight = 700;
  bool panelsOpen = false;
  float timeScale = 1.0F;
  int gamepadDeadzone = 8000;
};

// Directory under the SDL pref path, with a trailing separator. Empty when SDL
// cannot provide one.
std::string prefsDirPath();
std::string highScoresFilePath();

bool loadSessionPrefs(SessionPrefs& out);
bool saveSessionPrefs(const SessionPrefs& prefs);
bool deleteSessionPrefs();
bool deleteImGuiIni();
