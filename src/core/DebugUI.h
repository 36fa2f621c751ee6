#pragma once

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_render.h>
#include <SDL3/SDL_video.h>

#include <cstdint>
#include <string>
#include <vector>

namespace nutfall {
class Simulation;
}

struct DebugUIOverlayModel {
  uint64_t frame = 0;
  float dt = 0.0F;
  const char* status = "";
  int elements = 0;
  int particles = 0;
  int floaters = 0;
  int strikes = 0;
  int patches = 0;
  int clouds = 0;
};

struct DebugUIInspectorModel {
  const nutfall::Simulation* sim = nullptr;
  bool simPaused = false;
  float timeScale = 1.0F;
  int gamepadDeadzone = 8000;
  std::string characterId;
  const std::vector<std::string>* characterIds = nullptr;
  std::vector<std::string> legend;
};

struct DebugUIActions {
  bool quit = false;
  bool resetLayoutAndPrefs = false;

  bool setSimPaused = false;
  bool simPaused = false;
  int stepFrames = 0;

  bool setTimeScale = false;
  float timeScale = 1.0F;

  bool debugStart = false;
  int debugYear = 0;
  int debugMonth = 0;

  bool selectCharacter = false;
  std::string characterId;

  bool setGamepadDeadzone = false;
  int gamepadDeadzone = 8000;
};

// Dear ImGui inspector over the running simulation. Debug-only; the game
// itself draws through the SDL renderer.
class DebugUI {
 public:
  bool init(SDL_Window* window, SDL_Renderer* renderer, const std::string& prefsDir);
  void shutdown();

  void processEvent(const SDL_Event& e);
  void beginFrame();
  void endFrame(SDL_Renderer* renderer);

  [[nodiscard]] bool initialized() const { return initialized_; }
  [[nodiscard]] bool wantCaptureKeyboard() const;
  [[nodiscard]] bool wantCaptureMouse() const;

  void drawOverlay(const DebugUIOverlayModel& model);
  DebugUIActions drawInspector(const DebugUIInspectorModel& model);

 private:
  bool initialized_ = false;
  std::string iniPath_;
  int debugYear_ = 0;
  int debugMonth_ = 2;
};
