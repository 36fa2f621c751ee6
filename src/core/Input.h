#pragma once

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_gamepad.h>
#include <SDL3/SDL_scancode.h>
#include <SDL3/SDL_touch.h>

#include <array>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "nutfall/Collaborators.h"

struct AppCommands {
  bool quit = false;
  bool confirm = false;
  bool back = false;
  bool menuUp = false;
  bool menuDown = false;
  bool menuLeft = false;
  bool menuRight = false;
  int pickSlot = -1;  // 0-based skill slot from the number keys
  bool showHighScores = false;
  bool showCharacters = false;
  bool toggleDebugOverlay = false;
  bool togglePanels = false;
};

// Folds keyboard, gamepad and touch swipes into the movement intent the
// simulation reads. Jump from a key or button is held; a swipe jump is latched
// until the simulation consumes it.
class Input : public nutfall::IntentSource {
 public:
  void init();
  void shutdown();

  void handleEvent(const SDL_Event& e);

  [[nodiscard]] bool hasGamepad() const { return gamepad_ != nullptr; }
  [[nodiscard]] const char* gamepadName() const;
  [[nodiscard]] int gamepadDeadzone() const { return axisDeadzone_; }
  void setGamepadDeadzone(int deadzone);
  void setViewportHeight(int pixels) { viewportHeight_ = pixels > 0 ? pixels : 1; }
  // Touches only steer while a run is in progress.
  void setTouchEnabled(bool enabled);
  void appendLegend(std::vector<std::string>& out) const;

  [[nodiscard]] nutfall::MoveIntent intent() const override { return intent_; }
  void consumeJump() override;

  // Drops held keys and touches, e.g. when a level-up screen opens.
  void resetGameInput();

  // Consume menu and debug commands (edge-triggered).
  AppCommands consumeCommands();

 private:
  void updateDerivedActions();
  void clearGamepadState();
  void tryOpenFirstGamepad();
  void handleTouch(const SDL_Event& e);
  void pressEdge(bool now, bool& held, bool& command);

  std::array<bool, SDL_SCANCODE_COUNT> scancodeDown_{};
  nutfall::MoveIntent intent_{};
  AppCommands commands_{};

  SDL_Gamepad* gamepad_ = nullptr;
  uint32_t gamepadId_ = 0;
  int axisLeftX_ = 0;
  int axisDeadzone_ = 8000;
  bool dpadLeft_ = false;
  bool dpadRight_ = false;
  bool dpadUp_ = false;
  bool dpadDown_ = false;
  bool btnSouth_ = false;  // jump / confirm
  bool btnEast_ = false;   // back
  bool btnStart_ = false;

  struct TouchState {
    bool left = false;
    float startY = 0.0F;
    bool swipeArmed = true;
  };
  std::unordered_map<SDL_FingerID, TouchState> touches_;
  bool touchEnabled_ = false;
  bool touchLeft_ = false;
  bool touchRight_ = false;
  bool touchJump_ = false;
  int viewportHeight_ = 700;

  bool confirmHeld_ = false;
  bool backHeld_ = false;
  bool upHeld_ = false;
  bool downHeld_ = false;
  bool leftHeld_ = false;
  bool rightHeld_ = false;
  bool f1Held_ = false;
  bool hHeld_ = false;
  bool tabHeld_ = false;
  bool cHeld_ = false;
  std::array<bool, 3> digitHeld_{};
};
