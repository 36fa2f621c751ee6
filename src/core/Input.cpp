#include "core/Input.h"

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_gamepad.h>
#include <SDL3/SDL_joystick.h>
#include <SDL3/SDL_keyboard.h>
#include <SDL3/SDL_scancode.h>
#include <SDL3/SDL_stdinc.h>

#include <memory>

namespace {

// SDL key mappings live here and are consumed by both input processing and UI legends.
constexpr SDL_Scancode kMoveLeftPrimary = SDL_SCANCODE_LEFT;
constexpr SDL_Scancode kMoveLeftAlt = SDL_SCANCODE_A;
constexpr SDL_Scancode kMoveRightPrimary = SDL_SCANCODE_RIGHT;
constexpr SDL_Scancode kMoveRightAlt = SDL_SCANCODE_D;

constexpr SDL_Scancode kJumpPrimary = SDL_SCANCODE_UP;
constexpr SDL_Scancode kJumpAlt = SDL_SCANCODE_W;
constexpr SDL_Scancode kJumpSpace = SDL_SCANCODE_SPACE;

constexpr SDL_Scancode kDownPrimary = SDL_SCANCODE_DOWN;
constexpr SDL_Scancode kDownAlt = SDL_SCANCODE_S;

constexpr SDL_Scancode kConfirmKey = SDL_SCANCODE_RETURN;
constexpr SDL_Scancode kConfirmPadKey = SDL_SCANCODE_KP_ENTER;
constexpr SDL_Scancode kBackKey = SDL_SCANCODE_ESCAPE;
constexpr std::array<SDL_Scancode, 3> kSlotKeys = {SDL_SCANCODE_1, SDL_SCANCODE_2,
                                                   SDL_SCANCODE_3};

constexpr SDL_Scancode kHighScoresKey = SDL_SCANCODE_TAB;
constexpr SDL_Scancode kCharactersKey = SDL_SCANCODE_C;

constexpr SDL_Scancode kCtrlLeft = SDL_SCANCODE_LCTRL;
constexpr SDL_Scancode kCtrlRight = SDL_SCANCODE_RCTRL;
constexpr SDL_Scancode kTogglePanelsKey = SDL_SCANCODE_H;
constexpr SDL_Scancode kToggleOverlayKey = SDL_SCANCODE_F1;

constexpr SDL_GamepadAxis kMoveAxisX = SDL_GAMEPAD_AXIS_LEFTX;
constexpr SDL_GamepadButton kDpadLeftButton = SDL_GAMEPAD_BUTTON_DPAD_LEFT;
constexpr SDL_GamepadButton kDpadRightButton = SDL_GAMEPAD_BUTTON_DPAD_RIGHT;
constexpr SDL_GamepadButton kDpadUpButton = SDL_GAMEPAD_BUTTON_DPAD_UP;
constexpr SDL_GamepadButton kDpadDownButton = SDL_GAMEPAD_BUTTON_DPAD_DOWN;
constexpr SDL_GamepadButton kJumpButton = SDL_GAMEPAD_BUTTON_SOUTH;
constexpr SDL_GamepadButton kBackButton = SDL_GAMEPAD_BUTTON_EAST;
constexpr SDL_GamepadButton kStartButton = SDL_GAMEPAD_BUTTON_START;

// Upward finger travel that counts as a jump swipe.
constexpr float kJumpSwipeThresholdPx = 50.0F;

const char* prettyScancode(SDL_Scancode sc) {
  switch (sc) {
    case SDL_SCANCODE_LEFT:
      return "←";
    case SDL_SCANCODE_RIGHT:
      return "→";
    case SDL_SCANCODE_UP:
      return "↑";
    case SDL_SCANCODE_DOWN:
      return "↓";
    default:
      break;
  }

  const char* name = SDL_GetScancodeName(sc);
  if (!name || !*name)
    return "?";
  return name;
}

}  // namespace

void Input::clearGamepadState() {
  axisLeftX_ = 0;
  dpadLeft_ = false;
  dpadRight_ = false;
  dpadUp_ = false;
  dpadDown_ = false;
  btnSouth_ = false;
  btnEast_ = false;
  btnStart_ = false;
}

void Input::tryOpenFirstGamepad() {
  if (gamepad_)
    return;

  int count = 0;
  using GamepadListPtr = std::unique_ptr<SDL_JoystickID, decltype(&SDL_free)>;
  GamepadListPtr ids(SDL_GetGamepads(&count), SDL_free);
  if (!ids || count <= 0) {
    return;
  }

  for (int i = 0; i < count; ++i) {
    SDL_Gamepad* gp = SDL_OpenGamepad(ids.get()[i]);
    if (!gp)
      continue;
    gamepad_ = gp;
    gamepadId_ = ids.get()[i];
    break;
  }
}

void Input::init() {
  SDL_SetGamepadEventsEnabled(true);
  tryOpenFirstGamepad();
}

void Input::shutdown() {
  if (gamepad_) {
    SDL_CloseGamepad(gamepad_);
    gamepad_ = nullptr;
  }
  gamepadId_ = 0;
  clearGamepadState();
}

void Input::handleTouch(const SDL_Event& e) {
  if (!touchEnabled_)
    return;

  const SDL_FingerID id = e.tfinger.fingerID;
  if (e.type == SDL_EVENT_FINGER_DOWN) {
    touches_[id] = TouchState{e.tfinger.x < 0.5F, e.tfinger.y, true};
  } else if (e.type == SDL_EVENT_FINGER_MOTION) {
    auto it = touches_.find(id);
    if (it != touches_.end() && it->second.swipeArmed) {
      const float travelPx = (it->second.startY - e.tfinger.y) * static_cast<float>(viewportHeight_);
      if (travelPx > kJumpSwipeThresholdPx) {
        touchJump_ = true;
        it->second.swipeArmed = false;
      }
    }
  } else {
    touches_.erase(id);
  }

  touchLeft_ = false;
  touchRight_ = false;
  for (const auto& [fid, t] : touches_) {
    (void)fid;
    if (t.left)
      touchLeft_ = true;
    else
      touchRight_ = true;
  }
  updateDerivedActions();
}

// NOLINTNEXTLINE
void Input::handleEvent(const SDL_Event& e) {
  if (e.type == SDL_EVENT_GAMEPAD_ADDED) {
    if (!gamepad_) {
      SDL_Gamepad* gp = SDL_OpenGamepad(e.gdevice.which);
      if (gp) {
        gamepad_ = gp;
        gamepadId_ = e.gdevice.which;
      }
    }
    return;
  }
  if (e.type == SDL_EVENT_GAMEPAD_REMOVED) {
    if (gamepad_ && e.gdevice.which == gamepadId_) {
      SDL_CloseGamepad(gamepad_);
      gamepad_ = nullptr;
      gamepadId_ = 0;
      clearGamepadState();
      tryOpenFirstGamepad();
      updateDerivedActions();
    }
    return;
  }
  if (e.type == SDL_EVENT_GAMEPAD_AXIS_MOTION) {
    if (gamepad_ && e.gaxis.which == gamepadId_) {
      if (e.gaxis.axis == kMoveAxisX)
        axisLeftX_ = static_cast<int>(e.gaxis.value);
      updateDerivedActions();
    }
    return;
  }
  if (e.type == SDL_EVENT_GAMEPAD_BUTTON_DOWN || e.type == SDL_EVENT_GAMEPAD_BUTTON_UP) {
    if (gamepad_ && e.gbutton.which == gamepadId_) {
      const bool down = e.gbutton.down;
      switch (e.gbutton.button) {
        case kDpadLeftButton:
          dpadLeft_ = down;
          break;
        case kDpadRightButton:
          dpadRight_ = down;
          break;
        case kDpadUpButton:
          dpadUp_ = down;
          break;
        case kDpadDownButton:
          dpadDown_ = down;
          break;
        case kJumpButton:
          btnSouth_ = down;
          break;
        case kBackButton:
          btnEast_ = down;
          break;
        case kStartButton:
          btnStart_ = down;
          break;
        default:
          break;
      }
      updateDerivedActions();
    }
    return;
  }
  if (e.type == SDL_EVENT_FINGER_DOWN || e.type == SDL_EVENT_FINGER_MOTION ||
      e.type == SDL_EVENT_FINGER_UP || e.type == SDL_EVENT_FINGER_CANCELED) {
    handleTouch(e);
    return;
  }

  if (e.type != SDL_EVENT_KEY_DOWN && e.type != SDL_EVENT_KEY_UP)
    return;

  const int sc = static_cast<int>(e.key.scancode);
  if (sc < 0 || sc >= static_cast<int>(scancodeDown_.size()))
    return;

  scancodeDown_[sc] = e.key.down;
  updateDerivedActions();
}

void Input::setGamepadDeadzone(int deadzone) {
  if (deadzone < 0)
    deadzone = 0;
  if (deadzone > 32767)
    deadzone = 32767;
  axisDeadzone_ = deadzone;
  updateDerivedActions();
}

void Input::setTouchEnabled(bool enabled) {
  if (touchEnabled_ == enabled)
    return;
  touchEnabled_ = enabled;
  if (!enabled) {
    touches_.clear();
    touchLeft_ = false;
    touchRight_ = false;
    touchJump_ = false;
    updateDerivedActions();
  }
}

const char* Input::gamepadName() const {
  if (!gamepad_)
    return nullptr;
  const char* name = SDL_GetGamepadName(gamepad_);
  if (!name || !*name)
    return nullptr;
  return name;
}

void Input::appendLegend(std::vector<std::string>& out) const {
  out.push_back(std::string("Move: ") + prettyScancode(kMoveLeftPrimary) + "/" +
                prettyScancode(kMoveRightPrimary) + " or " + prettyScancode(kMoveLeftAlt) + "/" +
                prettyScancode(kMoveRightAlt) + "  (pad: D-pad / left stick, touch: hold a side)");
  out.push_back(std::string("Jump: ") + prettyScancode(kJumpPrimary) + ", " +
                prettyScancode(kJumpAlt) + " or " + prettyScancode(kJumpSpace) +
                "  (pad: South, touch: swipe up)");
  out.push_back(std::string("Skills: ") + prettyScancode(kSlotKeys[0]) + "-" +
                prettyScancode(kSlotKeys[2]) + "  Confirm: " + prettyScancode(kConfirmKey) +
                "  Back: " + prettyScancode(kBackKey));
  if (const char* gpName = gamepadName())
    out.push_back(std::string("Gamepad: ") + gpName);

  out.push_back(std::string("High scores: ") + prettyScancode(kHighScoresKey) +
                "  Characters: " + prettyScancode(kCharactersKey));
  out.push_back(std::string("UI: Ctrl-") + prettyScancode(kTogglePanelsKey) +
                " hide/show  Overlay: " + prettyScancode(kToggleOverlayKey) + "  Quit: Ctrl-" +
                prettyScancode(kCharactersKey));
}

void Input::consumeJump() {
  touchJump_ = false;
  updateDerivedActions();
}

void Input::resetGameInput() {
  scancodeDown_.fill(false);
  touches_.clear();
  touchLeft_ = false;
  touchRight_ = false;
  touchJump_ = false;
  axisLeftX_ = 0;
  updateDerivedActions();
}

AppCommands Input::consumeCommands() {
  AppCommands out = commands_;
  commands_ = AppCommands{};
  return out;
}

void Input::pressEdge(bool now, bool& held, bool& command) {
  if (now && !held)
    command = true;
  held = now;
}

// NOLINTNEXTLINE
void Input::updateDerivedActions() {
  const bool leftKey = scancodeDown_[kMoveLeftPrimary] || scancodeDown_[kMoveLeftAlt];
  const bool rightKey = scancodeDown_[kMoveRightPrimary] || scancodeDown_[kMoveRightAlt];

  const bool leftPad = dpadLeft_ || (axisLeftX_ < -axisDeadzone_);
  const bool rightPad = dpadRight_ || (axisLeftX_ > axisDeadzone_);

  intent_.movingLeft = leftKey || leftPad || touchLeft_;
  intent_.movingRight = rightKey || rightPad || touchRight_;

  const bool jumpKey =
      scancodeDown_[kJumpPrimary] || scancodeDown_[kJumpAlt] || scancodeDown_[kJumpSpace];
  intent_.tryingToJump = jumpKey || btnSouth_ || touchJump_;

  const bool ctrlHeld = scancodeDown_[kCtrlLeft] || scancodeDown_[kCtrlRight];

  pressEdge(scancodeDown_[kConfirmKey] || scancodeDown_[kConfirmPadKey] || btnSouth_ || btnStart_,
            confirmHeld_, commands_.confirm);
  pressEdge(scancodeDown_[kBackKey] || btnEast_, backHeld_, commands_.back);
  pressEdge(scancodeDown_[kJumpPrimary] || dpadUp_, upHeld_, commands_.menuUp);
  pressEdge(scancodeDown_[kDownPrimary] || scancodeDown_[kDownAlt] || dpadDown_, downHeld_,
            commands_.menuDown);
  pressEdge(leftKey || dpadLeft_, leftHeld_, commands_.menuLeft);
  pressEdge(rightKey || dpadRight_, rightHeld_, commands_.menuRight);
  pressEdge(scancodeDown_[kHighScoresKey], tabHeld_, commands_.showHighScores);
  pressEdge(scancodeDown_[kToggleOverlayKey], f1Held_, commands_.toggleDebugOverlay);

  for (std::size_t i = 0; i < kSlotKeys.size(); ++i) {
    const bool now = scancodeDown_[kSlotKeys[i]];
    if (now && !digitHeld_[i])
      commands_.pickSlot = static_cast<int>(i);
    digitHeld_[i] = now;
  }

  const bool cNow = scancodeDown_[kCharactersKey];
  if (cNow && !cHeld_) {
    if (ctrlHeld)
      commands_.quit = true;  // Ctrl-C
    else
      commands_.showCharacters = true;
  }
  cHeld_ = cNow;

  const bool hNow = scancodeDown_[kTogglePanelsKey];
  if (hNow && !hHeld_ && ctrlHeld)
    commands_.togglePanels = true;  // Ctrl-H
  hHeld_ = hNow;
}
