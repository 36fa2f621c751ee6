#pragma once

#include "nutfall/components/NutfallComponents.h"

namespace nutfall {

struct MoveIntent {
  bool movingLeft = false;
  bool movingRight = false;
  bool tryingToJump = false;
};

// Keyboard, touch and gamepad folded into one signal. Jump stays latched until
// the simulation acknowledges it.
class IntentSource {
 public:
  virtual ~IntentSource() = default;
  [[nodiscard]] virtual MoveIntent intent() const = 0;
  virtual void consumeJump() = 0;
};

class SoundPlayer {
 public:
  virtual ~SoundPlayer() = default;
  virtual void play(SoundCue cue) = 0;
};

class AssetProvider {
 public:
  virtual ~AssetProvider() = default;
  [[nodiscard]] virtual bool ready() const = 0;
};

}  // namespace nutfall
