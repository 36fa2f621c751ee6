#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

#include "nutfall/Collaborators.h"

// One-shot menu actions a script can fire on its keyframe.
struct ScriptActions {
  bool start = false;
  int pickSlot = -1;
};

// Frame-indexed input replay for headless runs. Keyframes set held movement
// and jump state that persists until a later keyframe changes it.
class InputScript : public nutfall::IntentSource {
 public:
  bool loadFromToml(const char* path);
  void reset();
  // Applies every keyframe up to and including frame.
  ScriptActions advance(uint64_t frame);

  [[nodiscard]] nutfall::MoveIntent intent() const override { return intent_; }
  // Scripted jump behaves like a held key: it stays set until a keyframe clears it.
  void consumeJump() override {}

  [[nodiscard]] bool loaded() const { return loaded_; }
  [[nodiscard]] const std::string& path() const { return path_; }
  [[nodiscard]] std::size_t keyframeCount() const { return keyframes_.size(); }

 private:
  enum MaskBits : uint32_t {
    kLeft = 1U << 0U,
    kRight = 1U << 1U,
    kJump = 1U << 2U,
  };

  struct Keyframe {
    uint64_t frame = 0;
    uint32_t mask = 0;
    nutfall::MoveIntent values{};
    ScriptActions actions{};
  };

  bool appendFromToml(const std::filesystem::path& path, std::unordered_set<std::string>& seen);

  std::vector<Keyframe> keyframes_;
  nutfall::MoveIntent intent_{};
  std::size_t nextIndex_ = 0;
  uint64_t lastFrame_ = 0;
  bool hasLastFrame_ = false;
  bool loaded_ = false;
  std::string path_;
};
