#pragma once

#include <array>
#include <cstdint>

#include "nutfall/Collaborators.h"

// Sound sink for builds without an audio backend. Counts every cue and
// optionally echoes it to stdout for headless runs.
class SoundLog : public nutfall::SoundPlayer {
 public:
  void setEcho(bool echo) { echo_ = echo; }
  void setFrame(uint64_t frame) { frame_ = frame; }

  void play(nutfall::SoundCue cue) override;

  [[nodiscard]] int count(nutfall::SoundCue cue) const;
  void printSummary() const;

 private:
  static constexpr std::size_t kCueCount =
      static_cast<std::size_t>(nutfall::SoundCue::PhotosynthesisHeal) + 1;

  std::array<int, kCueCount> counts_{};
  uint64_t frame_ = 0;
  bool echo_ = false;
};
