#include "core/SoundLog.h"

#include <cstdio>

void SoundLog::play(nutfall::SoundCue cue) {
  const auto index = static_cast<std::size_t>(cue);
  if (index < counts_.size())
    ++counts_[index];
  if (echo_)
    std::printf("sound: frame=%llu cue=%s\n", static_cast<unsigned long long>(frame_),
                nutfall::soundCueName(cue));
}

int SoundLog::count(nutfall::SoundCue cue) const {
  const auto index = static_cast<std::size_t>(cue);
  return index < counts_.size() ? counts_[index] : 0;
}

void SoundLog::printSummary() const {
  for (std::size_t i = 0; i < counts_.size(); ++i) {
    if (counts_[i] == 0)
      continue;
    std::printf("sound: %s x%d\n", nutfall::soundCueName(static_cast<nutfall::SoundCue>(i)),
                counts_[i]);
  }
}
