#pragma once

#include <cstddef>
#include <cstdint>
#include <random>

namespace nutfall {

// Every random draw in the simulation goes through one seeded engine so a run
// replays exactly from (seed, input script).
class Rng {
 public:
  explicit Rng(std::uint32_t seed = 5489U) : engine_(seed) {}

  void reseed(std::uint32_t seed) { engine_.seed(seed); }

  // [0, 1)
  float uniform() {
    std::uniform_real_distribution<float> dist(0.0F, 1.0F);
    return dist(engine_);
  }

  // [lo, hi)
  float range(float lo, float hi) { return lo + (uniform() * (hi - lo)); }

  // Centered jitter in [-half, half)
  float spread(float half) { return (uniform() - 0.5F) * 2.0F * half; }

  bool chance(float p) { return p > 0.0F && uniform() < p; }

  std::size_t index(std::size_t count) {
    if (count == 0) {
      return 0;
    }
    std::uniform_int_distribution<std::size_t> dist(0, count - 1);
    return dist(engine_);
  }

  std::mt19937& engine() { return engine_; }

 private:
  std::mt19937 engine_;
};

}  // namespace nutfall
