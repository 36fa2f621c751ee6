#pragma once

#include <vector>

#include "nutfall/config/SkillCatalog.h"

class World;

namespace nutfall {

class Rng;
struct PlayerContext;

inline constexpr int kSkillOfferCount = 3;

namespace NutfallSystems {

// Pool offered when the given month ends. The last month of a season block
// offers event skills, or yearly skills when it also closes the year.
[[nodiscard]] SkillPool poolForEndedMonth(int monthCounter);
// Pool used when a debug start fast-forwards over month i.
[[nodiscard]] SkillPool poolForSkippedMonth(int month);

// Up to kSkillOfferCount distinct skills from the pool.
[[nodiscard]] std::vector<SkillId> rollSkillOffers(Rng& rng, SkillPool pool);

// Standing still on the ground with the shell on heals photosynthesisLevel HP
// every full second.
void tickPhotosynthesis(World& w, PlayerContext& ctx, float dt, FrameReport& report);

}  // namespace NutfallSystems

}  // namespace nutfall
