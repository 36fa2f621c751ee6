#pragma once

#include <string>

#include "nutfall/components/NutfallComponents.h"

class World;

namespace nutfall {

class Rng;
struct PlayerContext;

namespace NutfallSystems {

// Event entered in the given month, or None when the month is not the last
// month of a season block. Summer of every third year from year 2 brings a
// meteor shower instead of the thunderstorm.
[[nodiscard]] WeatherEvent eventForMonth(int monthCounter);
[[nodiscard]] bool isMeteorYear(int year);

// "<EVENT> INCOMING" during the last seconds of the month before an event,
// empty otherwise.
[[nodiscard]] std::string incomingEventTitle(int monthCounter, float timeInMonth);
[[nodiscard]] const char* eventTitle(WeatherEvent e);

void enterEvent(World& w,
                Rng& rng,
                EventState& events,
                int monthCounter,
                float gameWidth,
                FrameReport& report);

// Ends the running event and drops everything it left behind.
void clearEvent(World& w, EventState& events);

// Per-tick event behaviour: schedules lightning, shakes the screen, emits
// weather particles.
void updateEvent(World& w,
                 Rng& rng,
                 EventState& events,
                 float gameWidth,
                 double nowMs,
                 float dt,
                 FrameReport& report);

void addBurningPatch(World& w, float x, float width);

void resolveLightning(World& w, Rng& rng, PlayerContext& ctx, double nowMs, FrameReport& report);

void resolveBurningPatches(World& w,
                           Rng& rng,
                           PlayerContext& ctx,
                           EventState& events,
                           double nowMs,
                           float dt,
                           FrameReport& report);

}  // namespace NutfallSystems

}  // namespace nutfall
