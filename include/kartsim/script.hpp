#pragma once
#include <cstdint>
#include <kartsim/events.hpp>
#include <kartsim/input.hpp>

namespace kartsim {

// Fixed demo input for karts without a driver: a gentle weave, then a held
// drift that is released for its boost. Pure function of (id, tick).
inline constexpr std::uint64_t kScriptPeriodTicks = 360;

KartInput scripted_input(KartId id, std::uint64_t tick);

} // namespace kartsim
