#include <kartsim/script.hpp>
#include <kartsim/math.hpp>

namespace kartsim {

KartInput scripted_input(KartId id, std::uint64_t tick) {
  const std::uint64_t phase = (tick + std::uint64_t(id) * 37u) % kScriptPeriodTicks;
  const double side = (id % 2 == 0) ? 1.0 : -1.0;

  KartInput in;
  in.throttle = 1.0;
  if (phase < 120) {
    in.steering = 0.25 * detmath::sin(double(phase) * kTAU / 120.0);
  } else if (phase < 300) {
    in.steering = 0.8 * side;
    in.drift_pressed = (phase == 120);
    in.drift_held = true;
  } else {
    in.drift_pressed = (phase == 300);
  }
  return in;
}

} // namespace kartsim
