#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "lsim/events.hpp"
#include "lsim/world_state.hpp"

namespace lsim {

struct DynamicsConfig {
  uint64_t seed{1};
  std::vector<std::string> weather_kinds{"clear", "cloudy", "rain", "fog"};
  double change_probability{0.1};  // per tick
  int64_t hours_per_day{24};       // one tick = one simulated hour
};

// Ambient world step, driven only by the seed and the tick count. The RNG state
// lives in DynamicsState so a snapshot fully determines the next step.
class WorldDynamics {
public:
  explicit WorldDynamics(DynamicsConfig cfg);

  // Initial weather and RNG state.
  DynamicsState initial_state() const;

  // Advances the clock one hour and maybe changes the weather. Events:
  // WeatherChanged (if any) then TimeAdvanced.
  std::vector<Event> step(DynamicsState& st, Tick tick) const;

  const DynamicsConfig& config() const noexcept { return cfg_; }

private:
  DynamicsConfig cfg_{};

  static uint64_t splitmix64(uint64_t& x) noexcept;
};

} // namespace lsim
