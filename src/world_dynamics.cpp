#include "lsim/world_dynamics.hpp"

#include <algorithm>

#include "lsim/errors.hpp"

namespace lsim {

uint64_t WorldDynamics::splitmix64(uint64_t& x) noexcept {
  uint64_t z = (x += 0x9e3779b97f4a7c15ull);
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ull;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebull;
  return z ^ (z >> 31);
}

WorldDynamics::WorldDynamics(DynamicsConfig cfg) : cfg_(std::move(cfg)) {
  if (cfg_.weather_kinds.empty()) throw ConfigError("weather_kinds must not be empty");
  if (cfg_.hours_per_day < 1) throw ConfigError("hours_per_day must be >= 1");
  if (cfg_.change_probability < 0.0 || cfg_.change_probability > 1.0) {
    throw ConfigError("change_probability must be within [0,1]");
  }
}

DynamicsState WorldDynamics::initial_state() const {
  DynamicsState st{};
  st.weather = cfg_.weather_kinds.front();
  st.rng_state = cfg_.seed ^ 0x9E3779B97F4A7C15ULL;
  return st;
}

std::vector<Event> WorldDynamics::step(DynamicsState& st, Tick tick) const {
  std::vector<Event> out;

  // Top 53 bits -> uniform double in [0,1).
  const double u = static_cast<double>(splitmix64(st.rng_state) >> 11) * 0x1.0p-53;
  const uint64_t pick = splitmix64(st.rng_state);

  if (cfg_.weather_kinds.size() > 1 && u < cfg_.change_probability) {
    const auto& kinds = cfg_.weather_kinds;
    const auto cur = std::find(kinds.begin(), kinds.end(), st.weather);
    const std::size_t cur_idx = cur == kinds.end() ? 0 : static_cast<std::size_t>(cur - kinds.begin());

    // Any kind except the current one.
    std::size_t next = static_cast<std::size_t>(pick % (kinds.size() - 1));
    if (next >= cur_idx) ++next;

    WeatherChanged ev{};
    ev.old_weather = st.weather;
    ev.new_weather = kinds[next];
    st.weather = kinds[next];
    out.emplace_back(std::move(ev));
  }

  if (++st.hour >= cfg_.hours_per_day) {
    st.hour = 0;
    ++st.day;
  }
  out.emplace_back(TimeAdvanced{tick, st.day, st.hour});
  return out;
}

} // namespace lsim
