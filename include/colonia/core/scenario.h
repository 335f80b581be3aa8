#pragma once

#include <cstdint>

#include "colonia/core/config.h"
#include "colonia/core/game_state.h"
#include "colonia/core/rules.h"

namespace colonia {

// Parameters for a generated map.
struct ScenarioConfig {
  int width{24};
  int height{16};

  // Colonial players, up to 8. The first `humans` are human-controlled, the
  // rest AI.
  int players{4};
  int humans{0};

  // Adds a royal expeditionary force player with no assets.
  bool with_ref{false};

  // Percentage of interior tiles that are water.
  int water_percent{10};

  int starting_gold{1000};

  std::uint64_t seed{42};
};

// Builds a fresh game: the game root first, then players, then a
// water-bordered map, then a colonist and a soldier for every colonial player
// at spread-out landfalls, with the area around them explored.
//
// Deterministic for a given config and rules. Throws std::invalid_argument
// for unusable dimensions or player counts, and std::runtime_error when the
// rules lack the terrains or unit types the generator places.
GameState make_scenario(const ScenarioConfig& sc, const Rules& rules, const GameConfig& cfg);

} // namespace colonia
