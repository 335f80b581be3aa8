#include "colonia/core/scenario.h"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#include "colonia/core/registry.h"
#include "colonia/core/visibility.h"
#include "colonia/util/hash_rng.h"
#include "colonia/util/strings.h"

namespace colonia {
namespace {

const char* const kNations[] = {"Dutch", "English", "French", "Spanish", "Portuguese", "Swedish", "Danish", "Russian"};
constexpr int kMaxPlayers = 8;

const char* const kLandTerrains[] = {"plains", "grassland", "forest", "hills"};
constexpr const char* kWaterTerrain = "ocean";

std::uint64_t tile_hash(std::uint64_t seed, int x, int y) {
  std::uint64_t h = util::splitmix64(seed);
  h = util::splitmix64(h ^ static_cast<std::uint64_t>(x));
  h = util::splitmix64(h ^ (static_cast<std::uint64_t>(y) << 32));
  return h;
}

std::string pick_terrain(const ScenarioConfig& sc, int x, int y) {
  if (x == 0 || y == 0 || x == sc.width - 1 || y == sc.height - 1) return kWaterTerrain;
  const std::uint64_t h = tile_hash(sc.seed, x, y);
  if (static_cast<int>(h % 100) < sc.water_percent) return kWaterTerrain;
  return kLandTerrains[(h >> 8) % 4];
}

// Nearest land tile to (x, y), searched in growing rings.
Id nearest_land(const GameState& s, const Rules& rules, int x, int y) {
  const int max_r = std::max(s.map_width, s.map_height);
  for (int r = 0; r <= max_r; ++r) {
    for (int dy = -r; dy <= r; ++dy) {
      for (int dx = -r; dx <= r; ++dx) {
        if (std::max(std::abs(dx), std::abs(dy)) != r) continue;
        const Id tid = tile_id_at(s, x + dx, y + dy);
        if (tid == kInvalidId) continue;
        const Tile& t = s.tiles.at(tid);
        if (!rules.is_water(t.terrain)) return tid;
      }
    }
  }
  return kInvalidId;
}

} // namespace

GameState make_scenario(const ScenarioConfig& sc, const Rules& rules, const GameConfig& cfg) {
  if (sc.width < 5 || sc.height < 5) {
    throw std::invalid_argument(concat("scenario: map must be at least 5x5, got ", sc.width, "x", sc.height));
  }
  if (sc.players < 1 || sc.players > kMaxPlayers) {
    throw std::invalid_argument(concat("scenario: players must be 1..", kMaxPlayers, ", got ", sc.players));
  }
  if (sc.humans < 0 || sc.humans > sc.players) {
    throw std::invalid_argument(concat("scenario: humans must be 0..", sc.players, ", got ", sc.humans));
  }
  if (!rules.find_terrain(kWaterTerrain)) throw std::runtime_error("scenario: rules lack terrain 'ocean'");
  for (const char* t : kLandTerrains) {
    if (!rules.find_terrain(t)) throw std::runtime_error(concat("scenario: rules lack terrain '", t, "'"));
  }
  const UnitTypeDef* colonist = rules.find_unit_type("free_colonist");
  const UnitTypeDef* soldier = rules.find_unit_type("soldier");
  if (!colonist || !soldier) throw std::runtime_error("scenario: rules lack free_colonist or soldier");

  GameState s;
  s.map_width = sc.width;
  s.map_height = sc.height;
  s.tile_grid.assign(static_cast<std::size_t>(sc.width) * static_cast<std::size_t>(sc.height), kInvalidId);
  s.rng_state = cfg.combat_seed;

  EntityRegistry registry(s);
  registry.register_game(GameInfo{});

  // --- Players ---
  std::vector<Id> colonials;
  for (int i = 0; i < sc.players; ++i) {
    Player p;
    p.nation = kNations[i];
    p.name = concat(p.nation, " colonies");
    p.control = i < sc.humans ? PlayerControl::Human : PlayerControl::AI;
    p.gold = sc.starting_gold;
    colonials.push_back(registry.register_player(std::move(p)));
  }
  if (sc.with_ref) {
    Player ref;
    ref.nation = "Crown";
    ref.name = "Royal Expeditionary Force";
    ref.control = PlayerControl::AI;
    ref.is_ref = true;
    registry.register_player(std::move(ref));
  }

  // --- Map ---
  for (int y = 0; y < sc.height; ++y) {
    for (int x = 0; x < sc.width; ++x) {
      Tile t;
      t.x = x;
      t.y = y;
      t.terrain = pick_terrain(sc, x, y);
      registry.register_tile(std::move(t));
    }
  }

  // --- Starting units ---
  // Landfalls are spread evenly along the map, alternating between the upper
  // and lower thirds.
  for (std::size_t i = 0; i < colonials.size(); ++i) {
    const int n = static_cast<int>(colonials.size());
    const int x = 1 + static_cast<int>((static_cast<long long>(sc.width - 2) * (2 * static_cast<int>(i) + 1)) / (2 * n));
    const int y = (i % 2 == 0) ? sc.height / 3 : (2 * sc.height) / 3;
    const Id start = nearest_land(s, rules, x, y);
    if (start == kInvalidId) throw std::runtime_error("scenario: map has no land");

    const Id pid = colonials[i];
    for (const UnitTypeDef* type : {colonist, soldier}) {
      Unit u;
      u.type_id = type->id;
      u.owner_id = pid;
      u.location_id = start;
      u.moves_left = type->moves;
      registry.register_unit(std::move(u));
    }
    explore_from(s, pid, start, std::max(colonist->line_of_sight, soldier->line_of_sight));
  }

  s.game.current_player_id = colonials.front();
  return s;
}

} // namespace colonia
