#pragma once

#include <cstdint>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "colonia/core/entities.h"

namespace colonia {

// Authoritative state of one game session.
//
// Entities are stored in per-kind maps; `kinds` indexes every live id so
// generic code (registry, projection, integrity) can dispatch on kind without
// probing each map.
struct GameState {
  int save_version{1};

  Id next_id{1};

  // Ids that were disposed. Never reallocated.
  std::unordered_set<Id> disposed;

  std::unordered_map<Id, EntityKind> kinds;

  GameInfo game;
  std::unordered_map<Id, Player> players;
  std::unordered_map<Id, Tile> tiles;
  std::unordered_map<Id, Unit> units;
  std::unordered_map<Id, Settlement> settlements;
  std::unordered_map<Id, Building> buildings;
  std::unordered_map<Id, Wish> wishes;
  std::unordered_map<Id, Mission> missions;

  // Fixed join order. Dead players stay listed; the turn engine skips them.
  std::vector<Id> player_order;

  int map_width{0};
  int map_height{0};
  // Row-major tile ids, map_width * map_height entries.
  std::vector<Id> tile_grid;

  // Combat RNG state. Persisted so that a reloaded game replays identically.
  std::uint64_t rng_state{1};

  std::uint64_t next_history_seq{1};
  std::vector<HistoryEvent> history;
};

template <typename Map>
auto* find_ptr(Map& m, const typename Map::key_type& k) {
  auto it = m.find(k);
  if (it == m.end()) return static_cast<decltype(&it->second)>(nullptr);
  return &it->second;
}

template <typename Map>
const auto* find_ptr(const Map& m, const typename Map::key_type& k) {
  auto it = m.find(k);
  if (it == m.end()) return static_cast<const decltype(&it->second)>(nullptr);
  return &it->second;
}

// Tile at map coordinates, or kInvalidId when out of bounds.
Id tile_id_at(const GameState& s, int x, int y);

// Chebyshev distance between two tiles. Large value if either is missing.
int tile_distance(const GameState& s, Id a, Id b);

// Live (non-dead) player check. Unknown ids are not live.
bool is_live_player(const GameState& s, Id player_id);

std::vector<Id> live_players_in_order(const GameState& s);

} // namespace colonia
