#include "colonia/core/game_state.h"

#include <algorithm>
#include <cstdlib>
#include <limits>

namespace colonia {

Id tile_id_at(const GameState& s, int x, int y) {
  if (x < 0 || y < 0 || x >= s.map_width || y >= s.map_height) return kInvalidId;
  const std::size_t idx = static_cast<std::size_t>(y) * static_cast<std::size_t>(s.map_width) +
                          static_cast<std::size_t>(x);
  if (idx >= s.tile_grid.size()) return kInvalidId;
  return s.tile_grid[idx];
}

int tile_distance(const GameState& s, Id a, Id b) {
  const auto* ta = find_ptr(s.tiles, a);
  const auto* tb = find_ptr(s.tiles, b);
  if (!ta || !tb) return std::numeric_limits<int>::max();
  return std::max(std::abs(ta->x - tb->x), std::abs(ta->y - tb->y));
}

bool is_live_player(const GameState& s, Id player_id) {
  const auto* p = find_ptr(s.players, player_id);
  return p && !p->dead;
}

std::vector<Id> live_players_in_order(const GameState& s) {
  std::vector<Id> out;
  for (Id pid : s.player_order) {
    if (is_live_player(s, pid)) out.push_back(pid);
  }
  return out;
}

} // namespace colonia
