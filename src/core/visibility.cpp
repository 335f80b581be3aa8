#include "colonia/core/visibility.h"

#include <algorithm>

namespace colonia {

const char* visibility_name(Visibility v) {
  switch (v) {
    case Visibility::None: return "none";
    case Visibility::Summary: return "summary";
    case Visibility::Full: return "full";
  }
  return "none";
}

int sight_radius(const EntityRegistry& registry, const Rules& rules, const GameConfig& cfg, Id id) {
  if (const Unit* u = registry.unit(id)) {
    const UnitTypeDef* def = rules.find_unit_type(u->type_id);
    return def ? std::max(0, def->line_of_sight) : 1;
  }
  if (registry.settlement(id)) return std::max(0, cfg.settlement_line_of_sight);
  return 0;
}

KnowledgeView compute_knowledge(const EntityRegistry& registry, const Rules& rules, const GameConfig& cfg,
                                Id player) {
  KnowledgeView view;
  view.player = player;
  const GameState& s = registry.state();

  const Player* p = registry.player(player);
  if (!p) return view;
  view.explored.insert(p->explored_tiles.begin(), p->explored_tiles.end());

  auto add_sight = [&](Id source) {
    const Id center = registry.tile_of(source);
    if (center == kInvalidId) return;
    for (Id t : tiles_within(s, center, sight_radius(registry, rules, cfg, source))) view.in_sight.insert(t);
  };
  for (const auto& [uid, u] : s.units) {
    if (u.owner_id == player) add_sight(uid);
  }
  for (const auto& [sid, st] : s.settlements) {
    if (st.owner_id == player) add_sight(sid);
  }
  return view;
}

const KnowledgeView& VisibilityOracle::knowledge(Id observer) const {
  auto it = cache_.find(observer);
  if (it != cache_.end()) return it->second;
  return cache_.emplace(observer, compute_knowledge(registry_, rules_, cfg_, observer)).first->second;
}

Visibility VisibilityOracle::visible(Id observer, const EntityRef& subject, const See& see) const {
  Visibility best = Visibility::None;
  auto raise = [&best](Visibility v) {
    if (v > best) best = v;
  };

  const bool is_owner = subject.owner_id != kInvalidId && subject.owner_id == observer;

  if (see.names(observer)) return Visibility::Full;
  if (see.includes_all()) raise(is_owner ? Visibility::Full : Visibility::Summary);
  if (see.includes_owner() && is_owner) raise(Visibility::Full);
  if (see.includes_perceived()) {
    if (subject.tile_id != kInvalidId) {
      const KnowledgeView& k = knowledge(observer);
      if (k.in_sight.count(subject.tile_id)) {
        raise(Visibility::Full);
      } else if (k.explored.count(subject.tile_id)) {
        raise(Visibility::Summary);
      }
    }
    // Ownership overrides staleness.
    if (is_owner) raise(Visibility::Summary);
  }
  return best;
}

bool VisibilityOracle::receives_message(Id observer, const See& see) const {
  return see.includes_all() || see.names(observer);
}

std::vector<Id> tiles_within(const GameState& s, Id center, int radius) {
  std::vector<Id> out;
  const Tile* c = find_ptr(s.tiles, center);
  if (!c || radius < 0) return out;
  for (int y = c->y - radius; y <= c->y + radius; ++y) {
    for (int x = c->x - radius; x <= c->x + radius; ++x) {
      const Id t = tile_id_at(s, x, y);
      if (t != kInvalidId) out.push_back(t);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

bool has_explored(const Player& p, Id tile_id) {
  return std::binary_search(p.explored_tiles.begin(), p.explored_tiles.end(), tile_id);
}

std::vector<Id> explore_from(GameState& s, Id player_id, Id center, int radius) {
  std::vector<Id> fresh;
  Player* p = find_ptr(s.players, player_id);
  if (!p) return fresh;
  for (Id t : tiles_within(s, center, radius)) {
    auto it = std::lower_bound(p->explored_tiles.begin(), p->explored_tiles.end(), t);
    if (it != p->explored_tiles.end() && *it == t) continue;
    p->explored_tiles.insert(it, t);
    fresh.push_back(t);
  }
  return fresh;
}

} // namespace colonia
