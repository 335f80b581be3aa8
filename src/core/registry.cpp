#include "colonia/core/registry.h"

#include <algorithm>

#include "colonia/core/change_set.h"
#include "colonia/core/errors.h"
#include "colonia/util/log.h"
#include "colonia/util/strings.h"

namespace colonia {
namespace {

// Containment is a tree of bounded depth (tile > settlement > carrier > unit >
// mission). Anything deeper means a cycle in corrupted data.
constexpr int kMaxContainmentDepth = 16;

} // namespace

Id EntityRegistry::allocate(EntityKind kind) {
  Id id = state_.next_id++;
  while (state_.kinds.count(id) || state_.disposed.count(id)) id = state_.next_id++;
  state_.kinds[id] = kind;
  return id;
}

Id EntityRegistry::register_game(GameInfo g) {
  g.id = allocate(EntityKind::Game);
  state_.game = g;
  return g.id;
}

Id EntityRegistry::register_player(Player p) {
  p.id = allocate(EntityKind::Player);
  p.join_index = static_cast<int>(state_.player_order.size());
  state_.player_order.push_back(p.id);
  const Id id = p.id;
  state_.players[id] = std::move(p);
  return id;
}

Id EntityRegistry::register_tile(Tile t) {
  t.id = allocate(EntityKind::Tile);
  if (t.x >= 0 && t.y >= 0 && t.x < state_.map_width && t.y < state_.map_height) {
    const std::size_t idx = static_cast<std::size_t>(t.y) * static_cast<std::size_t>(state_.map_width) +
                            static_cast<std::size_t>(t.x);
    if (state_.tile_grid.size() <= idx) state_.tile_grid.resize(idx + 1, kInvalidId);
    state_.tile_grid[idx] = t.id;
  }
  const Id id = t.id;
  state_.tiles[id] = std::move(t);
  return id;
}

Id EntityRegistry::register_unit(Unit u) {
  u.id = allocate(EntityKind::Unit);
  const Id id = u.id;
  state_.units[id] = std::move(u);
  return id;
}

Id EntityRegistry::register_settlement(Settlement s) {
  s.id = allocate(EntityKind::Settlement);
  const Id id = s.id;
  state_.settlements[id] = std::move(s);
  return id;
}

Id EntityRegistry::register_building(Building b) {
  b.id = allocate(EntityKind::Building);
  const Id id = b.id;
  state_.buildings[id] = std::move(b);
  return id;
}

Id EntityRegistry::register_wish(Wish w) {
  w.id = allocate(EntityKind::Wish);
  const Id id = w.id;
  state_.wishes[id] = std::move(w);
  return id;
}

Id EntityRegistry::register_mission(Mission m) {
  m.id = allocate(EntityKind::Mission);
  const Id id = m.id;
  state_.missions[id] = std::move(m);
  return id;
}

std::optional<EntityKind> EntityRegistry::kind_of(Id id) const {
  auto it = state_.kinds.find(id);
  if (it == state_.kinds.end()) return std::nullopt;
  return it->second;
}

Unit& EntityRegistry::expect_owned_unit(Id id, Id player_id) {
  Unit* u = unit(id);
  if (!u) throw NotFoundError(concat("unit ", id, " not found"));
  if (u->owner_id != player_id) throw OwnershipError(concat("unit ", id, " is not owned by player ", player_id));
  return *u;
}

Settlement& EntityRegistry::expect_owned_settlement(Id id, Id player_id) {
  Settlement* s = settlement(id);
  if (!s) throw NotFoundError(concat("settlement ", id, " not found"));
  if (s->owner_id != player_id) {
    throw OwnershipError(concat("settlement ", id, " is not owned by player ", player_id));
  }
  return *s;
}

Wish& EntityRegistry::expect_owned_wish(Id id, Id player_id) {
  Wish* w = wish(id);
  if (!w) throw NotFoundError(concat("wish ", id, " not found"));
  if (w->player_id != player_id) throw OwnershipError(concat("wish ", id, " is not owned by player ", player_id));
  return *w;
}

Tile& EntityRegistry::expect_tile(Id id) {
  Tile* t = tile(id);
  if (!t) throw NotFoundError(concat("tile ", id, " not found"));
  return *t;
}

Id EntityRegistry::container_of(Id id) const {
  const auto k = kind_of(id);
  if (!k) return kInvalidId;
  switch (*k) {
    case EntityKind::Game: return kInvalidId;
    case EntityKind::Player:
    case EntityKind::Tile: return state_.game.id;
    case EntityKind::Unit: return unit(id)->location_id;
    case EntityKind::Settlement: return settlement(id)->tile_id;
    case EntityKind::Building: return building(id)->settlement_id;
    case EntityKind::Wish: return wish(id)->player_id;
    case EntityKind::Mission: return mission(id)->unit_id;
  }
  return kInvalidId;
}

std::vector<Id> EntityRegistry::contents_of(Id id) const {
  std::vector<Id> out;
  const auto k = kind_of(id);
  if (!k) return out;

  switch (*k) {
    case EntityKind::Game:
      for (const auto& [pid, _] : state_.players) out.push_back(pid);
      for (const auto& [tid, _] : state_.tiles) out.push_back(tid);
      break;
    case EntityKind::Player:
      for (const auto& [wid, w] : state_.wishes) {
        if (w.player_id == id) out.push_back(wid);
      }
      break;
    case EntityKind::Tile:
      for (const auto& [sid, s] : state_.settlements) {
        if (s.tile_id == id) out.push_back(sid);
      }
      for (const auto& [uid, u] : state_.units) {
        if (u.location_id == id) out.push_back(uid);
      }
      break;
    case EntityKind::Unit:
      for (const auto& [uid, u] : state_.units) {
        if (u.location_id == id) out.push_back(uid);
      }
      for (const auto& [mid, m] : state_.missions) {
        if (m.unit_id == id) out.push_back(mid);
      }
      break;
    case EntityKind::Settlement:
      for (const auto& [bid, b] : state_.buildings) {
        if (b.settlement_id == id) out.push_back(bid);
      }
      for (const auto& [uid, u] : state_.units) {
        if (u.location_id == id) out.push_back(uid);
      }
      break;
    case EntityKind::Building:
    case EntityKind::Wish:
    case EntityKind::Mission:
      break;
  }
  std::sort(out.begin(), out.end());
  return out;
}

Id EntityRegistry::owner_of(Id id) const {
  Id cur = id;
  for (int depth = 0; depth < kMaxContainmentDepth; ++depth) {
    const auto k = kind_of(cur);
    if (!k) return kInvalidId;
    switch (*k) {
      case EntityKind::Game: return kInvalidId;
      case EntityKind::Player: return cur;
      case EntityKind::Tile: return tile(cur)->owner_id;
      case EntityKind::Unit: return unit(cur)->owner_id;
      case EntityKind::Settlement: return settlement(cur)->owner_id;
      case EntityKind::Wish: return wish(cur)->player_id;
      case EntityKind::Building: cur = building(cur)->settlement_id; break;
      case EntityKind::Mission: cur = mission(cur)->unit_id; break;
    }
  }
  return kInvalidId;
}

Id EntityRegistry::tile_of(Id id) const {
  Id cur = id;
  for (int depth = 0; depth < kMaxContainmentDepth; ++depth) {
    const auto k = kind_of(cur);
    if (!k) return kInvalidId;
    switch (*k) {
      case EntityKind::Game:
      case EntityKind::Player:
      case EntityKind::Wish: return kInvalidId;
      case EntityKind::Tile: return cur;
      case EntityKind::Unit: cur = unit(cur)->location_id; break;
      case EntityKind::Settlement: cur = settlement(cur)->tile_id; break;
      case EntityKind::Building: cur = building(cur)->settlement_id; break;
      case EntityKind::Mission: cur = mission(cur)->unit_id; break;
    }
  }
  return kInvalidId;
}

EntityRef EntityRegistry::ref(Id id) const {
  EntityRef r;
  r.id = id;
  if (const auto k = kind_of(id)) r.kind = *k;
  r.tile_id = tile_of(id);
  r.owner_id = owner_of(id);
  return r;
}

int EntityRegistry::dispose(Id id) {
  if (is_disposed(id)) return 0;
  const auto k = kind_of(id);
  if (!k) {
    log::warn(concat("dispose: unknown id ", id));
    return 0;
  }
  if (*k == EntityKind::Game) {
    log::error("dispose: refusing to dispose the game root");
    return 0;
  }

  const EntityRef r = ref(id);
  int count = 0;
  for (Id child : contents_of(id)) count += dispose(child);

  switch (*k) {
    case EntityKind::Game: break;
    case EntityKind::Player: state_.players.erase(id); break;
    case EntityKind::Tile: {
      auto& grid = state_.tile_grid;
      std::replace(grid.begin(), grid.end(), id, kInvalidId);
      state_.tiles.erase(id);
      break;
    }
    case EntityKind::Unit: state_.units.erase(id); break;
    case EntityKind::Settlement: {
      const Settlement& s = state_.settlements.at(id);
      if (Tile* t = tile(s.tile_id); t && t->settlement_id == id) {
        t->settlement_id = kInvalidId;
        if (active_) active_->append_partial(ref(t->id), {"settlement_id"}, ChangePriority::State, See::perceived());
      }
      state_.settlements.erase(id);
      break;
    }
    case EntityKind::Building: state_.buildings.erase(id); break;
    case EntityKind::Wish: state_.wishes.erase(id); break;
    case EntityKind::Mission: state_.missions.erase(id); break;
  }
  state_.kinds.erase(id);
  state_.disposed.insert(id);

  if (active_) {
    See see = default_see_for(r.kind);
    see.always(r.owner_id);
    active_->append(ChangeKind::Remove, r, ChangePriority::Remove, std::move(see));
  } else {
    log::warn(concat("dispose: ", entity_kind_name(r.kind), " ", id, " disposed outside an operation"));
  }
  return count + 1;
}

} // namespace colonia
