#include "colonia/core/ai.h"

#include <algorithm>
#include <cstdlib>
#include <map>
#include <set>
#include <utility>

namespace colonia {
namespace {

struct KnownTile {
  Id id{kInvalidId};
  int x{0};
  int y{0};
  bool water{false};
  Id owner{kInvalidId};
  Id settlement{kInvalidId};
};

int chebyshev(const KnownTile& a, const KnownTile& b) { return std::max(std::abs(a.x - b.x), std::abs(a.y - b.y)); }

// The part of the mirror the explorer reasons about.
class MapView {
 public:
  MapView(const ClientMirror& view, const Rules& rules, Id player) : view_(view) {
    for (Id tid : view.ids_of_kind(EntityKind::Tile)) {
      KnownTile t;
      t.id = tid;
      t.x = static_cast<int>(view.int_field(tid, "x"));
      t.y = static_cast<int>(view.int_field(tid, "y"));
      t.water = rules.is_water(view.string_field(tid, "terrain"));
      t.owner = static_cast<Id>(view.int_field(tid, "owner_id"));
      t.settlement = static_cast<Id>(view.int_field(tid, "settlement_id"));
      by_pos_[{t.x, t.y}] = tid;
      tiles_[tid] = t;
    }
    for (Id uid : view.ids_of_kind(EntityKind::Unit)) {
      const Id owner = static_cast<Id>(view.int_field(uid, "owner_id"));
      if (owner == player) {
        own_units_.push_back(uid);
      } else if (const Id t = tile_of(uid); t != kInvalidId) {
        hostile_.insert(t);
      }
    }
    for (Id sid : view.ids_of_kind(EntityKind::Settlement)) {
      const Id owner = static_cast<Id>(view.int_field(sid, "owner_id"));
      if (owner == player) {
        own_settlements_ = true;
      } else if (const Id t = tile_of(sid); t != kInvalidId) {
        hostile_.insert(t);
      }
    }
  }

  const KnownTile* tile(Id id) const {
    auto it = tiles_.find(id);
    return it == tiles_.end() ? nullptr : &it->second;
  }

  const KnownTile* at(int x, int y) const {
    auto it = by_pos_.find({x, y});
    return it == by_pos_.end() ? nullptr : tile(it->second);
  }

  // Map tile of a unit or settlement, following carriers and settlements.
  Id tile_of(Id id) const {
    Id cur = id;
    for (int depth = 0; depth < 4; ++depth) {
      const MirrorEntity* e = view_.find(cur);
      if (!e) return kInvalidId;
      switch (e->kind) {
        case EntityKind::Tile: return cur;
        case EntityKind::Unit: cur = static_cast<Id>(view_.int_field(cur, "location_id")); break;
        case EntityKind::Settlement: cur = static_cast<Id>(view_.int_field(cur, "tile_id")); break;
        default: return kInvalidId;
      }
    }
    return kInvalidId;
  }

  bool near_settlement(const KnownTile& t) const {
    for (int dy = -1; dy <= 1; ++dy) {
      for (int dx = -1; dx <= 1; ++dx) {
        const KnownTile* n = at(t.x + dx, t.y + dy);
        if (n && n->settlement != kInvalidId) return true;
      }
    }
    return false;
  }

  // Known land tiles next to at least one unexplored position.
  std::vector<const KnownTile*> frontier() const {
    std::vector<const KnownTile*> out;
    for (const auto& [id, t] : tiles_) {
      if (t.water) continue;
      bool edge = false;
      for (int dy = -1; dy <= 1 && !edge; ++dy) {
        for (int dx = -1; dx <= 1 && !edge; ++dx) {
          if ((dx || dy) && !at(t.x + dx, t.y + dy)) edge = true;
        }
      }
      if (edge) out.push_back(&t);
    }
    return out;
  }

  bool passable(const KnownTile& t) const {
    if (t.water || hostile_.count(t.id)) return false;
    return true;
  }

  const std::vector<Id>& own_units() const { return own_units_; }
  bool has_own_settlement() const { return own_settlements_; }

 private:
  const ClientMirror& view_;
  std::map<std::pair<int, int>, Id> by_pos_;
  std::map<Id, KnownTile> tiles_;
  std::vector<Id> own_units_;
  std::set<Id> hostile_;
  bool own_settlements_{false};
};

ActionRequest make_request(Id player, const char* verb, json::Object params) {
  ActionRequest req;
  req.player = player;
  req.verb = verb;
  req.params = std::move(params);
  return req;
}

} // namespace

std::vector<ActionRequest> ExplorerAi::plan(const ClientMirror& view, Id player, const Deadline& deadline) {
  std::vector<ActionRequest> out;
  const MapView map(view, rules_, player);

  Id founder = kInvalidId;
  if (!map.has_own_settlement()) {
    for (Id uid : map.own_units()) {
      const UnitTypeDef* def = rules_.find_unit_type(view.string_field(uid, "type_id"));
      if (!def || !def->can_found_settlement) continue;
      const KnownTile* t = map.tile(static_cast<Id>(view.int_field(uid, "location_id")));
      if (!t || t->water || t->settlement != kInvalidId) continue;
      if (t->owner != kInvalidId && t->owner != player) continue;
      if (map.near_settlement(*t)) continue;

      json::Object params;
      params["unit"] = uid;
      params["name"] = view.string_field(player, "name", "Colony") + " Landing";
      out.push_back(make_request(player, "found_settlement", std::move(params)));
      founder = uid;
      break;
    }
  }

  const auto frontier = map.frontier();
  for (Id uid : map.own_units()) {
    if (deadline.expired()) break;
    if (uid == founder || view.int_field(uid, "moves_left") <= 0) continue;
    const UnitTypeDef* def = rules_.find_unit_type(view.string_field(uid, "type_id"));
    if (!def || def->naval) continue;

    const KnownTile* here = map.tile(map.tile_of(uid));
    if (!here) continue;

    const KnownTile* target = nullptr;
    for (const KnownTile* f : frontier) {
      if (f->id == here->id) continue;
      if (!target || chebyshev(*here, *f) < chebyshev(*here, *target) ||
          (chebyshev(*here, *f) == chebyshev(*here, *target) && f->id < target->id)) {
        target = f;
      }
    }
    if (!target) continue;

    const KnownTile* step = nullptr;
    for (int dy = -1; dy <= 1; ++dy) {
      for (int dx = -1; dx <= 1; ++dx) {
        if (!dx && !dy) continue;
        const KnownTile* n = map.at(here->x + dx, here->y + dy);
        if (!n || !map.passable(*n)) continue;
        if (chebyshev(*n, *target) >= chebyshev(*here, *target)) continue;
        if (!step || chebyshev(*n, *target) < chebyshev(*step, *target) ||
            (chebyshev(*n, *target) == chebyshev(*step, *target) && n->id < step->id)) {
          step = n;
        }
      }
    }
    if (!step) continue;

    json::Object params;
    params["unit"] = uid;
    params["tile"] = step->id;
    out.push_back(make_request(player, "move", std::move(params)));
  }
  return out;
}

} // namespace colonia
