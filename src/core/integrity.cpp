#include "colonia/core/integrity.h"

#include <algorithm>

#include "colonia/util/log.h"
#include "colonia/util/strings.h"

namespace colonia {
namespace {

class Checker {
 public:
  Checker(EntityRegistry& registry, Id id, bool fix, std::vector<std::string>& problems, ChangeSet* changes)
      : reg_(registry), id_(id), fix_(fix), problems_(problems), changes_(changes) {}

  IntegrityStatus status() const { return status_; }

  void broken(const std::string& what) {
    report(what, "broken");
    status_ = IntegrityStatus::Broken;
  }

  // Returns true when the caller should apply the repair.
  bool repairable(const std::string& what) {
    if (!fix_) {
      broken(what);
      return false;
    }
    report(what, "repaired");
    if (status_ == IntegrityStatus::Ok) status_ = IntegrityStatus::Repaired;
    return true;
  }

  void record(std::vector<std::string> fields, See see) {
    if (changes_) changes_->append_partial(reg_.ref(id_), std::move(fields), ChangePriority::State, std::move(see));
  }

  bool is_kind(Id ref, EntityKind kind) const {
    const auto k = reg_.kind_of(ref);
    return k && *k == kind;
  }

 private:
  void report(const std::string& what, const char* outcome) {
    std::string line = concat(entity_kind_name(kind()), " ", id_, ": ", what, " (", outcome, ")");
    log::warn("integrity: " + line);
    problems_.push_back(std::move(line));
  }

  EntityKind kind() const { return reg_.kind_of(id_).value_or(EntityKind::Game); }

  EntityRegistry& reg_;
  Id id_;
  bool fix_;
  std::vector<std::string>& problems_;
  ChangeSet* changes_;
  IntegrityStatus status_{IntegrityStatus::Ok};
};

void check_game_root(EntityRegistry& reg, Checker& c) {
  GameState& s = reg.state();
  GameInfo& g = s.game;
  if (g.game_over) {
    if (g.winner_id != kInvalidId && !reg.player(g.winner_id)) c.broken(concat("winner ", g.winner_id, " is unknown"));
    return;
  }
  if (is_live_player(s, g.current_player_id)) return;

  const std::vector<Id> live = live_players_in_order(s);
  if (live.empty()) {
    c.broken("no live player to hand control to");
    return;
  }
  if (!c.repairable(concat("current player ", g.current_player_id, " is not a live player"))) return;

  // Next live player after the stale one in join order, wrapping.
  Id next = live.front();
  const auto& order = s.player_order;
  auto it = std::find(order.begin(), order.end(), g.current_player_id);
  if (it != order.end()) {
    for (auto j = it + 1; j != order.end(); ++j) {
      if (is_live_player(s, *j)) {
        next = *j;
        break;
      }
    }
  }
  g.current_player_id = next;
  c.record({"current_player_id"}, See::all());
}

void check_player(EntityRegistry& reg, Player& p, Checker& c) {
  const auto stale = std::count_if(p.explored_tiles.begin(), p.explored_tiles.end(),
                                   [&reg](Id t) { return reg.tile(t) == nullptr; });
  if (stale == 0) return;
  if (!c.repairable(concat(stale, " explored tiles do not exist"))) return;
  p.explored_tiles.erase(std::remove_if(p.explored_tiles.begin(), p.explored_tiles.end(),
                                        [&reg](Id t) { return reg.tile(t) == nullptr; }),
                         p.explored_tiles.end());
}

void check_tile(EntityRegistry& reg, Tile& t, Checker& c) {
  if (t.owner_id != kInvalidId && !reg.player(t.owner_id)) {
    if (c.repairable(concat("land claim by unknown player ", t.owner_id))) {
      t.owner_id = kInvalidId;
      c.record({"owner_id"}, See::perceived());
    }
  }

  Id derived = kInvalidId;
  for (const auto& [sid, st] : reg.state().settlements) {
    if (st.tile_id == t.id && (derived == kInvalidId || sid < derived)) derived = sid;
  }
  if (t.settlement_id != derived) {
    if (c.repairable(concat("cached settlement ", t.settlement_id, " should be ", derived))) {
      t.settlement_id = derived;
      c.record({"settlement_id"}, See::perceived());
    }
  }
}

void check_unit(EntityRegistry& reg, const Unit& u, Checker& c) {
  const Id loc = u.location_id;
  if (!c.is_kind(loc, EntityKind::Tile) && !c.is_kind(loc, EntityKind::Unit) &&
      !c.is_kind(loc, EntityKind::Settlement)) {
    c.broken(concat("location ", loc, " is not a tile, carrier or settlement"));
  }
  if (loc == u.id) c.broken("unit contains itself");
  if (!reg.player(u.owner_id)) c.broken(concat("owner ", u.owner_id, " is not a player"));
}

void check_settlement(EntityRegistry& reg, const Settlement& st, Checker& c) {
  if (!reg.tile(st.tile_id)) c.broken(concat("tile ", st.tile_id, " does not exist"));
  if (!reg.player(st.owner_id)) c.broken(concat("owner ", st.owner_id, " is not a player"));
}

void check_building(EntityRegistry& reg, const Building& b, Checker& c) {
  if (!reg.settlement(b.settlement_id)) c.broken(concat("settlement ", b.settlement_id, " does not exist"));
}

void check_wish(EntityRegistry& reg, Wish& w, Checker& c) {
  if (!reg.player(w.player_id)) c.broken(concat("player ", w.player_id, " does not exist"));

  // A wish without a destination has nothing left to mean.
  if (!c.is_kind(w.destination_id, EntityKind::Tile) && !c.is_kind(w.destination_id, EntityKind::Settlement)) {
    const char* why = reg.is_disposed(w.destination_id) ? "was disposed" : "does not exist";
    c.broken(concat("destination ", w.destination_id, " ", why));
  }

  if (w.transportable_id != kInvalidId && !reg.unit(w.transportable_id)) {
    if (c.repairable(concat("transportable ", w.transportable_id, " is gone"))) {
      w.transportable_id = kInvalidId;
      c.record({"transportable_id"}, See::only_owner());
    }
  }
}

void check_mission(EntityRegistry& reg, Mission& m, Checker& c) {
  if (!reg.unit(m.unit_id)) c.broken(concat("unit ", m.unit_id, " does not exist"));
  if (m.target_id != kInvalidId && !reg.exists(m.target_id)) {
    if (c.repairable(concat("target ", m.target_id, " is gone"))) {
      m.target_id = kInvalidId;
      c.record({"target_id"}, See::only_owner());
    }
  }
}

} // namespace

const char* integrity_status_name(IntegrityStatus s) {
  switch (s) {
    case IntegrityStatus::Ok: return "ok";
    case IntegrityStatus::Repaired: return "repaired";
    case IntegrityStatus::Broken: return "broken";
  }
  return "ok";
}

IntegrityStatus check_entity(EntityRegistry& registry, Id id, bool fix, std::vector<std::string>& problems,
                             ChangeSet* changes) {
  const auto kind = registry.kind_of(id);
  if (!kind) {
    problems.push_back(concat("entity ", id, ": ", registry.is_disposed(id) ? "disposed" : "unknown", " (broken)"));
    log::warn("integrity: " + problems.back());
    return IntegrityStatus::Broken;
  }

  Checker c(registry, id, fix, problems, changes);
  switch (*kind) {
    case EntityKind::Game: check_game_root(registry, c); break;
    case EntityKind::Player: check_player(registry, *registry.player(id), c); break;
    case EntityKind::Tile: check_tile(registry, *registry.tile(id), c); break;
    case EntityKind::Unit: check_unit(registry, *registry.unit(id), c); break;
    case EntityKind::Settlement: check_settlement(registry, *registry.settlement(id), c); break;
    case EntityKind::Building: check_building(registry, *registry.building(id), c); break;
    case EntityKind::Wish: check_wish(registry, *registry.wish(id), c); break;
    case EntityKind::Mission: check_mission(registry, *registry.mission(id), c); break;
  }
  return c.status();
}

IntegrityReport check_game(EntityRegistry& registry, bool fix, ChangeSet* changes) {
  std::vector<Id> ids;
  ids.reserve(registry.state().kinds.size());
  for (const auto& [id, _] : registry.state().kinds) ids.push_back(id);
  std::sort(ids.begin(), ids.end());

  IntegrityReport report;
  for (Id id : ids) {
    switch (check_entity(registry, id, fix, report.problems, changes)) {
      case IntegrityStatus::Ok: ++report.ok; break;
      case IntegrityStatus::Repaired: ++report.repaired; break;
      case IntegrityStatus::Broken: ++report.broken; break;
    }
  }
  if (!report.clean()) {
    log::warn(concat("integrity: ", report.repaired, " repaired, ", report.broken, " broken of ", ids.size(),
                     " entities"));
  }
  return report;
}

} // namespace colonia
