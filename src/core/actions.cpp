#include "colonia/core/actions.h"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <limits>
#include <vector>

#include "colonia/core/visibility.h"
#include "colonia/util/hash_rng.h"
#include "colonia/util/log.h"
#include "colonia/util/strings.h"

namespace colonia {
namespace {

constexpr int kGoodsPerSlot = 100;

// --- parameter access ---

std::optional<ActionError> read_id(const json::Object& p, const char* key, Id& out, bool required = true) {
  auto it = p.find(key);
  if (it == p.end() || it->second.is_null()) {
    if (!required) return std::nullopt;
    return protocol_error(concat("missing parameter '", key, "'"));
  }
  if (!it->second.is_int() || it->second.int_value() < 0) {
    return protocol_error(concat("parameter '", key, "' must be an entity id"));
  }
  out = static_cast<Id>(it->second.int_value());
  return std::nullopt;
}

std::optional<ActionError> read_int(const json::Object& p, const char* key, int& out) {
  auto it = p.find(key);
  if (it == p.end()) return protocol_error(concat("missing parameter '", key, "'"));
  if (!it->second.is_int()) return protocol_error(concat("parameter '", key, "' must be an integer"));
  const std::int64_t v = it->second.int_value();
  if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
    return protocol_error(concat("parameter '", key, "' is out of range"));
  }
  out = static_cast<int>(v);
  return std::nullopt;
}

std::optional<ActionError> read_string(const json::Object& p, const char* key, std::string& out) {
  auto it = p.find(key);
  if (it == p.end()) return protocol_error(concat("missing parameter '", key, "'"));
  if (!it->second.is_string()) return protocol_error(concat("parameter '", key, "' must be a string"));
  out = *it->second.as_string();
  return std::nullopt;
}

// --- shared helpers ---

const UnitTypeDef& unit_type_or_default(const Rules& rules, const std::string& id) {
  static const UnitTypeDef fallback;
  const UnitTypeDef* def = rules.find_unit_type(id);
  return def ? *def : fallback;
}

std::vector<Id> units_on_tile(const EntityRegistry& reg, Id tile_id) {
  std::vector<Id> out;
  for (const auto& [uid, u] : reg.state().units) {
    if (reg.tile_of(uid) == tile_id) out.push_back(uid);
  }
  std::sort(out.begin(), out.end());
  return out;
}

bool has_foreign_units(const EntityRegistry& reg, Id tile_id, Id player) {
  for (Id uid : units_on_tile(reg, tile_id)) {
    if (reg.unit(uid)->owner_id != player) return true;
  }
  return false;
}

// Tells `player` about foreign settlements and units on tiles that just came
// into its sight.
void reveal_tiles(ActionContext& ctx, Id player, const std::vector<Id>& tiles) {
  const EntityRegistry& reg = ctx.registry;
  for (Id t : tiles) {
    const Tile* tile = reg.tile(t);
    if (!tile) continue;
    if (tile->settlement_id != kInvalidId) {
      ctx.changes.append(ChangeKind::UpdateFull, reg.ref(tile->settlement_id), ChangePriority::State,
                         See::only(player));
    }
    for (Id uid : units_on_tile(reg, t)) {
      if (reg.unit(uid)->owner_id == player) continue;
      ctx.changes.append(ChangeKind::UpdateFull, reg.ref(uid), ChangePriority::State, See::only(player));
    }
  }
}

// Explores around `center` for `player` and records the newly explored
// tiles for that player.
void explore(ActionContext& ctx, Id player, Id center, int radius) {
  const std::vector<Id> fresh = explore_from(ctx.registry.state(), player, center, radius);
  for (Id t : fresh) {
    ctx.changes.append(ChangeKind::UpdateFull, ctx.registry.ref(t), ChangePriority::State, See::only(player));
  }
}

// Own naval unit on `tile_id` with room for one more unit, or kInvalidId.
Id find_carrier(const ActionContext& ctx, Id tile_id, Id player) {
  for (const auto& [uid, u] : ctx.registry.state().units) {
    if (u.location_id != tile_id || u.owner_id != player) continue;
    const UnitTypeDef& def = unit_type_or_default(ctx.rules, u.type_id);
    if (def.naval && free_cargo_capacity(ctx.registry, ctx.rules, uid) >= kGoodsPerSlot) return uid;
  }
  return kInvalidId;
}

// --- verbs ---

std::optional<ActionError> do_move(ActionContext& ctx, Id player, const json::Object& params) {
  EntityRegistry& reg = ctx.registry;
  Id unit_id = kInvalidId;
  Id tile_id = kInvalidId;
  if (auto e = read_id(params, "unit", unit_id)) return e;
  if (auto e = read_id(params, "tile", tile_id)) return e;

  Unit& u = reg.expect_owned_unit(unit_id, player);
  const Tile& dest = reg.expect_tile(tile_id);
  const UnitTypeDef& def = unit_type_or_default(ctx.rules, u.type_id);

  const Id from = reg.tile_of(u.id);
  if (from == kInvalidId) return validation_error("unit is not on the map");
  if (tile_distance(reg.state(), from, dest.id) != 1) return validation_error("destination is not adjacent");
  if (u.moves_left <= 0) return validation_error("unit has no moves left");

  Id own_settlement = kInvalidId;
  if (dest.settlement_id != kInvalidId) {
    const Settlement* s = reg.settlement(dest.settlement_id);
    if (s && s->owner_id != player) return validation_error("destination holds a foreign settlement");
    if (s) own_settlement = s->id;
  }
  if (has_foreign_units(reg, dest.id, player)) return validation_error("destination is occupied by foreign units");

  const bool water = ctx.rules.is_water(dest.terrain);
  Id carrier = kInvalidId;
  if (!def.naval && water) {
    carrier = find_carrier(ctx, dest.id, player);
    if (carrier == kInvalidId) return validation_error("land units cannot enter water");
  }
  if (def.naval && !water && own_settlement == kInvalidId) {
    return validation_error("naval units can only enter water or an own settlement");
  }

  // Committed.
  const int radius = sight_radius(reg, ctx.rules, ctx.cfg, u.id);
  std::vector<Id> before = tiles_within(reg.state(), from, radius);

  u.location_id = carrier != kInvalidId ? carrier : (own_settlement != kInvalidId ? own_settlement : dest.id);
  u.moves_left -= 1;

  See unit_see = See::perceived();
  unit_see.always(player);
  ctx.changes.append(ChangeKind::UpdateFull, reg.ref(u.id), ChangePriority::State, unit_see);
  ctx.changes.append(ChangeKind::UpdateFull, reg.ref(from), ChangePriority::State, See::perceived());
  ctx.changes.append(ChangeKind::UpdateFull, reg.ref(dest.id), ChangePriority::State, See::perceived());

  explore(ctx, player, dest.id, radius);

  std::vector<Id> after = tiles_within(reg.state(), dest.id, radius);
  std::vector<Id> newly_in_sight;
  std::set_difference(after.begin(), after.end(), before.begin(), before.end(), std::back_inserter(newly_in_sight));
  reveal_tiles(ctx, player, newly_in_sight);
  return std::nullopt;
}

std::optional<ActionError> do_found_settlement(ActionContext& ctx, Id player, const json::Object& params) {
  EntityRegistry& reg = ctx.registry;
  Id unit_id = kInvalidId;
  std::string name;
  if (auto e = read_id(params, "unit", unit_id)) return e;
  if (auto e = read_string(params, "name", name)) return e;

  Unit& u = reg.expect_owned_unit(unit_id, player);
  const UnitTypeDef& def = unit_type_or_default(ctx.rules, u.type_id);
  if (!def.can_found_settlement) return validation_error(concat("unit type '", u.type_id, "' cannot found settlements"));

  Tile* t = reg.tile(u.location_id);
  if (!t) return validation_error("unit must stand on a map tile");
  if (ctx.rules.is_water(t->terrain)) return validation_error("cannot found a settlement on water");
  if (t->settlement_id != kInvalidId) return validation_error("tile already holds a settlement");
  if (t->owner_id != kInvalidId && t->owner_id != player) return validation_error("tile is claimed by another player");
  for (Id near : tiles_within(reg.state(), t->id, 1)) {
    const Tile* nt = reg.tile(near);
    if (nt && nt->settlement_id != kInvalidId) return validation_error("too close to another settlement");
  }
  name = trim_copy(name);
  if (name.empty()) return validation_error("settlement name must not be empty");

  // Committed.
  const Id tile_id = t->id;
  Settlement st;
  st.name = name;
  st.owner_id = player;
  st.tile_id = tile_id;
  st.founded_turn = reg.state().game.turn;
  const Id sid = reg.register_settlement(std::move(st));

  See settlement_see = See::perceived();
  settlement_see.always(player);
  ctx.changes.append(ChangeKind::Add, reg.ref(sid), ChangePriority::State, settlement_see);

  std::vector<std::string> founding;
  for (const auto& [bid, b] : ctx.rules.building_types) {
    if (b.founding) founding.push_back(bid);
  }
  std::sort(founding.begin(), founding.end());
  for (const auto& type_id : founding) {
    Building b;
    b.type_id = type_id;
    b.settlement_id = sid;
    const Id bid = reg.register_building(std::move(b));
    ctx.changes.append(ChangeKind::Add, reg.ref(bid), ChangePriority::State, See::only_owner());
  }

  Tile& home = *reg.tile(tile_id);
  home.settlement_id = sid;
  home.owner_id = player;
  ctx.changes.append_partial(reg.ref(tile_id), {"owner_id", "settlement_id"}, ChangePriority::State,
                             See::perceived());

  for (Id near : tiles_within(reg.state(), tile_id, 1)) {
    Tile* nt = reg.tile(near);
    if (!nt || nt->owner_id != kInvalidId || ctx.rules.is_water(nt->terrain)) continue;
    nt->owner_id = player;
    ctx.changes.append_partial(reg.ref(near), {"owner_id"}, ChangePriority::State, See::perceived());
  }

  Unit& founder = *reg.unit(unit_id);
  founder.location_id = sid;
  founder.moves_left = 0;
  See unit_see = See::perceived();
  unit_see.always(player);
  ctx.changes.append_partial(reg.ref(unit_id), {"location_id", "moves_left"}, ChangePriority::State, unit_see);

  explore(ctx, player, tile_id, std::max(0, ctx.cfg.settlement_line_of_sight));
  return std::nullopt;
}

std::optional<ActionError> do_buy_goods(ActionContext& ctx, Id player, const json::Object& params) {
  EntityRegistry& reg = ctx.registry;
  Id carrier_id = kInvalidId;
  std::string goods;
  int amount = 0;
  if (auto e = read_id(params, "carrier", carrier_id)) return e;
  if (auto e = read_string(params, "goods", goods)) return e;
  if (auto e = read_int(params, "amount", amount)) return e;

  Unit& carrier = reg.expect_owned_unit(carrier_id, player);
  const UnitTypeDef& def = unit_type_or_default(ctx.rules, carrier.type_id);
  if (def.cargo_slots <= 0) return validation_error(concat("unit type '", carrier.type_id, "' cannot carry goods"));

  const Settlement* docked = reg.settlement(carrier.location_id);
  if (!docked || docked->owner_id != player) return validation_error("carrier is not in an own settlement");

  const GoodsTypeDef* gt = ctx.rules.find_goods_type(goods);
  if (!gt) return validation_error(concat("unknown goods type '", goods, "'"));
  if (amount <= 0) return validation_error("amount must be positive");

  Player& buyer = *reg.player(player);
  const long long cost = static_cast<long long>(gt->price) * amount;
  if (cost > buyer.gold) return validation_error(concat("not enough gold: need ", cost, ", have ", buyer.gold));
  if (free_cargo_capacity(reg, ctx.rules, carrier_id) < amount) return validation_error("not enough cargo space");

  // Committed.
  buyer.gold -= static_cast<int>(cost);
  carrier.cargo[goods] += amount;
  ctx.changes.append_partial(reg.ref(player), {"gold"}, ChangePriority::State, See::only(player));
  ctx.changes.append_partial(reg.ref(carrier_id), {"cargo"}, ChangePriority::State, See::only_owner());
  return std::nullopt;
}

std::optional<ActionError> do_attack(ActionContext& ctx, Id player, const json::Object& params) {
  EntityRegistry& reg = ctx.registry;
  Id unit_id = kInvalidId;
  Id target_id = kInvalidId;
  if (auto e = read_id(params, "unit", unit_id)) return e;
  if (auto e = read_id(params, "target", target_id)) return e;

  Unit& attacker = reg.expect_owned_unit(unit_id, player);
  const UnitTypeDef& adef = unit_type_or_default(ctx.rules, attacker.type_id);
  if (attacker.moves_left <= 0) return validation_error("unit has no moves left");
  if (adef.offence <= 0) return validation_error(concat("unit type '", attacker.type_id, "' cannot attack"));
  if (reg.unit(attacker.location_id)) return validation_error("unit is aboard a carrier");

  const Unit* target = reg.unit(target_id);
  if (!target) return not_found_error(concat("unit ", target_id, " not found"));
  if (target->owner_id == player) return validation_error("cannot attack an own unit");

  const Id from = reg.tile_of(attacker.id);
  const Id to = reg.tile_of(target_id);
  if (from == kInvalidId || to == kInvalidId) return validation_error("combatants must be on the map");
  if (tile_distance(reg.state(), from, to) != 1) return validation_error("target is not adjacent");
  const bool target_on_water = ctx.rules.is_water(reg.tile(to)->terrain);
  if (!adef.naval && target_on_water) return validation_error("land units cannot attack at sea");
  if (adef.naval && !target_on_water) return validation_error("naval units cannot attack on land");

  // Committed.
  const UnitTypeDef& tdef = unit_type_or_default(ctx.rules, target->type_id);
  const Id defender = target->owner_id;
  const bool won = attack_succeeds(reg.state().rng_state, std::max(1, adef.offence), std::max(1, tdef.defence));

  StringTemplate msg;
  msg.key = won ? "model.unit.combat.attackerWins" : "model.unit.combat.defenderWins";
  msg.add("%attacker%", attacker.type_id).add("%defender%", target->type_id);
  ctx.changes.append_message(See::players({player, defender}), std::move(msg));

  if (!won) {
    reg.dispose(unit_id);
    return std::nullopt;
  }

  const bool capture = tdef.offence == 0 && !adef.naval && !tdef.naval;
  if (capture) {
    for (Id m : reg.contents_of(target_id)) {
      if (reg.mission(m)) reg.dispose(m);
    }
    Unit& prize = *reg.unit(target_id);
    prize.owner_id = player;
    prize.location_id = from;
    prize.moves_left = 0;
    ctx.changes.append_owner_change(reg.ref(target_id), defender, player, See::perceived());
  } else {
    reg.dispose(target_id);
  }

  Unit& winner = *reg.unit(unit_id);
  winner.moves_left = 0;
  ctx.changes.append_partial(reg.ref(unit_id), {"moves_left"}, ChangePriority::State, See::only_owner());
  return std::nullopt;
}

std::optional<ActionError> do_disband(ActionContext& ctx, Id player, const json::Object& params) {
  Id unit_id = kInvalidId;
  if (auto e = read_id(params, "unit", unit_id)) return e;
  ctx.registry.expect_owned_unit(unit_id, player);
  ctx.registry.dispose(unit_id);
  return std::nullopt;
}

std::optional<ActionError> do_post_wish(ActionContext& ctx, Id player, const json::Object& params) {
  EntityRegistry& reg = ctx.registry;
  Id destination = kInvalidId;
  Id transportable = kInvalidId;
  std::string goods;
  int amount = 0;
  if (auto e = read_id(params, "destination", destination)) return e;
  if (auto e = read_string(params, "goods", goods)) return e;
  if (auto e = read_int(params, "amount", amount)) return e;
  if (auto e = read_id(params, "transportable", transportable, false)) return e;

  const auto kind = reg.kind_of(destination);
  if (!kind) return not_found_error(concat("destination ", destination, " not found"));
  if (*kind != EntityKind::Tile && *kind != EntityKind::Settlement) {
    return validation_error("destination must be a tile or a settlement");
  }
  if (!known_to_player(reg, ctx.rules, ctx.cfg, player, destination)) {
    return validation_error("destination is unexplored");
  }
  if (!ctx.rules.find_goods_type(goods)) return validation_error(concat("unknown goods type '", goods, "'"));
  if (amount <= 0) return validation_error("amount must be positive");
  if (transportable != kInvalidId) reg.expect_owned_unit(transportable, player);

  // Committed.
  Wish w;
  w.player_id = player;
  w.destination_id = destination;
  w.transportable_id = transportable;
  w.goods_type = goods;
  w.amount = amount;
  const Id wid = reg.register_wish(std::move(w));
  ctx.changes.append(ChangeKind::Add, reg.ref(wid), ChangePriority::State, See::only_owner());
  return std::nullopt;
}

std::optional<ActionError> do_assign_mission(ActionContext& ctx, Id player, const json::Object& params) {
  EntityRegistry& reg = ctx.registry;
  Id unit_id = kInvalidId;
  Id target = kInvalidId;
  std::string mission_type;
  if (auto e = read_id(params, "unit", unit_id)) return e;
  if (auto e = read_string(params, "mission", mission_type)) return e;
  if (auto e = read_id(params, "target", target, false)) return e;

  reg.expect_owned_unit(unit_id, player);
  if (trim_copy(mission_type).empty()) return validation_error("mission type must not be empty");
  if (target != kInvalidId) {
    if (!reg.exists(target)) return not_found_error(concat("target ", target, " not found"));
    if (!known_to_player(reg, ctx.rules, ctx.cfg, player, target)) {
      return validation_error("target is unknown to the player");
    }
  }

  // Committed. A unit has at most one mission.
  for (Id m : reg.contents_of(unit_id)) {
    if (reg.mission(m)) reg.dispose(m);
  }
  Mission m;
  m.unit_id = unit_id;
  m.mission_type = trim_copy(mission_type);
  m.target_id = target;
  const Id mid = reg.register_mission(std::move(m));
  ctx.changes.append(ChangeKind::Add, reg.ref(mid), ChangePriority::State, See::only_owner());
  return std::nullopt;
}

std::optional<ActionError> do_cancel_wish(ActionContext& ctx, Id player, const json::Object& params) {
  Id wish_id = kInvalidId;
  if (auto e = read_id(params, "wish", wish_id)) return e;
  ctx.registry.expect_owned_wish(wish_id, player);
  ctx.registry.dispose(wish_id);
  return std::nullopt;
}

using Handler = std::optional<ActionError> (*)(ActionContext&, Id, const json::Object&);

struct VerbEntry {
  const char* verb;
  Handler handler;
};

constexpr VerbEntry kVerbs[] = {
    {"move", &do_move},
    {"found_settlement", &do_found_settlement},
    {"buy_goods", &do_buy_goods},
    {"attack", &do_attack},
    {"disband", &do_disband},
    {"post_wish", &do_post_wish},
    {"assign_mission", &do_assign_mission},
    {"cancel_wish", &do_cancel_wish},
};

Handler find_handler(const std::string& verb) {
  for (const auto& v : kVerbs) {
    if (verb == v.verb) return v.handler;
  }
  return nullptr;
}

} // namespace

bool is_action_verb(const std::string& verb) { return find_handler(verb) != nullptr; }

std::optional<ActionError> check_actor(const EntityRegistry& registry, Id player) {
  const Player* p = registry.player(player);
  if (!p) return not_found_error(concat("player ", player, " not found"));
  if (p->dead) return validation_error("player is dead");
  if (registry.state().game.game_over) return validation_error("the game is over");
  if (registry.state().game.current_player_id != player) return validation_error("not your turn");
  return std::nullopt;
}

std::optional<ActionError> perform_action(ActionContext& ctx, const ActionRequest& req) {
  const Handler handler = find_handler(req.verb);
  if (!handler) return protocol_error(concat("unknown verb '", req.verb, "'"));
  if (auto e = check_actor(ctx.registry, req.player)) return e;

  try {
    return handler(ctx, req.player, req.params);
  } catch (const NotFoundError& e) {
    return not_found_error(e.what());
  } catch (const OwnershipError& e) {
    return ownership_error(e.what());
  }
}

bool attack_succeeds(std::uint64_t& rng_state, int offence, int defence) {
  util::HashRng rng(rng_state);
  const std::uint64_t total = static_cast<std::uint64_t>(std::max(1, offence) + std::max(1, defence));
  const bool won = rng.below(total) < static_cast<std::uint64_t>(std::max(1, offence));
  rng_state = rng.state();
  return won;
}

int free_cargo_capacity(const EntityRegistry& registry, const Rules& rules, Id carrier) {
  const Unit* u = registry.unit(carrier);
  if (!u) return 0;
  const UnitTypeDef& def = unit_type_or_default(rules, u->type_id);
  int used = 0;
  for (const auto& [_, amount] : u->cargo) used += amount;
  for (const auto& [uid, other] : registry.state().units) {
    if (other.location_id == carrier) used += kGoodsPerSlot;
  }
  return std::max(0, def.cargo_slots * kGoodsPerSlot - used);
}

bool known_to_player(const EntityRegistry& registry, const Rules& rules, const GameConfig& cfg, Id player, Id id) {
  const auto kind = registry.kind_of(id);
  if (!kind) return false;
  const VisibilityOracle oracle(registry, rules, cfg);
  return oracle.visible(player, registry.ref(id), default_see_for(*kind)) != Visibility::None;
}

} // namespace colonia
