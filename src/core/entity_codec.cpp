#include "colonia/core/entity_codec.h"

#include <algorithm>
#include <stdexcept>

#include "colonia/util/strings.h"

namespace colonia {
namespace {

using json::Array;
using json::Object;
using json::Value;

// Typed field access for decode(). Missing keys keep the caller's default.
class FieldReader {
 public:
  FieldReader(const Object& o, EntityKind kind, Id id) : o_(o), kind_(kind), id_(id) {}

  Id id(const char* key) const {
    const Value* v = get(key);
    if (!v) return kInvalidId;
    if (!v->is_int() || v->int_value() < 0) fail(key, "a non-negative integer id");
    return static_cast<Id>(v->int_value());
  }

  int i(const char* key, int def = 0) const {
    const Value* v = get(key);
    if (!v) return def;
    if (!v->is_number()) fail(key, "a number");
    return static_cast<int>(v->int_value());
  }

  bool b(const char* key, bool def = false) const {
    const Value* v = get(key);
    if (!v) return def;
    if (!v->is_bool()) fail(key, "a boolean");
    return v->bool_value();
  }

  std::string s(const char* key, const std::string& def = "") const {
    const Value* v = get(key);
    if (!v) return def;
    if (!v->is_string()) fail(key, "a string");
    return *v->as_string();
  }

  GoodsMap goods(const char* key) const {
    GoodsMap out;
    const Value* v = get(key);
    if (!v) return out;
    const Object* o = v->as_object();
    if (!o) fail(key, "an object");
    for (const auto& [g, amount] : *o) {
      if (!amount.is_number()) fail(key, "an object of numbers");
      out[g] = static_cast<int>(amount.int_value());
    }
    return out;
  }

  std::vector<Id> ids(const char* key) const {
    std::vector<Id> out;
    const Value* v = get(key);
    if (!v) return out;
    const Array* a = v->as_array();
    if (!a) fail(key, "an array");
    for (const auto& e : *a) {
      if (!e.is_int() || e.int_value() < 0) fail(key, "an array of ids");
      out.push_back(static_cast<Id>(e.int_value()));
    }
    return out;
  }

 private:
  const Value* get(const char* key) const {
    auto it = o_.find(key);
    if (it == o_.end() || it->second.is_null()) return nullptr;
    return &it->second;
  }

  [[noreturn]] void fail(const char* key, const char* expected) const {
    throw std::runtime_error(concat(entity_kind_name(kind_), " ", id_, ": field '", key, "' must be ", expected));
  }

  const Object& o_;
  EntityKind kind_;
  Id id_;
};

Value goods_to_json(const GoodsMap& g) {
  Object o;
  for (const auto& [k, v] : g) o[k] = v;
  return o;
}

const std::vector<std::string> kNoFields;

class GameCodec final : public EntityCodec {
 public:
  EntityKind kind() const override { return EntityKind::Game; }

  Object encode(const GameState& s, Id) const override {
    const GameInfo& g = s.game;
    Object o;
    o["turn"] = g.turn;
    o["current_player_id"] = g.current_player_id;
    o["power_transfer_done"] = g.power_transfer_done;
    o["game_over"] = g.game_over;
    o["winner_id"] = g.winner_id;
    return o;
  }

  void decode(GameState& s, Id id, const Object& data) const override {
    FieldReader r(data, kind(), id);
    GameInfo g;
    g.id = id;
    g.turn = r.i("turn", 1);
    g.current_player_id = r.id("current_player_id");
    g.power_transfer_done = r.b("power_transfer_done");
    g.game_over = r.b("game_over");
    g.winner_id = r.id("winner_id");
    s.game = g;
    s.kinds[id] = kind();
  }

  const std::vector<std::string>& summary_fields() const override {
    static const std::vector<std::string> f = {"current_player_id", "game_over", "power_transfer_done", "turn",
                                               "winner_id"};
    return f;
  }
  const std::vector<std::string>& strong_references() const override { return kNoFields; }
  const std::vector<std::string>& weak_references() const override {
    static const std::vector<std::string> f = {"current_player_id", "winner_id"};
    return f;
  }
};

class PlayerCodec final : public EntityCodec {
 public:
  EntityKind kind() const override { return EntityKind::Player; }

  Object encode(const GameState& s, Id id) const override {
    const Player& p = s.players.at(id);
    Object o;
    o["name"] = p.name;
    o["nation"] = p.nation;
    o["control"] = player_control_name(p.control);
    o["is_ref"] = p.is_ref;
    o["is_independent"] = p.is_independent;
    o["dead"] = p.dead;
    o["gold"] = p.gold;
    o["join_index"] = p.join_index;
    Array explored;
    explored.reserve(p.explored_tiles.size());
    for (Id t : p.explored_tiles) explored.push_back(t);
    o["explored_tiles"] = std::move(explored);
    return o;
  }

  void decode(GameState& s, Id id, const Object& data) const override {
    FieldReader r(data, kind(), id);
    Player p;
    p.id = id;
    p.name = r.s("name");
    p.nation = r.s("nation");
    const std::string control = r.s("control", "human");
    if (!player_control_from_name(control, p.control)) {
      throw std::runtime_error(concat("player ", id, ": unknown control '", control, "'"));
    }
    p.is_ref = r.b("is_ref");
    p.is_independent = r.b("is_independent");
    p.dead = r.b("dead");
    p.gold = r.i("gold");
    p.join_index = r.i("join_index");
    p.explored_tiles = r.ids("explored_tiles");
    std::sort(p.explored_tiles.begin(), p.explored_tiles.end());
    p.explored_tiles.erase(std::unique(p.explored_tiles.begin(), p.explored_tiles.end()), p.explored_tiles.end());
    s.players[id] = std::move(p);
    s.kinds[id] = kind();
  }

  const std::vector<std::string>& summary_fields() const override {
    static const std::vector<std::string> f = {"control", "dead", "is_independent", "is_ref", "join_index", "name",
                                               "nation"};
    return f;
  }
  const std::vector<std::string>& private_fields() const override {
    static const std::vector<std::string> f = {"explored_tiles"};
    return f;
  }
  const std::vector<std::string>& strong_references() const override { return kNoFields; }
};

class TileCodec final : public EntityCodec {
 public:
  EntityKind kind() const override { return EntityKind::Tile; }

  Object encode(const GameState& s, Id id) const override {
    const Tile& t = s.tiles.at(id);
    Object o;
    o["x"] = t.x;
    o["y"] = t.y;
    o["terrain"] = t.terrain;
    o["owner_id"] = t.owner_id;
    o["settlement_id"] = t.settlement_id;
    return o;
  }

  void decode(GameState& s, Id id, const Object& data) const override {
    FieldReader r(data, kind(), id);
    Tile t;
    t.id = id;
    t.x = r.i("x");
    t.y = r.i("y");
    t.terrain = r.s("terrain");
    t.owner_id = r.id("owner_id");
    t.settlement_id = r.id("settlement_id");
    s.tiles[id] = std::move(t);
    s.kinds[id] = kind();
  }

  const std::vector<std::string>& summary_fields() const override {
    static const std::vector<std::string> f = {"owner_id", "settlement_id", "terrain", "x", "y"};
    return f;
  }
  const std::vector<std::string>& strong_references() const override {
    static const std::vector<std::string> f = {"owner_id", "settlement_id"};
    return f;
  }
};

class UnitCodec final : public EntityCodec {
 public:
  EntityKind kind() const override { return EntityKind::Unit; }

  Object encode(const GameState& s, Id id) const override {
    const Unit& u = s.units.at(id);
    Object o;
    o["type_id"] = u.type_id;
    o["owner_id"] = u.owner_id;
    o["location_id"] = u.location_id;
    o["moves_left"] = u.moves_left;
    o["hit_points"] = u.hit_points;
    o["cargo"] = goods_to_json(u.cargo);
    return o;
  }

  void decode(GameState& s, Id id, const Object& data) const override {
    FieldReader r(data, kind(), id);
    Unit u;
    u.id = id;
    u.type_id = r.s("type_id");
    u.owner_id = r.id("owner_id");
    u.location_id = r.id("location_id");
    u.moves_left = r.i("moves_left");
    u.hit_points = r.i("hit_points", 1);
    u.cargo = r.goods("cargo");
    s.units[id] = std::move(u);
    s.kinds[id] = kind();
  }

  // Cargo, moves and health stay hidden from foreign observers.
  const std::vector<std::string>& summary_fields() const override {
    static const std::vector<std::string> f = {"location_id", "owner_id", "type_id"};
    return f;
  }
  const std::vector<std::string>& strong_references() const override {
    static const std::vector<std::string> f = {"location_id", "owner_id"};
    return f;
  }
};

class SettlementCodec final : public EntityCodec {
 public:
  EntityKind kind() const override { return EntityKind::Settlement; }

  Object encode(const GameState& s, Id id) const override {
    const Settlement& st = s.settlements.at(id);
    Object o;
    o["name"] = st.name;
    o["owner_id"] = st.owner_id;
    o["tile_id"] = st.tile_id;
    o["population"] = st.population;
    o["production_bonus"] = st.production_bonus;
    o["goods"] = goods_to_json(st.goods);
    o["founded_turn"] = st.founded_turn;
    return o;
  }

  void decode(GameState& s, Id id, const Object& data) const override {
    FieldReader r(data, kind(), id);
    Settlement st;
    st.id = id;
    st.name = r.s("name");
    st.owner_id = r.id("owner_id");
    st.tile_id = r.id("tile_id");
    st.population = r.i("population", 1);
    st.production_bonus = r.i("production_bonus");
    st.goods = r.goods("goods");
    st.founded_turn = r.i("founded_turn");
    s.settlements[id] = std::move(st);
    s.kinds[id] = kind();
  }

  const std::vector<std::string>& summary_fields() const override {
    static const std::vector<std::string> f = {"name", "owner_id", "population", "tile_id"};
    return f;
  }
  const std::vector<std::string>& strong_references() const override {
    static const std::vector<std::string> f = {"owner_id", "tile_id"};
    return f;
  }
};

class BuildingCodec final : public EntityCodec {
 public:
  EntityKind kind() const override { return EntityKind::Building; }

  Object encode(const GameState& s, Id id) const override {
    const Building& b = s.buildings.at(id);
    Object o;
    o["type_id"] = b.type_id;
    o["settlement_id"] = b.settlement_id;
    o["level"] = b.level;
    return o;
  }

  void decode(GameState& s, Id id, const Object& data) const override {
    FieldReader r(data, kind(), id);
    Building b;
    b.id = id;
    b.type_id = r.s("type_id");
    b.settlement_id = r.id("settlement_id");
    b.level = r.i("level", 1);
    s.buildings[id] = std::move(b);
    s.kinds[id] = kind();
  }

  const std::vector<std::string>& summary_fields() const override {
    static const std::vector<std::string> f = {"settlement_id", "type_id"};
    return f;
  }
  const std::vector<std::string>& strong_references() const override {
    static const std::vector<std::string> f = {"settlement_id"};
    return f;
  }
};

class WishCodec final : public EntityCodec {
 public:
  EntityKind kind() const override { return EntityKind::Wish; }

  Object encode(const GameState& s, Id id) const override {
    const Wish& w = s.wishes.at(id);
    Object o;
    o["player_id"] = w.player_id;
    o["destination_id"] = w.destination_id;
    o["transportable_id"] = w.transportable_id;
    o["goods_type"] = w.goods_type;
    o["amount"] = w.amount;
    return o;
  }

  void decode(GameState& s, Id id, const Object& data) const override {
    FieldReader r(data, kind(), id);
    Wish w;
    w.id = id;
    w.player_id = r.id("player_id");
    w.destination_id = r.id("destination_id");
    w.transportable_id = r.id("transportable_id");
    w.goods_type = r.s("goods_type");
    w.amount = r.i("amount");
    s.wishes[id] = std::move(w);
    s.kinds[id] = kind();
  }

  const std::vector<std::string>& summary_fields() const override { return kNoFields; }
  const std::vector<std::string>& strong_references() const override {
    static const std::vector<std::string> f = {"player_id"};
    return f;
  }
  const std::vector<std::string>& weak_references() const override {
    static const std::vector<std::string> f = {"destination_id", "transportable_id"};
    return f;
  }
};

class MissionCodec final : public EntityCodec {
 public:
  EntityKind kind() const override { return EntityKind::Mission; }

  Object encode(const GameState& s, Id id) const override {
    const Mission& m = s.missions.at(id);
    Object o;
    o["unit_id"] = m.unit_id;
    o["mission_type"] = m.mission_type;
    o["target_id"] = m.target_id;
    return o;
  }

  void decode(GameState& s, Id id, const Object& data) const override {
    FieldReader r(data, kind(), id);
    Mission m;
    m.id = id;
    m.unit_id = r.id("unit_id");
    m.mission_type = r.s("mission_type");
    m.target_id = r.id("target_id");
    s.missions[id] = std::move(m);
    s.kinds[id] = kind();
  }

  const std::vector<std::string>& summary_fields() const override { return kNoFields; }
  const std::vector<std::string>& strong_references() const override {
    static const std::vector<std::string> f = {"unit_id"};
    return f;
  }
  const std::vector<std::string>& weak_references() const override {
    static const std::vector<std::string> f = {"target_id"};
    return f;
  }
};

bool entity_exists(const GameState& s, Id id, EntityKind kind) {
  if (kind == EntityKind::Game) return s.game.id == id && id != kInvalidId;
  auto it = s.kinds.find(id);
  return it != s.kinds.end() && it->second == kind;
}

} // namespace

const std::vector<std::string>& EntityCodec::private_fields() const { return kNoFields; }

const std::vector<std::string>& EntityCodec::weak_references() const { return kNoFields; }

const EntityCodec& codec_for(EntityKind kind) {
  static const GameCodec game;
  static const PlayerCodec player;
  static const TileCodec tile;
  static const UnitCodec unit;
  static const SettlementCodec settlement;
  static const BuildingCodec building;
  static const WishCodec wish;
  static const MissionCodec mission;
  switch (kind) {
    case EntityKind::Game: return game;
    case EntityKind::Player: return player;
    case EntityKind::Tile: return tile;
    case EntityKind::Unit: return unit;
    case EntityKind::Settlement: return settlement;
    case EntityKind::Building: return building;
    case EntityKind::Wish: return wish;
    case EntityKind::Mission: return mission;
  }
  return game;
}

json::Object visible_fields(const GameState& s, Id id, EntityKind kind, Visibility level,
                            const std::vector<std::string>* only) {
  Object out;
  if (level == Visibility::None || !entity_exists(s, id, kind)) return out;

  const EntityCodec& codec = codec_for(kind);
  Object all = codec.encode(s, id);
  const auto& hidden = codec.private_fields();
  const auto& summary = codec.summary_fields();

  for (auto& [key, value] : all) {
    if (std::find(hidden.begin(), hidden.end(), key) != hidden.end()) continue;
    if (level == Visibility::Summary && std::find(summary.begin(), summary.end(), key) == summary.end()) continue;
    if (only && std::find(only->begin(), only->end(), key) == only->end()) continue;
    out.emplace(key, std::move(value));
  }
  return out;
}

const char* player_control_name(PlayerControl c) {
  switch (c) {
    case PlayerControl::Human: return "human";
    case PlayerControl::AI: return "ai";
  }
  return "human";
}

bool player_control_from_name(const std::string& s, PlayerControl& out) {
  if (s == "human") out = PlayerControl::Human;
  else if (s == "ai") out = PlayerControl::AI;
  else return false;
  return true;
}

} // namespace colonia
