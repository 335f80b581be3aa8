#include "colonia/core/rules.h"

#include <stdexcept>

#include "colonia/util/file_io.h"
#include "colonia/util/log.h"

namespace colonia {
namespace {

using json::Value;

int int_field(const Value& o, const char* key, int def, const std::string& source) {
  const Value* v = o.find(key);
  if (!v) return def;
  if (!v->is_number()) throw std::runtime_error(source + ": '" + key + "' must be a number");
  return static_cast<int>(v->int_value(def));
}

bool bool_field(const Value& o, const char* key, bool def, const std::string& source) {
  const Value* v = o.find(key);
  if (!v) return def;
  if (!v->is_bool()) throw std::runtime_error(source + ": '" + key + "' must be a boolean");
  return v->bool_value(def);
}

std::string id_field(const Value& o, const std::string& source) {
  const Value* v = o.find("id");
  if (!v || !v->is_string() || v->string_value().empty()) {
    throw std::runtime_error(source + ": entry without a string 'id'");
  }
  return v->string_value();
}

const json::Array& section(const Value& root, const char* key, const std::string& source) {
  static const json::Array kEmpty;
  const Value* v = root.find(key);
  if (!v) return kEmpty;
  if (!v->is_array()) throw std::runtime_error(source + ": '" + key + "' must be an array");
  return v->array();
}

} // namespace

const UnitTypeDef* Rules::find_unit_type(const std::string& id) const {
  auto it = unit_types.find(id);
  return it == unit_types.end() ? nullptr : &it->second;
}

const GoodsTypeDef* Rules::find_goods_type(const std::string& id) const {
  auto it = goods_types.find(id);
  return it == goods_types.end() ? nullptr : &it->second;
}

const TerrainDef* Rules::find_terrain(const std::string& id) const {
  auto it = terrains.find(id);
  return it == terrains.end() ? nullptr : &it->second;
}

bool Rules::is_water(const std::string& terrain_id) const {
  const TerrainDef* t = find_terrain(terrain_id);
  return t && t->water;
}

Rules make_default_rules() {
  Rules r;

  const auto unit = [&](const char* id, int off, int def, int moves, int los, int slots, bool found, bool naval) {
    UnitTypeDef u;
    u.id = id;
    u.offence = off;
    u.defence = def;
    u.moves = moves;
    u.line_of_sight = los;
    u.cargo_slots = slots;
    u.can_found_settlement = found;
    u.naval = naval;
    r.unit_types[u.id] = u;
  };
  unit("free_colonist", 0, 1, 1, 1, 0, true, false);
  unit("soldier", 2, 2, 1, 1, 0, true, false);
  unit("scout", 1, 1, 4, 2, 0, true, false);
  unit("wagon_train", 0, 1, 2, 1, 2, false, false);
  unit("caravel", 0, 2, 4, 1, 2, false, true);

  const auto building = [&](const char* id, const char* name, bool founding) {
    r.building_types[id] = BuildingTypeDef{id, name, founding};
  };
  building("town_hall", "Town hall", true);
  building("carpenter_house", "Carpenter's house", true);
  building("warehouse", "Warehouse", false);

  const auto goods = [&](const char* id, int price) { r.goods_types[id] = GoodsTypeDef{id, price}; };
  goods("food", 1);
  goods("furs", 3);
  goods("tools", 2);
  goods("muskets", 3);
  goods("trade_goods", 2);

  const auto terrain = [&](const char* id, bool water) { r.terrains[id] = TerrainDef{id, water}; };
  terrain("plains", false);
  terrain("grassland", false);
  terrain("forest", false);
  terrain("hills", false);
  terrain("ocean", true);

  return r;
}

Rules load_rules_from_json(const json::Value& root, const std::string& source) {
  if (!root.is_object()) throw std::runtime_error(source + ": rules root must be an object");

  Rules r;
  for (const auto& e : section(root, "unit_types", source)) {
    UnitTypeDef u;
    u.id = id_field(e, source);
    u.offence = int_field(e, "offence", 0, source);
    u.defence = int_field(e, "defence", 1, source);
    u.moves = int_field(e, "moves", 1, source);
    u.line_of_sight = int_field(e, "line_of_sight", 1, source);
    u.cargo_slots = int_field(e, "cargo_slots", 0, source);
    u.can_found_settlement = bool_field(e, "can_found_settlement", false, source);
    u.naval = bool_field(e, "naval", false, source);
    if (u.moves <= 0) throw std::runtime_error(source + ": unit type '" + u.id + "' has no moves");
    r.unit_types[u.id] = u;
  }
  for (const auto& e : section(root, "building_types", source)) {
    BuildingTypeDef b;
    b.id = id_field(e, source);
    b.name = e.find("name") ? e.at("name").string_value(b.id) : b.id;
    b.founding = bool_field(e, "founding", false, source);
    r.building_types[b.id] = b;
  }
  for (const auto& e : section(root, "goods_types", source)) {
    GoodsTypeDef g;
    g.id = id_field(e, source);
    g.price = int_field(e, "price", 1, source);
    if (g.price < 0) throw std::runtime_error(source + ": goods type '" + g.id + "' has a negative price");
    r.goods_types[g.id] = g;
  }
  for (const auto& e : section(root, "terrains", source)) {
    TerrainDef t;
    t.id = id_field(e, source);
    t.water = bool_field(e, "water", false, source);
    r.terrains[t.id] = t;
  }

  if (r.unit_types.empty()) throw std::runtime_error(source + ": no unit_types defined");
  if (r.terrains.empty()) throw std::runtime_error(source + ": no terrains defined");
  log::debug("Loaded rules from " + source + ": " + std::to_string(r.unit_types.size()) + " unit types, " +
             std::to_string(r.goods_types.size()) + " goods types");
  return r;
}

Rules load_rules_from_file(const std::string& path) {
  const json::Value root = json::parse(read_text_file(path));
  return load_rules_from_json(root, path);
}

} // namespace colonia
