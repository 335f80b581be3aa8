#pragma once

#include <string>
#include <unordered_map>

#include "colonia/util/json.h"

namespace colonia {

struct UnitTypeDef {
  std::string id;
  int offence{0};
  int defence{1};
  int moves{1};
  int line_of_sight{1};

  // Goods capacity in units of 100. 0 means the unit cannot carry goods.
  int cargo_slots{0};

  bool can_found_settlement{false};
  bool naval{false};
};

struct BuildingTypeDef {
  std::string id;
  std::string name;

  // Built automatically when a settlement is founded.
  bool founding{false};
};

struct GoodsTypeDef {
  std::string id;
  int price{1};
};

struct TerrainDef {
  std::string id;
  bool water{false};
};

// Static game content. Never mutated during play.
struct Rules {
  std::unordered_map<std::string, UnitTypeDef> unit_types;
  std::unordered_map<std::string, BuildingTypeDef> building_types;
  std::unordered_map<std::string, GoodsTypeDef> goods_types;
  std::unordered_map<std::string, TerrainDef> terrains;

  const UnitTypeDef* find_unit_type(const std::string& id) const;
  const GoodsTypeDef* find_goods_type(const std::string& id) const;
  const TerrainDef* find_terrain(const std::string& id) const;
  bool is_water(const std::string& terrain_id) const;
};

// Colonization-era defaults used by scenarios and tests.
Rules make_default_rules();

// Throws std::runtime_error on malformed input; `source` names the origin in
// error messages.
Rules load_rules_from_json(const json::Value& root, const std::string& source = "<memory>");
Rules load_rules_from_file(const std::string& path);

} // namespace colonia
