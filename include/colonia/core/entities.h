#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "colonia/core/ids.h"

namespace colonia {

// Closed set of entity kinds held by the registry.
enum class EntityKind : std::uint8_t {
  Game = 0,
  Player = 1,
  Tile = 2,
  Unit = 3,
  Settlement = 4,
  Building = 5,
  Wish = 6,
  Mission = 7,
};

enum class PlayerControl : std::uint8_t {
  Human = 0,
  AI = 1,
};

// Goods stock keyed by goods type id. Ordered so serialization is stable.
using GoodsMap = std::map<std::string, int>;

// Localizable message: a template key plus named replacements
// (e.g. "%nation%" -> "Dutch").
struct StringTemplate {
  std::string key;
  std::vector<std::pair<std::string, std::string>> args;

  StringTemplate& add(std::string name, std::string value) {
    args.emplace_back(std::move(name), std::move(value));
    return *this;
  }

  bool operator==(const StringTemplate& o) const { return key == o.key && args == o.args; }
};

// The game root. There is exactly one, registered first.
struct GameInfo {
  Id id{kInvalidId};
  int turn{1};
  Id current_player_id{kInvalidId};

  // Once-per-game flag for the power transfer rule.
  bool power_transfer_done{false};

  bool game_over{false};
  Id winner_id{kInvalidId};
};

struct Player {
  Id id{kInvalidId};
  std::string name;
  std::string nation;
  PlayerControl control{PlayerControl::Human};

  // Royal expeditionary force. Never scored for the power transfer rule and
  // only counted by the defeat-REF victory condition.
  bool is_ref{false};
  bool is_independent{false};

  bool dead{false};
  int gold{0};

  // Position in the fixed join order (0-based).
  int join_index{0};

  // Tiles this player has ever seen. Current line of sight is derived from
  // units and settlements at query time.
  std::vector<Id> explored_tiles;
};

struct Tile {
  Id id{kInvalidId};
  int x{0};
  int y{0};
  std::string terrain;

  // Land claim. Weak: a disposed owner leaves a dangling id that the
  // integrity checker clears.
  Id owner_id{kInvalidId};

  // Cached; derivable from GameState::settlements.
  Id settlement_id{kInvalidId};
};

struct Unit {
  Id id{kInvalidId};
  std::string type_id;
  Id owner_id{kInvalidId};

  // Containment parent: a Tile, a carrier Unit or a Settlement.
  Id location_id{kInvalidId};

  int moves_left{0};
  int hit_points{1};
  GoodsMap cargo;
};

struct Settlement {
  Id id{kInvalidId};
  std::string name;
  Id owner_id{kInvalidId};
  Id tile_id{kInvalidId};

  int population{1};
  int production_bonus{0};
  GoodsMap goods;
  int founded_turn{0};
};

struct Building {
  Id id{kInvalidId};
  std::string type_id;
  Id settlement_id{kInvalidId};
  int level{1};
};

// AI bookkeeping: a request that goods be delivered to a location.
struct Wish {
  Id id{kInvalidId};
  Id player_id{kInvalidId};

  // Weak references, resolved through the registry.
  Id destination_id{kInvalidId};
  Id transportable_id{kInvalidId};

  std::string goods_type;
  int amount{0};
};

// AI bookkeeping: what a unit is currently trying to do.
struct Mission {
  Id id{kInvalidId};
  Id unit_id{kInvalidId};
  std::string mission_type;

  // Weak reference (transportable unit or destination).
  Id target_id{kInvalidId};
};

// Global events recorded in the game's history log.
enum class HistoryEventType : std::uint8_t {
  PowerTransfer = 0,
  PlayerKilled = 1,
  Victory = 2,
};

struct HistoryEvent {
  std::uint64_t seq{0};
  int turn{0};
  HistoryEventType type{HistoryEventType::PowerTransfer};
  StringTemplate text;
};

const char* entity_kind_name(EntityKind k);
bool entity_kind_from_name(const std::string& s, EntityKind& out);

const char* history_event_type_name(HistoryEventType t);
bool history_event_type_from_name(const std::string& s, HistoryEventType& out);

} // namespace colonia
