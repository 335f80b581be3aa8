#include "colonia/core/entities.h"

namespace colonia {

const char* entity_kind_name(EntityKind k) {
  switch (k) {
    case EntityKind::Game: return "game";
    case EntityKind::Player: return "player";
    case EntityKind::Tile: return "tile";
    case EntityKind::Unit: return "unit";
    case EntityKind::Settlement: return "settlement";
    case EntityKind::Building: return "building";
    case EntityKind::Wish: return "wish";
    case EntityKind::Mission: return "mission";
  }
  return "unknown";
}

bool entity_kind_from_name(const std::string& s, EntityKind& out) {
  if (s == "game") out = EntityKind::Game;
  else if (s == "player") out = EntityKind::Player;
  else if (s == "tile") out = EntityKind::Tile;
  else if (s == "unit") out = EntityKind::Unit;
  else if (s == "settlement") out = EntityKind::Settlement;
  else if (s == "building") out = EntityKind::Building;
  else if (s == "wish") out = EntityKind::Wish;
  else if (s == "mission") out = EntityKind::Mission;
  else return false;
  return true;
}

const char* history_event_type_name(HistoryEventType t) {
  switch (t) {
    case HistoryEventType::PowerTransfer: return "power_transfer";
    case HistoryEventType::PlayerKilled: return "player_killed";
    case HistoryEventType::Victory: return "victory";
  }
  return "power_transfer";
}

bool history_event_type_from_name(const std::string& s, HistoryEventType& out) {
  if (s == "power_transfer") out = HistoryEventType::PowerTransfer;
  else if (s == "player_killed") out = HistoryEventType::PlayerKilled;
  else if (s == "victory") out = HistoryEventType::Victory;
  else return false;
  return true;
}

} // namespace colonia
