#include "colonia/core/serialization.h"

#include <algorithm>
#include <stdexcept>

#include "colonia/core/entity_codec.h"
#include "colonia/util/file_io.h"
#include "colonia/util/strings.h"

namespace colonia {
namespace {

using json::Array;
using json::Object;
using json::Value;

Value history_to_json(const HistoryEvent& ev) {
  Object args;
  for (const auto& [k, v] : ev.text.args) args[k] = v;
  Object o;
  o["seq"] = ev.seq;
  o["turn"] = ev.turn;
  o["type"] = history_event_type_name(ev.type);
  o["key"] = ev.text.key;
  o["args"] = std::move(args);
  return o;
}

HistoryEvent history_from_json(const Value& v) {
  const Object& o = v.object();
  HistoryEvent ev;
  ev.seq = static_cast<std::uint64_t>(v.at("seq").int_value());
  ev.turn = static_cast<int>(v.at("turn").int_value());
  const std::string type = v.at("type").string_value();
  if (!history_event_type_from_name(type, ev.type)) {
    throw std::runtime_error("unknown history event type '" + type + "'");
  }
  ev.text.key = v.at("key").string_value();
  if (auto it = o.find("args"); it != o.end()) {
    for (const auto& [k, a] : it->second.object()) ev.text.add(k, a.string_value());
  }
  return ev;
}

std::vector<Id> id_array(const Value& v, const char* what) {
  std::vector<Id> out;
  for (const auto& e : v.array()) {
    if (!e.is_int() || e.int_value() <= 0) throw std::runtime_error(concat(what, ": invalid id"));
    out.push_back(static_cast<Id>(e.int_value()));
  }
  return out;
}

} // namespace

json::Value serialize_game_to_json_value(const GameState& s) {
  Object root;
  root["save_version"] = s.save_version;
  root["next_id"] = s.next_id;
  root["map_width"] = s.map_width;
  root["map_height"] = s.map_height;
  root["rng_state"] = static_cast<std::int64_t>(s.rng_state);
  root["next_history_seq"] = s.next_history_seq;

  Array order;
  for (Id pid : s.player_order) order.push_back(pid);
  root["player_order"] = std::move(order);

  std::vector<Id> disposed(s.disposed.begin(), s.disposed.end());
  std::sort(disposed.begin(), disposed.end());
  Array tomb;
  for (Id id : disposed) tomb.push_back(id);
  root["disposed"] = std::move(tomb);

  std::vector<std::pair<Id, EntityKind>> entities(s.kinds.begin(), s.kinds.end());
  std::sort(entities.begin(), entities.end());
  Array ents;
  ents.reserve(entities.size());
  for (const auto& [id, kind] : entities) {
    Object e;
    e["id"] = id;
    e["kind"] = entity_kind_name(kind);
    e["data"] = codec_for(kind).encode(s, id);
    ents.push_back(std::move(e));
  }
  root["entities"] = std::move(ents);

  Array history;
  for (const auto& ev : s.history) history.push_back(history_to_json(ev));
  root["history"] = std::move(history);
  return root;
}

std::string serialize_game_to_json(const GameState& s) { return json::stringify(serialize_game_to_json_value(s), 2); }

GameState deserialize_game_from_json(const std::string& json_text) {
  const Value root = json::parse(json_text);
  const Object& o = root.object();

  const Value* version = root.find("save_version");
  if (!version || !version->is_int()) throw std::runtime_error("save: missing save_version");
  const int v = static_cast<int>(version->int_value());
  if (v < 1 || v > kCurrentSaveVersion) {
    throw std::runtime_error(concat("save: unsupported save_version ", v, " (this build reads up to ",
                                    kCurrentSaveVersion, ")"));
  }

  GameState s;
  s.save_version = v;
  s.next_id = static_cast<Id>(root.at("next_id").int_value(1));
  s.map_width = static_cast<int>(root.at("map_width").int_value());
  s.map_height = static_cast<int>(root.at("map_height").int_value());
  s.rng_state = static_cast<std::uint64_t>(root.at("rng_state").int_value(1));
  if (auto it = o.find("next_history_seq"); it != o.end()) {
    s.next_history_seq = static_cast<std::uint64_t>(it->second.int_value(1));
  }
  s.player_order = id_array(root.at("player_order"), "player_order");
  for (Id id : id_array(root.at("disposed"), "disposed")) s.disposed.insert(id);

  Id max_id = 0;
  bool saw_game = false;
  for (const auto& ev : root.at("entities").array()) {
    const Value& idv = ev.at("id");
    if (!idv.is_int() || idv.int_value() <= 0) throw std::runtime_error("save: entity with invalid id");
    const Id id = static_cast<Id>(idv.int_value());
    EntityKind kind;
    const std::string kind_name = ev.at("kind").string_value();
    if (!entity_kind_from_name(kind_name, kind)) {
      throw std::runtime_error(concat("save: entity ", id, " has unknown kind '", kind_name, "'"));
    }
    if (s.kinds.count(id)) throw std::runtime_error(concat("save: duplicate entity id ", id));
    if (s.disposed.count(id)) throw std::runtime_error(concat("save: entity ", id, " is also marked disposed"));
    if (kind == EntityKind::Game) {
      if (saw_game) throw std::runtime_error("save: more than one game entity");
      saw_game = true;
    }
    codec_for(kind).decode(s, id, ev.at("data").object());
    max_id = std::max(max_id, id);
  }
  if (!saw_game) throw std::runtime_error("save: no game entity");

  for (Id id : s.disposed) max_id = std::max(max_id, id);
  if (s.next_id <= max_id) throw std::runtime_error(concat("save: next_id ", s.next_id, " would reuse id ", max_id));

  for (Id pid : s.player_order) {
    if (!s.players.count(pid)) throw std::runtime_error(concat("save: player_order names unknown player ", pid));
  }

  s.tile_grid.assign(static_cast<std::size_t>(std::max(0, s.map_width)) *
                         static_cast<std::size_t>(std::max(0, s.map_height)),
                     kInvalidId);
  for (const auto& [tid, t] : s.tiles) {
    if (t.x < 0 || t.y < 0 || t.x >= s.map_width || t.y >= s.map_height) {
      throw std::runtime_error(concat("save: tile ", tid, " is outside the map"));
    }
    s.tile_grid[static_cast<std::size_t>(t.y) * static_cast<std::size_t>(s.map_width) +
                static_cast<std::size_t>(t.x)] = tid;
  }

  for (const auto& ev : root.at("history").array()) s.history.push_back(history_from_json(ev));
  return s;
}

void save_game_file(const GameState& state, const std::string& path) {
  write_text_file(path, serialize_game_to_json(state));
}

GameState load_game_file(const std::string& path) {
  try {
    return deserialize_game_from_json(read_text_file(path));
  } catch (const std::exception& e) {
    throw std::runtime_error(path + ": " + e.what());
  }
}

} // namespace colonia
