#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "colonia/core/change_set.h"
#include "colonia/core/registry.h"
#include "colonia/core/serialization.h"
#include "colonia/util/json.h"
#include "test_world.h"

#define COLONIA_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool load_throws(const std::string& text) {
  try {
    (void)colonia::deserialize_game_from_json(text);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

} // namespace

int test_serialization() {
  using namespace colonia;
  using namespace colonia::testworld;

  GameState s = make_flat_world(7, 5, 2);
  const Id dutch = player_at(s, 0);
  const Id english = player_at(s, 1);
  s.tiles.at(tile_at(s, 0, 0)).terrain = "ocean";
  const Id town = add_settlement(s, dutch, tile_at(s, 3, 2), "Fort Oranje", 2);
  s.settlements.at(town).goods["food"] = 17;
  const Id wagon = add_unit(s, dutch, town, "wagon_train", 2);
  s.units.at(wagon).cargo["tools"] = 40;
  const Id doomed = add_unit(s, english, tile_at(s, 6, 4), "soldier");
  explore(s, english, 6, 4, 1);
  s.rng_state = 0xfeedbeefULL;
  s.game.turn = 12;

  EntityRegistry reg(s);
  Wish w;
  w.player_id = dutch;
  w.destination_id = town;
  w.transportable_id = doomed;
  w.goods_type = "muskets";
  w.amount = 25;
  const Id wish = reg.register_wish(w);
  {
    ChangeSet cs;
    ChangeScope scope(reg, cs);
    reg.dispose(doomed);
  }
  HistoryEvent ev;
  ev.seq = s.next_history_seq++;
  ev.turn = 11;
  ev.type = HistoryEventType::PlayerKilled;
  ev.text.key = "model.player.dead";
  ev.text.add("%nation%", "English");
  s.history.push_back(ev);

  const std::string text = serialize_game_to_json(s);
  GameState loaded = deserialize_game_from_json(text);
  COLONIA_ASSERT(serialize_game_to_json(loaded) == text);

  COLONIA_ASSERT(loaded.next_id == s.next_id);
  COLONIA_ASSERT(loaded.disposed.count(doomed) == 1);
  COLONIA_ASSERT(loaded.rng_state == 0xfeedbeefULL);
  COLONIA_ASSERT(loaded.game.turn == 12);
  COLONIA_ASSERT(loaded.player_order == s.player_order);
  COLONIA_ASSERT(loaded.settlements.at(town).name == "Fort Oranje");
  COLONIA_ASSERT(loaded.settlements.at(town).goods.at("food") == 17);
  COLONIA_ASSERT(loaded.units.at(wagon).cargo.at("tools") == 40);
  COLONIA_ASSERT(loaded.units.at(wagon).location_id == town);
  COLONIA_ASSERT(tile_id_at(loaded, 3, 2) == tile_at(s, 3, 2));
  COLONIA_ASSERT(loaded.tiles.at(tile_at(s, 0, 0)).terrain == "ocean");
  COLONIA_ASSERT(loaded.players.at(english).explored_tiles == s.players.at(english).explored_tiles);
  COLONIA_ASSERT(loaded.history.size() == 1);
  COLONIA_ASSERT(loaded.history[0].text == ev.text);

  // Weak references issued before the save resolve the same way afterwards.
  EntityRegistry lreg(loaded);
  COLONIA_ASSERT(lreg.wish(wish)->destination_id == town);
  COLONIA_ASSERT(!lreg.unit(lreg.wish(wish)->transportable_id));
  COLONIA_ASSERT(lreg.is_disposed(doomed));

  // Fresh ids continue past everything ever issued.
  Unit fresh;
  fresh.type_id = "soldier";
  fresh.owner_id = dutch;
  fresh.location_id = tile_at(s, 1, 1);
  const Id fresh_id = lreg.register_unit(fresh);
  COLONIA_ASSERT(fresh_id == s.next_id);
  COLONIA_ASSERT(fresh_id > doomed);

  // Version checks.
  {
    json::Value root = serialize_game_to_json_value(s);
    (*root.as_object())["save_version"] = kCurrentSaveVersion + 1;
    COLONIA_ASSERT(load_throws(json::stringify(root, 0)));
    root.as_object()->erase("save_version");
    COLONIA_ASSERT(load_throws(json::stringify(root, 0)));
  }
  {
    json::Value root = serialize_game_to_json_value(s);
    (*root.as_object())["next_id"] = 2;
    COLONIA_ASSERT(load_throws(json::stringify(root, 0)));
  }
  COLONIA_ASSERT(load_throws("{\"save_version\": 1"));
  COLONIA_ASSERT(load_throws("[]"));

  // Files.
  const std::filesystem::path dir = std::filesystem::temp_directory_path() / "colonia_test_serialization";
  std::filesystem::remove_all(dir);
  const std::string path = (dir / "saves" / "turn12.json").string();
  save_game_file(s, path);
  COLONIA_ASSERT(std::filesystem::exists(path));
  const GameState from_disk = load_game_file(path);
  COLONIA_ASSERT(serialize_game_to_json(from_disk) == text);

  bool missing_threw = false;
  try {
    (void)load_game_file((dir / "nope.json").string());
  } catch (const std::runtime_error& e) {
    missing_threw = std::string(e.what()).find("nope.json") != std::string::npos;
  }
  COLONIA_ASSERT(missing_threw);
  std::filesystem::remove_all(dir);
  return 0;
}
