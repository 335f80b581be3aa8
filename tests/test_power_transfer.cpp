#include <iostream>
#include <map>
#include <memory>

#include "colonia/core/turn_engine.h"
#include "test_world.h"

#define COLONIA_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

class FixedScores final : public colonia::ScoringPolicy {
 public:
  explicit FixedScores(std::map<colonia::Id, int> scores) : scores_(std::move(scores)) {}

  int score(const colonia::EntityRegistry&, const colonia::Rules&, colonia::Id player) const override {
    auto it = scores_.find(player);
    return it == scores_.end() ? 0 : it->second;
  }

 private:
  std::map<colonia::Id, int> scores_;
};

} // namespace

int test_power_transfer() {
  using namespace colonia;
  using namespace colonia::testworld;

  const Rules rules = make_default_rules();
  GameConfig cfg;
  cfg.power_transfer.min_turn = 2;

  {
    GameState s = make_flat_world(12, 12, 3);
    const Id dutch = player_at(s, 0);
    const Id english = player_at(s, 1);
    const Id french = player_at(s, 2);
    add_unit(s, dutch, tile_at(s, 1, 1), "soldier");
    add_unit(s, french, tile_at(s, 1, 10), "soldier");
    const Id town = add_settlement(s, english, tile_at(s, 9, 9), "Jamestown", 3);
    const Id colonist = add_unit(s, english, town, "free_colonist");
    const Id scout = add_unit(s, english, tile_at(s, 9, 8), "scout", 4);
    s.tiles.at(tile_at(s, 10, 9)).owner_id = english;

    EntityRegistry reg(s);
    Wish w;
    w.player_id = english;
    w.destination_id = town;
    w.goods_type = "tools";
    w.amount = 10;
    const Id wish = reg.register_wish(w);
    Mission m;
    m.unit_id = scout;
    m.mission_type = "explore";
    const Id mission = reg.register_mission(m);

    TurnEngine engine(reg, rules, cfg);
    engine.set_scoring_policy(std::make_unique<FixedScores>(std::map<Id, int>{{dutch, 120}, {english, 10}, {french, 60}}));

    // Too early.
    {
      ChangeSet cs;
      ChangeScope scope(reg, cs);
      COLONIA_ASSERT(!engine.run_power_transfer(cs));
      COLONIA_ASSERT(cs.empty());
    }

    s.game.turn = 2;
    ChangeSet cs;
    {
      ChangeScope scope(reg, cs);
      COLONIA_ASSERT(engine.run_power_transfer(cs));
    }
    COLONIA_ASSERT(s.game.power_transfer_done);
    COLONIA_ASSERT(s.settlements.at(town).owner_id == dutch);
    COLONIA_ASSERT(s.settlements.at(town).population == 3);
    COLONIA_ASSERT(s.units.at(colonist).owner_id == dutch);
    COLONIA_ASSERT(s.units.at(scout).owner_id == dutch);
    COLONIA_ASSERT(s.missions.count(mission) == 1);
    COLONIA_ASSERT(s.tiles.at(tile_at(s, 10, 9)).owner_id == dutch);
    COLONIA_ASSERT(s.tiles.at(tile_at(s, 9, 9)).owner_id == dutch);
    COLONIA_ASSERT(s.players.at(english).dead);
    COLONIA_ASSERT(!s.players.at(french).dead);
    COLONIA_ASSERT(s.wishes.count(wish) == 0);
    COLONIA_ASSERT(has_explored(s.players.at(dutch), tile_at(s, 9, 9)));

    COLONIA_ASSERT(s.history.size() == 2);
    COLONIA_ASSERT(s.history[0].type == HistoryEventType::PowerTransfer);
    COLONIA_ASSERT(s.history[1].type == HistoryEventType::PlayerKilled);

    int transfers = 0;
    bool announced = false;
    for (const auto& c : cs.sorted()) {
      if (c.kind == ChangeKind::OwnerChange) {
        ++transfers;
        COLONIA_ASSERT(c.old_owner == english);
        COLONIA_ASSERT(c.new_owner == dutch);
        COLONIA_ASSERT(c.priority == ChangePriority::Ownership);
      }
      if (c.kind == ChangeKind::Message && c.message.key == "model.diplomacy.powerTransfer") {
        announced = true;
        COLONIA_ASSERT(c.see.includes_all());
      }
    }
    COLONIA_ASSERT(transfers == 3);
    COLONIA_ASSERT(announced);

    // Once per game.
    ChangeSet again;
    ChangeScope scope(reg, again);
    COLONIA_ASSERT(!engine.run_power_transfer(again));
    COLONIA_ASSERT(s.history.size() == 2);
  }

  // Humans never take part in the transfer, and nobody weak enough means no transfer.
  {
    GameState s = make_flat_world(8, 8, 3);
    const Id dutch = player_at(s, 0);
    const Id english = player_at(s, 1);
    const Id french = player_at(s, 2);
    s.players.at(english).control = PlayerControl::Human;
    s.game.turn = 5;
    EntityRegistry reg(s);
    TurnEngine engine(reg, rules, cfg);
    engine.set_scoring_policy(std::make_unique<FixedScores>(std::map<Id, int>{{dutch, 95}, {english, 0}, {french, 70}}));

    ChangeSet cs;
    ChangeScope scope(reg, cs);
    COLONIA_ASSERT(!engine.run_power_transfer(cs));
    COLONIA_ASSERT(!s.game.power_transfer_done);
    COLONIA_ASSERT(!s.players.at(english).dead);
  }

  // Disabled by configuration.
  {
    GameConfig off = cfg;
    off.power_transfer.enabled = false;
    GameState s = make_flat_world(8, 8, 2);
    s.game.turn = 50;
    EntityRegistry reg(s);
    TurnEngine engine(reg, rules, off);
    engine.set_scoring_policy(std::make_unique<FixedScores>(std::map<Id, int>{{player_at(s, 0), 500}}));
    ChangeSet cs;
    COLONIA_ASSERT(!engine.run_power_transfer(cs));
  }

  // The default policy counts settlements, inhabitants, units and gold.
  {
    GameState s = make_flat_world(8, 8, 1);
    const Id dutch = player_at(s, 0);
    add_settlement(s, dutch, tile_at(s, 3, 3), "Fort Orange", 2);
    add_unit(s, dutch, tile_at(s, 1, 1), "soldier");
    s.players.at(dutch).gold = 550;
    EntityRegistry reg(s);
    AssetScoringPolicy policy;
    COLONIA_ASSERT(policy.score(reg, rules, dutch) == 10 + 20 + 2 + 5);
  }
  return 0;
}
