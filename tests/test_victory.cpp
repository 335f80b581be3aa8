#include <iostream>

#include "colonia/core/errors.h"
#include "colonia/core/turn_engine.h"
#include "test_world.h"

#define COLONIA_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_victory() {
  using namespace colonia;
  using namespace colonia::testworld;

  const Rules rules = make_default_rules();
  const GameConfig cfg;

  // Last player standing.
  {
    GameState s = make_flat_world(8, 8, 3);
    const Id dutch = player_at(s, 0);
    const Id english = player_at(s, 1);
    const Id french = player_at(s, 2);
    add_unit(s, dutch, tile_at(s, 1, 1), "soldier");
    add_unit(s, english, tile_at(s, 6, 6), "soldier");
    EntityRegistry reg(s);
    TurnEngine engine(reg, rules, cfg);

    ChangeSet cs;
    ChangeScope scope(reg, cs);
    engine.start(cs);
    COLONIA_ASSERT(!engine.check_victory(cs));

    engine.kill_player(cs, french, "test");
    COLONIA_ASSERT(!engine.check_victory(cs));
    engine.kill_player(cs, english, "test");
    COLONIA_ASSERT(s.units.size() == 1);
    COLONIA_ASSERT(engine.check_victory(cs));
    COLONIA_ASSERT(s.game.game_over);
    COLONIA_ASSERT(s.game.winner_id == dutch);
    COLONIA_ASSERT(engine.phase() == TurnPhase::Terminated);
    COLONIA_ASSERT(s.history.back().type == HistoryEventType::Victory);

    bool threw = false;
    try {
      engine.end_turn(cs);
    } catch (const ValidationError&) {
      threw = true;
    }
    COLONIA_ASSERT(threw);

    // A reloaded finished game starts out terminated.
    TurnEngine reloaded(reg, rules, cfg);
    COLONIA_ASSERT(reloaded.phase() == TurnPhase::Terminated);
  }

  // Nobody left at all.
  {
    GameState s = make_flat_world(8, 8, 2);
    EntityRegistry reg(s);
    TurnEngine engine(reg, rules, cfg);
    ChangeSet cs;
    ChangeScope scope(reg, cs);
    engine.kill_player(cs, player_at(s, 0), "test");
    engine.kill_player(cs, player_at(s, 1), "test");
    COLONIA_ASSERT(engine.check_victory(cs));
    COLONIA_ASSERT(s.game.game_over);
    COLONIA_ASSERT(s.game.winner_id == kInvalidId);
    bool over = false;
    for (const auto& c : cs.sorted()) {
      if (c.kind == ChangeKind::Message && c.message.key == "model.game.over") over = true;
    }
    COLONIA_ASSERT(over);
  }

  // A single colonial player next to the REF has not won anything.
  {
    GameState s = make_flat_world(8, 8, 2);
    s.players.at(player_at(s, 1)).is_ref = true;
    EntityRegistry reg(s);
    TurnEngine engine(reg, rules, cfg);
    ChangeSet cs;
    COLONIA_ASSERT(!engine.check_victory(cs));
    COLONIA_ASSERT(!s.game.game_over);
  }

  // Last human standing.
  {
    GameConfig humans = cfg;
    humans.victory.last_player_standing = false;
    humans.victory.last_human_standing = true;
    GameState s = make_flat_world(8, 8, 3, PlayerControl::Human);
    const Id dutch = player_at(s, 0);
    const Id english = player_at(s, 1);
    s.players.at(player_at(s, 2)).control = PlayerControl::AI;
    EntityRegistry reg(s);
    TurnEngine engine(reg, rules, humans);
    ChangeSet cs;
    ChangeScope scope(reg, cs);
    COLONIA_ASSERT(!engine.check_victory(cs));
    engine.kill_player(cs, dutch, "test");
    COLONIA_ASSERT(engine.check_victory(cs));
    COLONIA_ASSERT(s.game.winner_id == english);
  }

  // Independence beats everything else.
  {
    GameState s = make_flat_world(8, 8, 3);
    const Id french = player_at(s, 2);
    s.players.at(french).is_independent = true;
    EntityRegistry reg(s);
    TurnEngine engine(reg, rules, cfg);
    ChangeSet cs;
    COLONIA_ASSERT(engine.check_victory(cs));
    COLONIA_ASSERT(s.game.winner_id == french);

    GameConfig no_ref = cfg;
    no_ref.victory.defeat_ref = false;
    GameState t = make_flat_world(8, 8, 3);
    t.players.at(player_at(t, 2)).is_independent = true;
    EntityRegistry treg(t);
    TurnEngine other(treg, rules, no_ref);
    ChangeSet cs2;
    COLONIA_ASSERT(!other.check_victory(cs2));
  }

  // Victory reached while ending a turn.
  {
    GameState s = make_flat_world(8, 8, 2);
    const Id dutch = player_at(s, 0);
    add_unit(s, dutch, tile_at(s, 2, 2), "soldier");
    s.game.current_player_id = player_at(s, 1);
    EntityRegistry reg(s);
    TurnEngine engine(reg, rules, cfg);
    ChangeSet cs;
    ChangeScope scope(reg, cs);
    engine.start(cs);
    COLONIA_ASSERT(engine.end_turn(cs));
    COLONIA_ASSERT(s.players.at(player_at(s, 1)).dead);
    COLONIA_ASSERT(s.game.winner_id == dutch);
    COLONIA_ASSERT(engine.phase() == TurnPhase::Terminated);
  }
  return 0;
}
