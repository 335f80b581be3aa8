#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "colonia/core/ai.h"
#include "colonia/core/scenario.h"
#include "colonia/core/session.h"
#include "log_capture.h"
#include "test_world.h"

#define COLONIA_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

using colonia::ActionRequest;
using colonia::ClientMirror;
using colonia::Deadline;
using colonia::Id;

// Sleeps past any reasonable deadline, then asks to disband every unit it sees.
class SlowAi final : public colonia::AiPlanner {
 public:
  std::vector<ActionRequest> plan(const ClientMirror& view, Id player, const Deadline&) override {
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    std::vector<ActionRequest> out;
    for (Id uid : view.ids_of_kind(colonia::EntityKind::Unit)) {
      ActionRequest req;
      req.player = player;
      req.verb = "disband";
      req.params["unit"] = uid;
      out.push_back(req);
    }
    return out;
  }
  std::string name() const override { return "slow"; }
};

class BrokenAi final : public colonia::AiPlanner {
 public:
  std::vector<ActionRequest> plan(const ClientMirror&, Id, const Deadline&) override {
    throw std::runtime_error("planner exploded");
  }
  std::string name() const override { return "broken"; }
};

} // namespace

int test_ai() {
  using namespace colonia;
  using namespace colonia::testworld;

  const Rules rules = make_default_rules();

  // Deadlines.
  {
    const Deadline generous(std::chrono::milliseconds(10000));
    COLONIA_ASSERT(!generous.expired());
    COLONIA_ASSERT(generous.remaining().count() > 0);
    const Deadline none(std::chrono::milliseconds(0));
    COLONIA_ASSERT(none.expired());
    COLONIA_ASSERT(none.remaining().count() == 0);
  }

  // The explorer plans from its mirror only.
  {
    GameState s = make_flat_world(12, 12, 2);
    const Id dutch = player_at(s, 0);
    const Id colonist = add_unit(s, dutch, tile_at(s, 6, 6), "free_colonist");
    const Id scout = add_unit(s, dutch, tile_at(s, 2, 2), "scout", 4);
    add_unit(s, player_at(s, 1), tile_at(s, 10, 10), "soldier");
    explore(s, dutch, 6, 6, 1);
    explore(s, dutch, 2, 2, 2);

    GameConfig cfg;
    cfg.ai_rounds_per_drive = 0;
    GameSession session(std::move(s), rules, cfg);
    session.attach_ai(dutch, std::make_unique<ExplorerAi>(rules));
    session.start();

    const auto view = session.ai_view(dutch);
    COLONIA_ASSERT(view.has_value());
    COLONIA_ASSERT(view->last_seq() >= 1);
    COLONIA_ASSERT(view->ids_of_kind(EntityKind::Tile).size() == 9 + 25);
    COLONIA_ASSERT(view->dangling_references().empty());
    COLONIA_ASSERT(!session.ai_view(player_at(session.snapshot(), 1)).has_value());

    ExplorerAi explorer(rules);
    const auto plan = explorer.plan(*view, dutch, Deadline(std::chrono::milliseconds(10000)));
    COLONIA_ASSERT(plan.size() == 2);
    COLONIA_ASSERT(plan[0].verb == "found_settlement");
    COLONIA_ASSERT(plan[0].params.at("unit").int_value() == static_cast<std::int64_t>(colonist));
    COLONIA_ASSERT(plan[0].params.at("name").string_value() == "Dutch colonies Landing");
    COLONIA_ASSERT(plan[1].verb == "move");
    COLONIA_ASSERT(plan[1].params.at("unit").int_value() == static_cast<std::int64_t>(scout));

    for (const auto& req : plan) {
      const UpdateBatch reply = session.submit(req);
      COLONIA_ASSERT(!reply.rejection.has_value());
    }
    const GameState after = session.snapshot();
    COLONIA_ASSERT(after.settlements.size() == 1);
    COLONIA_ASSERT(after.units.at(scout).moves_left == 3);

    // A second plan does not found again.
    const auto next = explorer.plan(*session.ai_view(dutch), dutch, Deadline(std::chrono::milliseconds(10000)));
    for (const auto& req : next) COLONIA_ASSERT(req.verb != "found_settlement");

    // An expired deadline yields no moves.
    const auto rushed = explorer.plan(*session.ai_view(dutch), dutch, Deadline(std::chrono::milliseconds(0)));
    for (const auto& req : rushed) COLONIA_ASSERT(req.verb != "move");
  }

  // A plan that misses its deadline is discarded and the player passes.
  {
    GameState s = make_flat_world(8, 8, 2);
    const Id dutch = player_at(s, 0);
    const Id english = player_at(s, 1);
    const Id soldier = add_unit(s, dutch, tile_at(s, 3, 3), "soldier");
    add_unit(s, english, tile_at(s, 6, 6), "soldier");

    GameConfig cfg;
    cfg.ai_plan_timeout_ms = 5;
    cfg.ai_rounds_per_drive = 0;
    GameSession session(std::move(s), rules, cfg);
    session.attach_ai(dutch, std::make_unique<SlowAi>());

    LogCapture capture;
    session.start();
    session.run_ai_rounds(1);
    COLONIA_ASSERT(capture.contains("slow AI for player"));
    COLONIA_ASSERT(capture.contains("exceeded 5 ms, passing"));
    COLONIA_ASSERT(session.snapshot().units.count(soldier) == 1);
    COLONIA_ASSERT(session.current_player() == english);
    COLONIA_ASSERT(session.phase() == TurnPhase::AwaitingActions);
  }

  // A planner that throws is logged and passes too.
  {
    GameState s = make_flat_world(8, 8, 2);
    const Id dutch = player_at(s, 0);
    add_unit(s, dutch, tile_at(s, 3, 3), "soldier");
    add_unit(s, player_at(s, 1), tile_at(s, 6, 6), "soldier");

    GameConfig cfg;
    GameSession session(std::move(s), rules, cfg);
    session.attach_ai(dutch, std::make_unique<BrokenAi>());

    LogCapture capture;
    session.start();
    COLONIA_ASSERT(capture.contains("planner exploded"));
    COLONIA_ASSERT(session.current_player() != dutch);

    bool threw = false;
    try {
      session.attach_ai(dutch, nullptr);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    COLONIA_ASSERT(threw);
  }

  // An all-AI game runs whole turns on its own.
  {
    ScenarioConfig sc;
    sc.width = 20;
    sc.height = 14;
    sc.players = 4;
    sc.seed = 7;
    GameConfig cfg;
    cfg.ai_rounds_per_drive = 0;
    GameState s = make_scenario(sc, rules, cfg);
    const std::vector<Id> order = s.player_order;

    GameSession session(std::move(s), rules, cfg);
    for (Id pid : order) session.attach_ai(pid, std::make_unique<ExplorerAi>(rules));
    session.start();
    COLONIA_ASSERT(session.turn() == 1);
    session.run_ai_rounds(5);
    COLONIA_ASSERT(session.turn() == 6);
    COLONIA_ASSERT(session.current_player() == order.front());
    COLONIA_ASSERT(session.check_integrity(false).clean());

    const GameState after = session.snapshot();
    COLONIA_ASSERT(!after.settlements.empty());
    for (Id pid : order) {
      const auto view = session.ai_view(pid);
      COLONIA_ASSERT(view.has_value());
      COLONIA_ASSERT(view->dangling_references().empty());
      COLONIA_ASSERT(view->turn() == 6);
      COLONIA_ASSERT(view->current_player() == order.front());
      // Nothing an observer holds is unknown to the server.
      for (const auto& [id, _] : view->entities()) COLONIA_ASSERT(after.kinds.count(id) == 1);
    }
  }
  return 0;
}
