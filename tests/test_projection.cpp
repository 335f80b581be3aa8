#include <iostream>
#include <memory>

#include "colonia/core/actions.h"
#include "colonia/core/client_mirror.h"
#include "colonia/core/connection.h"
#include "colonia/core/dispatcher.h"
#include "colonia/core/projection.h"
#include "test_world.h"

#define COLONIA_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

const colonia::ProjectedChange* find_change(const colonia::UpdateBatch& b, colonia::Id id) {
  for (const auto& c : b.changes) {
    if (c.id == id) return &c;
  }
  return nullptr;
}

colonia::ActionRequest move_request(colonia::Id player, colonia::Id unit, colonia::Id tile) {
  colonia::ActionRequest req;
  req.player = player;
  req.verb = "move";
  req.params["unit"] = unit;
  req.params["tile"] = tile;
  return req;
}

} // namespace

int test_projection() {
  using namespace colonia;
  using namespace colonia::testworld;

  const Rules rules = make_default_rules();
  const GameConfig cfg;

  GameState s = make_flat_world(20, 20, 2);
  const Id dutch = player_at(s, 0);
  const Id english = player_at(s, 1);

  const Id soldier = add_unit(s, dutch, tile_at(s, 9, 9), "soldier");
  explore(s, dutch, 9, 9, 0);
  const Id guard = add_unit(s, english, tile_at(s, 1, 1), "soldier");
  explore(s, english, 1, 1, 1);

  EntityRegistry reg(s);
  Dispatcher dispatcher(reg, rules, cfg);

  auto dutch_view = std::make_shared<ClientMirror>(dutch);
  auto english_view = std::make_shared<ClientMirror>(english);
  dispatcher.attach(dutch, std::make_shared<DirectConnection>([dutch_view](const std::string& m) { dutch_view->apply_wire(m); }));
  dispatcher.attach(english, std::make_shared<DirectConnection>([english_view](const std::string& m) { english_view->apply_wire(m); }));

  // Snapshots: each side sees its own unit and the tiles around it, not the rival's.
  COLONIA_ASSERT(dutch_view->last_seq() == 1);
  COLONIA_ASSERT(dutch_view->find(soldier) != nullptr);
  COLONIA_ASSERT(dutch_view->find(guard) == nullptr);
  COLONIA_ASSERT(dutch_view->find(tile_at(s, 9, 10)) != nullptr);
  COLONIA_ASSERT(english_view->find(soldier) == nullptr);
  COLONIA_ASSERT(english_view->find(english) != nullptr);
  COLONIA_ASSERT(english_view->find(dutch) != nullptr);
  COLONIA_ASSERT(english_view->find(reg.state().game.id) != nullptr);
  // Private fields never leave the server.
  COLONIA_ASSERT(english_view->find(dutch)->fields.count("gold") == 0);
  COLONIA_ASSERT(dutch_view->find(dutch)->fields.count("gold") == 1);
  COLONIA_ASSERT(dutch_view->find(dutch)->fields.count("explored_tiles") == 0);
  COLONIA_ASSERT(dutch_view->dangling_references().empty());
  COLONIA_ASSERT(english_view->dangling_references().empty());

  // Dutch soldier moves from (9,9) to the unexplored (9,10).
  {
    ChangeSet cs;
    ChangeScope scope(reg, cs);
    ActionContext ctx{reg, rules, cfg, cs};
    COLONIA_ASSERT(!perform_action(ctx, move_request(dutch, soldier, tile_at(s, 9, 10))).has_value());
    const UpdateBatch reply = dispatcher.dispatch(cs, dutch);

    COLONIA_ASSERT(reply.seq == 2);
    const ProjectedChange* unit = find_change(reply, soldier);
    const ProjectedChange* from = find_change(reply, tile_at(s, 9, 9));
    const ProjectedChange* to = find_change(reply, tile_at(s, 9, 10));
    COLONIA_ASSERT(unit && unit->op == ChangeKind::UpdateFull);
    COLONIA_ASSERT(from && from->op == ChangeKind::UpdateFull);
    COLONIA_ASSERT(to && to->op == ChangeKind::UpdateFull);
    COLONIA_ASSERT(unit->data.at("location_id").int_value() == static_cast<std::int64_t>(tile_at(s, 9, 10)));
    // Tiles that just came into sight arrive as adds.
    const ProjectedChange* fresh = find_change(reply, tile_at(s, 9, 11));
    COLONIA_ASSERT(fresh && fresh->op == ChangeKind::Add);
  }
  // The rival has no contact and receives nothing for that operation.
  COLONIA_ASSERT(english_view->last_seq() == 1);
  COLONIA_ASSERT(dutch_view->last_seq() == 2);
  COLONIA_ASSERT(dutch_view->int_field(soldier, "location_id") == static_cast<std::int64_t>(tile_at(s, 9, 10)));
  COLONIA_ASSERT(dutch_view->dangling_references().empty());

  // A unit entering the rival's sight is introduced; leaving it withdraws it.
  const Id scout = add_unit(s, dutch, tile_at(s, 3, 2), "soldier", 2);
  {
    ChangeSet cs;
    ChangeScope scope(reg, cs);
    ActionContext ctx{reg, rules, cfg, cs};
    COLONIA_ASSERT(!perform_action(ctx, move_request(dutch, scout, tile_at(s, 2, 2))).has_value());
    dispatcher.dispatch(cs, dutch);
  }
  COLONIA_ASSERT(english_view->last_seq() == 2);
  COLONIA_ASSERT(english_view->find(scout) != nullptr);
  COLONIA_ASSERT(english_view->find(scout)->kind == EntityKind::Unit);
  COLONIA_ASSERT(english_view->int_field(scout, "owner_id") == static_cast<std::int64_t>(dutch));
  COLONIA_ASSERT(english_view->dangling_references().empty());

  {
    ChangeSet cs;
    ChangeScope scope(reg, cs);
    ActionContext ctx{reg, rules, cfg, cs};
    COLONIA_ASSERT(!perform_action(ctx, move_request(dutch, scout, tile_at(s, 3, 2))).has_value());
    dispatcher.dispatch(cs, dutch);
  }
  COLONIA_ASSERT(english_view->last_seq() == 3);
  COLONIA_ASSERT(english_view->find(scout) == nullptr);
  COLONIA_ASSERT(english_view->dangling_references().empty());

  // Removal of something an observer never knew is not delivered to it.
  {
    ChangeSet cs;
    ChangeScope scope(reg, cs);
    reg.dispose(scout);
    dispatcher.dispatch(cs, kInvalidId);
  }
  COLONIA_ASSERT(english_view->last_seq() == 3);
  COLONIA_ASSERT(dutch_view->find(scout) == nullptr);

  // Weak references follow the same rules: a visible target is introduced,
  // a hidden one arrives as kInvalidId.
  {
    const Id town = add_settlement(s, english, tile_at(s, 10, 10), "Jamestown");
    Building hall;
    hall.type_id = "town_hall";
    hall.settlement_id = town;
    const Id hall_id = reg.register_building(hall);

    Mission m;
    m.unit_id = soldier;
    m.mission_type = "spy";
    m.target_id = hall_id;
    const Id mission = reg.register_mission(m);
    Wish w;
    w.player_id = dutch;
    w.destination_id = town;
    w.goods_type = "tools";
    w.amount = 10;
    const Id wish = reg.register_wish(w);

    ChangeSet cs;
    cs.append(ChangeKind::Add, reg.ref(mission), ChangePriority::State, See::only_owner());
    cs.append(ChangeKind::Add, reg.ref(wish), ChangePriority::State, See::only_owner());
    dispatcher.dispatch(cs, kInvalidId);

    COLONIA_ASSERT(dutch_view->find(mission) != nullptr);
    COLONIA_ASSERT(dutch_view->int_field(mission, "target_id", -1) == 0);
    COLONIA_ASSERT(dutch_view->find(hall_id) == nullptr);
    COLONIA_ASSERT(dutch_view->find(town) != nullptr);
    COLONIA_ASSERT(dutch_view->int_field(wish, "destination_id") == static_cast<std::int64_t>(town));
    COLONIA_ASSERT(dutch_view->dangling_references().empty());
  }

  // A mirror holding a weak reference it was never told about reports it.
  {
    ClientMirror leaky(dutch);
    UpdateBatch b;
    b.seq = 1;
    b.observer = dutch;
    ProjectedChange pc;
    pc.op = ChangeKind::Add;
    pc.id = 500;
    pc.kind = EntityKind::Mission;
    pc.data["unit_id"] = kInvalidId;
    pc.data["target_id"] = Id{501};
    b.changes.push_back(pc);
    leaky.apply(b);
    COLONIA_ASSERT(leaky.dangling_references().size() == 1);
  }

  // Replaying the projection state: the observer state tracks the mirror.
  const ObserverState* dutch_state = dispatcher.observer_state(dutch);
  COLONIA_ASSERT(dutch_state != nullptr);
  COLONIA_ASSERT(dutch_state->known.size() == dutch_view->entities().size());
  COLONIA_ASSERT(dutch_state->next_seq == dutch_view->last_seq() + 1);

  return 0;
}
