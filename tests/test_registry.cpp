#include <iostream>
#include <string>

#include "colonia/core/change_set.h"
#include "colonia/core/errors.h"
#include "colonia/core/registry.h"
#include "test_world.h"

#define COLONIA_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_registry() {
  using namespace colonia;
  using namespace colonia::testworld;

  GameState s = make_flat_world(5, 5, 2);
  const Id dutch = player_at(s, 0);
  const Id english = player_at(s, 1);
  const Id home = tile_at(s, 2, 2);

  const Id sid = add_settlement(s, dutch, home, "Fort Oranje");
  const Id colonist = add_unit(s, dutch, sid, "free_colonist");
  const Id soldier = add_unit(s, dutch, home, "soldier");

  EntityRegistry reg(s);

  // Ids are allocated in order and never reused.
  COLONIA_ASSERT(reg.state().game.id == 1);
  COLONIA_ASSERT(dutch < english);
  COLONIA_ASSERT(sid < colonist);
  COLONIA_ASSERT(colonist < soldier);

  Building hall;
  hall.type_id = "town_hall";
  hall.settlement_id = sid;
  const Id hall_id = reg.register_building(hall);

  Mission m;
  m.unit_id = colonist;
  m.mission_type = "work";
  const Id mission_id = reg.register_mission(m);

  // Containment.
  COLONIA_ASSERT(reg.container_of(colonist) == sid);
  COLONIA_ASSERT(reg.container_of(sid) == home);
  COLONIA_ASSERT(reg.tile_of(mission_id) == home);
  COLONIA_ASSERT(reg.owner_of(hall_id) == dutch);
  COLONIA_ASSERT(reg.owner_of(mission_id) == dutch);
  COLONIA_ASSERT(reg.owner_of(dutch) == dutch);
  const auto contents = reg.contents_of(sid);
  COLONIA_ASSERT(contents.size() == 2);
  // Ascending ids: the colonist was registered before the hall.
  COLONIA_ASSERT(contents[0] == colonist);
  COLONIA_ASSERT(contents[1] == hall_id);

  const EntityRef r = reg.ref(colonist);
  COLONIA_ASSERT(r.kind == EntityKind::Unit);
  COLONIA_ASSERT(r.tile_id == home);
  COLONIA_ASSERT(r.owner_id == dutch);

  // Exclusive access.
  COLONIA_ASSERT(&reg.expect_owned_unit(soldier, dutch) == reg.unit(soldier));
  bool threw = false;
  try {
    reg.expect_owned_unit(soldier, english);
  } catch (const OwnershipError&) {
    threw = true;
  }
  COLONIA_ASSERT(threw);
  threw = false;
  try {
    reg.expect_owned_unit(9999, dutch);
  } catch (const NotFoundError&) {
    threw = true;
  }
  COLONIA_ASSERT(threw);

  // Disposal cascades along containment, contents first.
  ChangeSet cs;
  {
    ChangeScope scope(reg, cs);
    COLONIA_ASSERT(reg.dispose(sid) == 4);
    // Idempotent.
    COLONIA_ASSERT(reg.dispose(sid) == 0);
    COLONIA_ASSERT(reg.dispose(colonist) == 0);
  }
  COLONIA_ASSERT(reg.active_changes() == nullptr);

  COLONIA_ASSERT(!reg.settlement(sid));
  COLONIA_ASSERT(!reg.unit(colonist));
  COLONIA_ASSERT(!reg.building(hall_id));
  COLONIA_ASSERT(!reg.mission(mission_id));
  COLONIA_ASSERT(reg.is_disposed(sid));
  COLONIA_ASSERT(reg.is_disposed(mission_id));
  COLONIA_ASSERT(!reg.kind_of(sid).has_value());
  COLONIA_ASSERT(reg.tile(home)->settlement_id == kInvalidId);
  // The soldier stood outside the settlement.
  COLONIA_ASSERT(reg.unit(soldier) != nullptr);

  int removals = 0;
  int partials = 0;
  for (const auto& c : cs.in_insertion_order()) {
    if (c.kind == ChangeKind::Remove) {
      ++removals;
      COLONIA_ASSERT(c.priority == ChangePriority::Remove);
      COLONIA_ASSERT(c.see.names(dutch));
    }
    if (c.kind == ChangeKind::UpdatePartial) {
      ++partials;
      COLONIA_ASSERT(c.subject.id == home);
    }
  }
  COLONIA_ASSERT(removals == 4);
  COLONIA_ASSERT(partials == 1);
  // Contents go first.
  const auto ordered = cs.in_insertion_order();
  COLONIA_ASSERT(ordered.front().subject.id == hall_id);

  // A disposed id is not handed out again.
  const Id next = reg.register_unit(Unit{});
  COLONIA_ASSERT(next > mission_id);
  COLONIA_ASSERT(next != sid);

  return 0;
}
