#pragma once

#include <optional>
#include <vector>

#include "colonia/core/change.h"
#include "colonia/core/game_state.h"

namespace colonia {

class ChangeSet;

// Access layer over a GameState.
//
// The registry allocates ids, resolves them, walks containment and disposes
// entities. It does not own the state; GameSession owns both.
//
// Registering never records a change: the handler that creates an entity
// decides who is told about it. Disposing always records a removal into the
// active change set (see ChangeScope).
class EntityRegistry {
 public:
  explicit EntityRegistry(GameState& state) : state_(state) {}

  GameState& state() { return state_; }
  const GameState& state() const { return state_; }

  // --- registration ---
  Id register_game(GameInfo g);
  Id register_player(Player p);
  Id register_tile(Tile t);
  Id register_unit(Unit u);
  Id register_settlement(Settlement s);
  Id register_building(Building b);
  Id register_wish(Wish w);
  Id register_mission(Mission m);

  // --- lookup (nullptr for unknown or disposed ids) ---
  std::optional<EntityKind> kind_of(Id id) const;
  bool exists(Id id) const { return state_.kinds.count(id) != 0; }
  bool is_disposed(Id id) const { return state_.disposed.count(id) != 0; }

  Player* player(Id id) { return find_ptr(state_.players, id); }
  const Player* player(Id id) const { return find_ptr(state_.players, id); }
  Tile* tile(Id id) { return find_ptr(state_.tiles, id); }
  const Tile* tile(Id id) const { return find_ptr(state_.tiles, id); }
  Unit* unit(Id id) { return find_ptr(state_.units, id); }
  const Unit* unit(Id id) const { return find_ptr(state_.units, id); }
  Settlement* settlement(Id id) { return find_ptr(state_.settlements, id); }
  const Settlement* settlement(Id id) const { return find_ptr(state_.settlements, id); }
  Building* building(Id id) { return find_ptr(state_.buildings, id); }
  const Building* building(Id id) const { return find_ptr(state_.buildings, id); }
  Wish* wish(Id id) { return find_ptr(state_.wishes, id); }
  const Wish* wish(Id id) const { return find_ptr(state_.wishes, id); }
  Mission* mission(Id id) { return find_ptr(state_.missions, id); }
  const Mission* mission(Id id) const { return find_ptr(state_.missions, id); }

  // Exclusive access on behalf of a player. Throw NotFoundError for unknown
  // or disposed ids and OwnershipError for entities owned by someone else.
  Unit& expect_owned_unit(Id id, Id player_id);
  Settlement& expect_owned_settlement(Id id, Id player_id);
  Wish& expect_owned_wish(Id id, Id player_id);
  Tile& expect_tile(Id id);

  // --- containment ---

  // Strict containment parent, kInvalidId for the game root.
  Id container_of(Id id) const;

  // Entities whose containment parent is `id`, ascending.
  std::vector<Id> contents_of(Id id) const;

  // Owning player, following containment for kinds without an owner field.
  // A player owns itself.
  Id owner_of(Id id) const;

  // Map tile the entity is on, kInvalidId for entities off the map.
  Id tile_of(Id id) const;

  EntityRef ref(Id id) const;

  // --- disposal ---

  // Disposes `id` and everything it contains, contents first. Records a
  // removal for each into the active change set. Disposing an already
  // disposed id is a no-op. Returns the number of entities disposed.
  int dispose(Id id);

  // Change set that dispose() records into. nullptr outside an operation.
  ChangeSet* active_changes() const { return active_; }

 private:
  friend class ChangeScope;

  Id allocate(EntityKind kind);

  GameState& state_;
  ChangeSet* active_{nullptr};
};

// Makes `cs` the registry's active change set for the scope's lifetime.
class ChangeScope {
 public:
  ChangeScope(EntityRegistry& registry, ChangeSet& cs) : registry_(registry), prev_(registry.active_) {
    registry_.active_ = &cs;
  }
  ~ChangeScope() { registry_.active_ = prev_; }

  ChangeScope(const ChangeScope&) = delete;
  ChangeScope& operator=(const ChangeScope&) = delete;

 private:
  EntityRegistry& registry_;
  ChangeSet* prev_;
};

} // namespace colonia
