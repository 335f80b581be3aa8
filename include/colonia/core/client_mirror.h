#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "colonia/core/messages.h"

namespace colonia {

struct MirrorEntity {
  EntityKind kind{EntityKind::Game};
  json::Object fields;
};

// A client's partial, possibly stale copy of the game.
//
// AI planners read the game through a mirror only. apply() enforces the
// delivery contract: batches arrive in sequence, and updates, ownership
// changes and removals only name entities the mirror already holds. Any
// violation throws ProtocolError and leaves the mirror unchanged.
class ClientMirror {
 public:
  explicit ClientMirror(Id player = kInvalidId) : player_(player) {}

  void apply(const UpdateBatch& batch);
  void apply_wire(const std::string& text);

  Id player() const { return player_; }
  std::uint64_t last_seq() const { return last_seq_; }

  const MirrorEntity* find(Id id) const;
  const std::map<Id, MirrorEntity>& entities() const { return entities_; }
  std::vector<Id> ids_of_kind(EntityKind kind) const;

  // Integer field of an entity, `def` when absent.
  std::int64_t int_field(Id id, const std::string& field, std::int64_t def = 0) const;
  std::string string_field(Id id, const std::string& field, const std::string& def = "") const;

  const std::vector<StringTemplate>& messages() const { return messages_; }
  const std::optional<ActionError>& last_rejection() const { return last_rejection_; }

  // Game root as seen by this client. kInvalidId before the first snapshot.
  Id game_id() const;
  int turn() const;
  Id current_player() const;

  // "kind id.field -> missing" for every containment or owner reference that
  // points at an entity the mirror does not hold, and for every weak
  // reference to an entity the mirror has never been told about.
  std::vector<std::string> dangling_references() const;

 private:
  Id player_;
  std::uint64_t last_seq_{0};
  std::map<Id, MirrorEntity> entities_;
  // Every id ever added, removed ones included.
  std::set<Id> introduced_;
  std::vector<StringTemplate> messages_;
  std::optional<ActionError> last_rejection_;
};

} // namespace colonia
