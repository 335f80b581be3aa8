#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "colonia/core/entities.h"
#include "colonia/core/ids.h"

namespace colonia {

enum class ChangeKind : std::uint8_t {
  Add = 0,
  Remove = 1,
  UpdateFull = 2,
  UpdatePartial = 3,
  Message = 4,
  OwnerChange = 5,
};

// Flush order. Lower values are delivered first.
//
// Removals go out before ownership transfers, which go out before ordinary
// state, so a client never receives an update for an entity whose removal or
// reassignment it has not applied yet. Trivial notices (turn number bumps)
// always come last.
enum class ChangePriority : std::uint8_t {
  Remove = 0,
  Ownership = 1,
  State = 2,
  Trivial = 3,
};

const char* change_kind_name(ChangeKind k);
bool change_kind_from_name(const std::string& s, ChangeKind& out);

// Who may receive a change.
//
// A See is a union of rules. It is evaluated when the change set is flushed,
// not when the change is recorded, and the most permissive rule that applies
// to an observer wins. A default-constructed See matches nobody.
class See {
 public:
  See() = default;

  static See all();
  static See only_owner();
  static See perceived();
  static See only(Id player);
  static See players(std::vector<Id> ids);

  // Adds an explicitly named observer.
  See& always(Id player);

  // Union with another See.
  See& merge(const See& other);

  bool includes_all() const { return all_; }
  bool includes_owner() const { return owner_; }
  bool includes_perceived() const { return perceived_; }
  const std::vector<Id>& named() const { return named_; }
  bool names(Id player) const;

  bool operator==(const See& o) const {
    return all_ == o.all_ && owner_ == o.owner_ && perceived_ == o.perceived_ && named_ == o.named_;
  }
  bool operator!=(const See& o) const { return !(*this == o); }

 private:
  bool all_{false};
  bool owner_{false};
  bool perceived_{false};
  // Sorted, unique.
  std::vector<Id> named_;
};

// Default audience for changes to an entity of the given kind.
See default_see_for(EntityKind kind);

// Where an entity was and who owned it when a change was recorded.
//
// Removed entities are gone by the time a change set is flushed, so removals
// are filtered with these hints instead of a live lookup.
struct EntityRef {
  Id id{kInvalidId};
  EntityKind kind{EntityKind::Game};
  Id tile_id{kInvalidId};
  Id owner_id{kInvalidId};
};

// One recorded mutation.
//
// A Change carries no entity data: the projection reads the current value of
// the subject at flush time. Changes are immutable once recorded; the change
// set replaces or drops whole records when compacting.
struct Change {
  ChangeKind kind{ChangeKind::UpdateFull};
  EntityRef subject;
  ChangePriority priority{ChangePriority::State};
  See see;

  // Insertion index inside the owning ChangeSet.
  std::uint64_t seq{0};

  // UpdatePartial only. Sorted, unique.
  std::vector<std::string> fields;

  // OwnerChange only.
  Id old_owner{kInvalidId};
  Id new_owner{kInvalidId};

  // Message only.
  StringTemplate message;
};

} // namespace colonia
