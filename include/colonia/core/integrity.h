#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "colonia/core/change_set.h"
#include "colonia/core/registry.h"

namespace colonia {

enum class IntegrityStatus : std::uint8_t {
  Ok = 0,
  // A problem was found and deterministically repaired.
  Repaired = 1,
  // A problem was found that has no deterministic repair (or fix was off).
  Broken = 2,
};

const char* integrity_status_name(IntegrityStatus s);

// Report returned by check_game().
struct IntegrityReport {
  int ok{0};
  int repaired{0};
  int broken{0};
  // Human-readable, one per problem, in entity id order.
  std::vector<std::string> problems;

  bool clean() const { return repaired == 0 && broken == 0; }
};

// Checks one entity's containment parent, owner and weak references.
//
// With `fix`, repairs that do not need to invent data are applied: a dangling
// weak reference is cleared, a cached field is re-derived, a current player
// pointer that rests on a dead player is advanced. Repairs are recorded into
// `changes` when it is given. Problems are appended to `problems` and logged;
// this never throws for bad data.
IntegrityStatus check_entity(EntityRegistry& registry, Id id, bool fix, std::vector<std::string>& problems,
                             ChangeSet* changes = nullptr);

IntegrityReport check_game(EntityRegistry& registry, bool fix, ChangeSet* changes = nullptr);

} // namespace colonia
