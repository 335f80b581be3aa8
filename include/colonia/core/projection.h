#pragma once

#include <cstdint>
#include <unordered_set>
#include <vector>

#include "colonia/core/change_set.h"
#include "colonia/core/messages.h"
#include "colonia/core/registry.h"
#include "colonia/core/visibility.h"

namespace colonia {

// What one observer has been told so far.
struct ObserverState {
  Id player{kInvalidId};
  // Entities the observer's mirror currently holds.
  std::unordered_set<Id> known;
  // Seq of the next batch sent to this observer.
  std::uint64_t next_seq{1};
};

// Projects a change set for one observer and updates `obs.known`.
//
// The result never refers to an entity the observer has not been told about:
// a change to an entity that is unknown to the observer but visible is turned
// into an add, and unknown but visible parents and owners are added before
// the entities that reference them. Strong and weak references to entities
// the observer may not see are sent as kInvalidId.
std::vector<ProjectedChange> project(const ChangeSet& cs, const VisibilityOracle& oracle,
                                     const EntityRegistry& registry, ObserverState& obs);

// Adds for everything the observer may currently see. Sent when an observer
// attaches.
std::vector<ProjectedChange> project_snapshot(const VisibilityOracle& oracle, const EntityRegistry& registry,
                                              ObserverState& obs);

} // namespace colonia
