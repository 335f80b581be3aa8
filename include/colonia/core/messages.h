#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "colonia/core/change.h"
#include "colonia/core/errors.h"
#include "colonia/util/json.h"

namespace colonia {

// Client (or AI) to server.
struct ActionRequest {
  // Per-player request counter. 0 for in-process submissions that skip the
  // sequence check.
  std::uint64_t seq{0};
  Id player{kInvalidId};
  std::string verb;
  json::Object params;
};

// One change as a specific observer receives it.
struct ProjectedChange {
  ChangeKind op{ChangeKind::UpdateFull};
  Id id{kInvalidId};
  EntityKind kind{EntityKind::Game};

  // Add/UpdateFull/OwnerChange: every attribute the observer may see.
  // UpdatePartial: only the changed attributes.
  json::Object data;

  Id old_owner{kInvalidId};
  Id new_owner{kInvalidId};

  StringTemplate message;
};

// Server to one observer: the projection of one operation, or a rejection.
struct UpdateBatch {
  std::uint64_t seq{0};
  Id observer{kInvalidId};
  std::vector<ProjectedChange> changes;

  // Set for rejections; `changes` is then empty.
  std::optional<ActionError> rejection;
};

} // namespace colonia
