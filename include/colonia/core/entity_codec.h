#pragma once

#include <string>
#include <vector>

#include "colonia/core/game_state.h"
#include "colonia/core/visibility.h"
#include "colonia/util/json.h"

namespace colonia {

// Per-kind conversion between entity structs and JSON field objects.
//
// The same field names are used on the wire and in save files. Fields listed
// as private are persisted but never sent to observers.
class EntityCodec {
 public:
  virtual ~EntityCodec() = default;

  virtual EntityKind kind() const = 0;

  // All attributes of a live entity, private ones included. The id itself is
  // not part of the object.
  virtual json::Object encode(const GameState& s, Id id) const = 0;

  // Inserts (or replaces) entity `id` from `data`. Missing fields take their
  // defaults. Throws std::runtime_error on a wrongly typed field.
  virtual void decode(GameState& s, Id id, const json::Object& data) const = 0;

  // Attributes an observer with Summary visibility may see.
  virtual const std::vector<std::string>& summary_fields() const = 0;

  virtual const std::vector<std::string>& private_fields() const;

  // Containment parent and owner ids. An observer must know these entities
  // before it can make sense of this one.
  virtual const std::vector<std::string>& strong_references() const = 0;

  // Non-owning ids that may legitimately dangle (resolved to NOT_FOUND).
  virtual const std::vector<std::string>& weak_references() const;
};

const EntityCodec& codec_for(EntityKind kind);

// Attributes of `id` an observer at `level` may receive. When `only` is given
// the result is further restricted to those names. Empty for Visibility::None
// or unknown ids.
json::Object visible_fields(const GameState& s, Id id, EntityKind kind, Visibility level,
                            const std::vector<std::string>* only = nullptr);

const char* player_control_name(PlayerControl c);
bool player_control_from_name(const std::string& s, PlayerControl& out);

} // namespace colonia
