#pragma once

#include <cstdint>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "colonia/core/change.h"
#include "colonia/core/config.h"
#include "colonia/core/registry.h"
#include "colonia/core/rules.h"

namespace colonia {

enum class Visibility : std::uint8_t {
  None = 0,
  // Identity and public attributes only (stale or foreign view).
  Summary = 1,
  Full = 2,
};

const char* visibility_name(Visibility v);

// What one player knows about the map right now.
struct KnowledgeView {
  Id player{kInvalidId};
  // Tiles inside the line of sight of the player's units and settlements.
  std::unordered_set<Id> in_sight;
  // Tiles the player has ever seen.
  std::unordered_set<Id> explored;
};

KnowledgeView compute_knowledge(const EntityRegistry& registry, const Rules& rules, const GameConfig& cfg,
                                Id player);

// Answers "how much of this entity may this observer see".
//
// Knowledge is computed lazily per observer and cached for the oracle's
// lifetime. Construct a fresh oracle for every flush so that changes made
// earlier in the same operation (a capture, a move) are taken into account.
class VisibilityOracle {
 public:
  VisibilityOracle(const EntityRegistry& registry, const Rules& rules, const GameConfig& cfg)
      : registry_(registry), rules_(rules), cfg_(cfg) {}

  Visibility visible(Id observer, const EntityRef& subject, const See& see) const;

  // Messages have no subject: only the "all" and named-observer rules apply.
  bool receives_message(Id observer, const See& see) const;

  const KnowledgeView& knowledge(Id observer) const;

 private:
  const EntityRegistry& registry_;
  const Rules& rules_;
  const GameConfig& cfg_;
  mutable std::unordered_map<Id, KnowledgeView> cache_;
};

// Tiles within Chebyshev distance `radius` of `center`, ascending.
std::vector<Id> tiles_within(const GameState& s, Id center, int radius);

bool has_explored(const Player& p, Id tile_id);

// Marks the tiles around `center` as explored by `player_id`. Returns the
// tiles that were not explored before, ascending.
std::vector<Id> explore_from(GameState& s, Id player_id, Id center, int radius);

// Sight radius of a unit (from its type) or a settlement (from config).
int sight_radius(const EntityRegistry& registry, const Rules& rules, const GameConfig& cfg, Id id);

} // namespace colonia
