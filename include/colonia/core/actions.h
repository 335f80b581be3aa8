#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "colonia/core/change_set.h"
#include "colonia/core/config.h"
#include "colonia/core/errors.h"
#include "colonia/core/messages.h"
#include "colonia/core/registry.h"
#include "colonia/core/rules.h"

namespace colonia {

struct ActionContext {
  EntityRegistry& registry;
  const Rules& rules;
  const GameConfig& cfg;
  ChangeSet& changes;
};

// In-turn verbs handled by perform_action(). "end_turn" belongs to the turn
// engine and is routed by the session.
bool is_action_verb(const std::string& verb);

// Validates `req` completely and, only if it is valid, applies it and records
// the resulting changes into ctx.changes. Returns the rejection otherwise;
// nothing has been mutated in that case.
std::optional<ActionError> perform_action(ActionContext& ctx, const ActionRequest& req);

// Requests that are addressed to the current player: the player exists, is
// alive, the game is running and it is their turn.
std::optional<ActionError> check_actor(const EntityRegistry& registry, Id player);

// One combat roll. Advances `rng_state`.
bool attack_succeeds(std::uint64_t& rng_state, int offence, int defence);

// Goods capacity left on a carrier, in goods units (a unit aboard takes 100).
int free_cargo_capacity(const EntityRegistry& registry, const Rules& rules, Id carrier);

// True when the player may currently see `id` at all (owned, in sight, or on
// an explored tile for perceived kinds). Buildings, wishes and missions of
// other players are never known.
bool known_to_player(const EntityRegistry& registry, const Rules& rules, const GameConfig& cfg, Id player, Id id);

} // namespace colonia
