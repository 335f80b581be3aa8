#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "colonia/core/change_set.h"
#include "colonia/core/config.h"
#include "colonia/core/registry.h"
#include "colonia/core/rules.h"

namespace colonia {

enum class TurnPhase : std::uint8_t {
  AwaitingActions = 0,
  AdvancingTurn = 1,
  GlobalEvents = 2,
  Terminated = 3,
};

const char* turn_phase_name(TurnPhase p);

// Strength of a player, as used by the power transfer rule.
class ScoringPolicy {
 public:
  virtual ~ScoringPolicy() = default;
  virtual int score(const EntityRegistry& registry, const Rules& rules, Id player) const = 0;
};

// 10 per settlement plus 10 per inhabitant, 2 per unit, 1 per 100 gold.
class AssetScoringPolicy final : public ScoringPolicy {
 public:
  int score(const EntityRegistry& registry, const Rules& rules, Id player) const override;
};

struct TurnContext {
  EntityRegistry& registry;
  const Rules& rules;
  const GameConfig& cfg;
  ChangeSet& changes;
};

// Sequences player turns and runs the end-of-turn rules.
//
// The current player pointer only ever rests on a live player. When advancing
// passes the end of the join order the turn counter increments, every live
// player's upkeep runs, and the global rules (power transfer, victory) are
// evaluated before the next player gets control.
class TurnEngine {
 public:
  using PlayerHook = std::function<void(TurnContext&, Id player)>;

  TurnEngine(EntityRegistry& registry, const Rules& rules, const GameConfig& cfg);

  TurnPhase phase() const { return phase_; }
  int turn() const { return registry_.state().game.turn; }
  Id current_player() const { return registry_.state().game.current_player_id; }

  void set_scoring_policy(std::unique_ptr<ScoringPolicy> policy);
  const ScoringPolicy& scoring_policy() const { return *scoring_; }

  // Runs after the built-in upkeep for every live player on each new turn.
  void add_player_hook(PlayerHook hook);

  // Puts a fresh or loaded game into AwaitingActions (or Terminated).
  void start(ChangeSet& cs);

  // Ends the current player's turn. Returns true when a new turn started.
  // Throws ProtocolError when an advance is already in progress and
  // ValidationError once the game has terminated.
  bool end_turn(ChangeSet& cs);

  // --- global rules ---

  // Fires at most once per game. Returns true when it fired.
  bool run_power_transfer(ChangeSet& cs);

  // Returns true when the game is (now) over.
  bool check_victory(ChangeSet& cs);

  void kill_player(ChangeSet& cs, Id player, const std::string& reason);

 private:
  void new_turn(ChangeSet& cs);
  void run_upkeep(TurnContext& ctx, Id player);
  void set_current(ChangeSet& cs, Id player);
  void add_history(HistoryEventType type, StringTemplate text);
  std::size_t order_index(Id player) const;

  EntityRegistry& registry_;
  const Rules& rules_;
  const GameConfig& cfg_;
  std::unique_ptr<ScoringPolicy> scoring_;
  std::vector<PlayerHook> hooks_;
  TurnPhase phase_{TurnPhase::AwaitingActions};
  bool advancing_{false};
};

} // namespace colonia
