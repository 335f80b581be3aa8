#pragma once

#include <cstdint>
#include <string>

#include "colonia/util/json.h"

namespace colonia {

// Parameters of the once-per-game power transfer rule.
//
// The rule may fire from min_turn onward, once any non-REF player's score
// reaches strong_threshold. Only AI players take part in the transfer itself:
// the weakest AI player whose score is at or below weak_threshold cedes its
// settlements and units to the strongest AI player.
struct PowerTransferConfig {
  bool enabled{true};
  int min_turn{10};
  int strong_threshold{90};
  int weak_threshold{50};
};

struct VictoryConfig {
  // An independent (former colonial) player wins outright.
  bool defeat_ref{true};

  // Only one live non-REF player remains.
  bool last_player_standing{true};

  // Only one live human player remains.
  bool last_human_standing{false};
};

struct GameConfig {
  int settlement_line_of_sight{2};

  PowerTransferConfig power_transfer;
  VictoryConfig victory;

  // On a new turn, kill live non-REF players that have neither units nor
  // settlements left.
  bool eliminate_players_without_assets{true};

  // Upper bound on a single AI planning call. A plan that comes back after
  // the deadline is discarded and the AI passes.
  int ai_plan_timeout_ms{250};

  // When every live player is an AI, the session runs at most this many full
  // turn cycles per drive before handing control back to its caller.
  int ai_rounds_per_drive{1};

  // A player whose turn has run longer than this is made to end it by
  // GameSession::end_overdue_turn(). 0 disables the limit.
  int turn_timeout_ms{0};

  std::uint64_t combat_seed{1};
};

// Unknown keys are logged and ignored; wrong value types throw
// std::runtime_error.
GameConfig load_game_config_from_json(const json::Value& root, const std::string& source = "<memory>");
GameConfig load_game_config_from_file(const std::string& path);

json::Value game_config_to_json(const GameConfig& cfg);

} // namespace colonia
