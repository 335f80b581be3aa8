#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "colonia/core/ai.h"
#include "colonia/core/client_mirror.h"
#include "colonia/core/config.h"
#include "colonia/core/dispatcher.h"
#include "colonia/core/integrity.h"
#include "colonia/core/messages.h"
#include "colonia/core/registry.h"
#include "colonia/core/rules.h"
#include "colonia/core/turn_engine.h"

namespace colonia {

// One game: its state, rules, observers and AI players.
//
// Every operation runs to completion under the session mutex, including its
// cascades, the flush to observers and any AI turns it hands control to.
// Sessions share nothing, so independent sessions may run on separate
// threads. Calling back into a session from one of its own observers, hooks
// or planners throws ProtocolError instead of deadlocking.
class GameSession {
 public:
  GameSession(GameState state, Rules rules, GameConfig cfg);
  ~GameSession();

  GameSession(const GameSession&) = delete;
  GameSession& operator=(const GameSession&) = delete;

  // Hands control to the first live player and lets AI players act.
  void start();

  // Attaches an observer. It receives a snapshot right away.
  // Throws NotFoundError for an unknown player.
  void connect(Id player, std::shared_ptr<Connection> conn);
  void disconnect(Id player);

  // Runs `player` in-process. The planner observes through its own mirror.
  void attach_ai(Id player, std::unique_ptr<AiPlanner> planner);

  // Synchronous entry point. Returns the submitter's batch: the projected
  // changes on success, a rejection otherwise. Throws ProtocolError when
  // called from inside an operation of this session.
  UpdateBatch submit(const ActionRequest& req);

  // Wire entry point: decodes the request, submits it and encodes the reply.
  std::string submit_wire(const std::string& text);

  // Lets AI players act for at most `rounds` further turns.
  void run_ai_rounds(int rounds);

  // Ends the current player's turn on their behalf. Returns false when there
  // is no turn to end (not started, or the game is over).
  bool force_end_turn(const std::string& reason);

  // force_end_turn() for a turn that has been running longer than
  // turn_timeout_ms. Always false when the limit is disabled.
  bool end_overdue_turn();

  // Milliseconds since the current player's turn began.
  std::int64_t turn_age_ms() const;

  void set_scoring_policy(std::unique_ptr<ScoringPolicy> policy);
  void add_player_hook(TurnEngine::PlayerHook hook);

  IntegrityReport check_integrity(bool fix);

  TurnPhase phase() const;
  int turn() const;
  Id current_player() const;

  // Copy of the authoritative state.
  GameState snapshot() const;
  std::string save_json() const;
  void save(const std::string& path) const;

  // Copy of an AI player's mirror, nullopt for players without an AI.
  std::optional<ClientMirror> ai_view(Id player) const;

  const Rules& rules() const { return rules_; }
  const GameConfig& config() const { return cfg_; }

 private:
  struct AiSlot {
    std::unique_ptr<AiPlanner> planner;
    std::shared_ptr<ClientMirror> mirror;
  };

  // Marks the calling thread as the session's writer for the scope.
  class WriterMark {
   public:
    explicit WriterMark(std::atomic<std::thread::id>& writer) : writer_(writer) {
      writer_.store(std::this_thread::get_id());
    }
    ~WriterMark() { writer_.store(std::thread::id()); }
    WriterMark(const WriterMark&) = delete;
    WriterMark& operator=(const WriterMark&) = delete;

   private:
    std::atomic<std::thread::id>& writer_;
  };

  void check_not_reentrant(const char* what) const;

  // The following run with the mutex held.
  UpdateBatch process(const ActionRequest& req);
  UpdateBatch end_turn(const ActionRequest& req);
  bool force_end_turn_locked(const std::string& reason);
  UpdateBatch reject(const ActionRequest& req, const ActionError& err);
  void drive_ai(int rounds);
  void play_ai_turn(Id player, AiSlot& slot);

  mutable std::mutex mu_;
  std::atomic<std::thread::id> writer_{};

  GameState state_;
  Rules rules_;
  GameConfig cfg_;
  EntityRegistry registry_;
  Dispatcher dispatcher_;
  TurnEngine turn_;

  std::map<Id, AiSlot> ais_;
  std::map<Id, std::uint64_t> last_request_seq_;
  bool started_{false};
  std::chrono::steady_clock::time_point turn_started_{std::chrono::steady_clock::now()};
};

} // namespace colonia
