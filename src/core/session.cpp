#include "colonia/core/session.h"

#include <chrono>
#include <exception>
#include <stdexcept>
#include <utility>

#include "colonia/core/actions.h"
#include "colonia/core/serialization.h"
#include "colonia/core/wire.h"
#include "colonia/util/log.h"
#include "colonia/util/strings.h"

namespace colonia {

GameSession::GameSession(GameState state, Rules rules, GameConfig cfg)
    : state_(std::move(state)),
      rules_(std::move(rules)),
      cfg_(std::move(cfg)),
      registry_(state_),
      dispatcher_(registry_, rules_, cfg_),
      turn_(registry_, rules_, cfg_) {}

GameSession::~GameSession() = default;

void GameSession::check_not_reentrant(const char* what) const {
  if (writer_.load() == std::this_thread::get_id()) {
    throw ProtocolError(concat(what, ": re-entrant call from inside a session operation"));
  }
}

void GameSession::start() {
  check_not_reentrant("start");
  std::lock_guard<std::mutex> lock(mu_);
  WriterMark mark(writer_);
  if (started_) return;
  started_ = true;

  ChangeSet cs;
  {
    ChangeScope scope(registry_, cs);
    turn_.start(cs);
  }
  turn_started_ = std::chrono::steady_clock::now();
  dispatcher_.dispatch(cs, kInvalidId);
  log::info(concat("session: started at turn ", state_.game.turn, ", player ", state_.game.current_player_id,
                   " to move"));
  drive_ai(cfg_.ai_rounds_per_drive);
}

void GameSession::connect(Id player, std::shared_ptr<Connection> conn) {
  check_not_reentrant("connect");
  std::lock_guard<std::mutex> lock(mu_);
  WriterMark mark(writer_);
  if (!registry_.player(player)) throw NotFoundError(concat("connect: unknown player ", player));
  dispatcher_.attach(player, std::move(conn));
}

void GameSession::disconnect(Id player) {
  check_not_reentrant("disconnect");
  std::lock_guard<std::mutex> lock(mu_);
  WriterMark mark(writer_);
  dispatcher_.detach(player);
}

void GameSession::attach_ai(Id player, std::unique_ptr<AiPlanner> planner) {
  check_not_reentrant("attach_ai");
  std::lock_guard<std::mutex> lock(mu_);
  WriterMark mark(writer_);
  Player* p = registry_.player(player);
  if (!p) throw NotFoundError(concat("attach_ai: unknown player ", player));
  if (!planner) throw std::invalid_argument("attach_ai: planner is null");

  AiSlot slot;
  slot.planner = std::move(planner);
  slot.mirror = std::make_shared<ClientMirror>(player);
  std::shared_ptr<ClientMirror> mirror = slot.mirror;
  const std::string name = slot.planner->name();
  ais_[player] = std::move(slot);

  // A desynced AI mirror is logged, not fatal.
  dispatcher_.attach(player, std::make_shared<DirectConnection>([mirror](const std::string& text) {
    try {
      mirror->apply_wire(text);
    } catch (const ProtocolError& e) {
      log::error(concat("session: AI mirror for player ", mirror->player(), " rejected a batch: ", e.what()));
    }
  }));
  log::info(concat("session: player ", player, " (", p->name, ") is played by the ", name, " AI"));
}

UpdateBatch GameSession::submit(const ActionRequest& req) {
  check_not_reentrant("submit");
  std::lock_guard<std::mutex> lock(mu_);
  WriterMark mark(writer_);
  UpdateBatch reply = process(req);
  if (!reply.rejection) drive_ai(cfg_.ai_rounds_per_drive);
  return reply;
}

std::string GameSession::submit_wire(const std::string& text) {
  ActionRequest req;
  try {
    req = decode_action(text);
  } catch (const ProtocolError& e) {
    log::warn(concat("session: undecodable request: ", e.what()));
    UpdateBatch batch;
    batch.rejection = protocol_error(e.what());
    return encode_update(batch);
  }
  return encode_update(submit(req));
}

void GameSession::run_ai_rounds(int rounds) {
  check_not_reentrant("run_ai_rounds");
  std::lock_guard<std::mutex> lock(mu_);
  WriterMark mark(writer_);
  drive_ai(rounds);
}

bool GameSession::force_end_turn(const std::string& reason) {
  check_not_reentrant("force_end_turn");
  std::lock_guard<std::mutex> lock(mu_);
  WriterMark mark(writer_);
  return force_end_turn_locked(reason);
}

bool GameSession::end_overdue_turn() {
  check_not_reentrant("end_overdue_turn");
  std::lock_guard<std::mutex> lock(mu_);
  WriterMark mark(writer_);
  if (cfg_.turn_timeout_ms <= 0) return false;
  const auto age = std::chrono::steady_clock::now() - turn_started_;
  if (age < std::chrono::milliseconds(cfg_.turn_timeout_ms)) return false;
  return force_end_turn_locked(concat("turn exceeded ", cfg_.turn_timeout_ms, " ms"));
}

std::int64_t GameSession::turn_age_ms() const {
  check_not_reentrant("turn_age_ms");
  std::lock_guard<std::mutex> lock(mu_);
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - turn_started_)
      .count();
}

bool GameSession::force_end_turn_locked(const std::string& reason) {
  if (!started_ || turn_.phase() != TurnPhase::AwaitingActions) return false;
  ActionRequest req;
  req.player = state_.game.current_player_id;
  req.verb = "end_turn";
  log::warn(concat("session: forcing end of turn for player ", req.player, ": ", reason));
  const UpdateBatch reply = end_turn(req);
  if (reply.rejection) return false;
  drive_ai(cfg_.ai_rounds_per_drive);
  return true;
}

UpdateBatch GameSession::reject(const ActionRequest& req, const ActionError& err) {
  log::warn(concat("session: rejected ", req.verb, " from player ", req.player, " (", error_kind_name(err.kind),
                   "): ", err.message));
  return dispatcher_.reject(req.player, err);
}

UpdateBatch GameSession::process(const ActionRequest& req) {
  if (!started_) return reject(req, validation_error("game has not started"));

  if (req.seq != 0) {
    std::uint64_t& last = last_request_seq_[req.player];
    if (req.seq != last + 1) {
      return reject(req, protocol_error(concat("request ", req.seq, " out of sequence, expected ", last + 1)));
    }
    last = req.seq;
  }

  if (req.verb == "end_turn") return end_turn(req);

  ChangeSet cs;
  std::optional<ActionError> err;
  {
    ChangeScope scope(registry_, cs);
    ActionContext ctx{registry_, rules_, cfg_, cs};
    err = perform_action(ctx, req);
  }
  if (err) return reject(req, *err);

  log::info(concat("session: player ", req.player, " ", req.verb, ": ", cs.size(), " changes"));
  return dispatcher_.dispatch(cs, req.player);
}

UpdateBatch GameSession::end_turn(const ActionRequest& req) {
  if (auto err = check_actor(registry_, req.player)) return reject(req, *err);

  ChangeSet cs;
  bool new_turn = false;
  {
    ChangeScope scope(registry_, cs);
    try {
      new_turn = turn_.end_turn(cs);
    } catch (const ValidationError& e) {
      return reject(req, validation_error(e.what()));
    }
    turn_started_ = std::chrono::steady_clock::now();
    if (new_turn) {
      const IntegrityReport report = check_game(registry_, true, &cs);
      if (!report.clean()) {
        log::warn(concat("session: turn ", state_.game.turn, " integrity: ", report.repaired, " repaired, ",
                         report.broken, " broken"));
      }
    }
  }

  log::info(concat("session: player ", req.player, " ends turn: ", cs.size(), " changes",
                   new_turn ? concat(", turn ", state_.game.turn, " begins") : std::string()));
  return dispatcher_.dispatch(cs, req.player);
}

void GameSession::drive_ai(int rounds) {
  if (!started_ || rounds <= 0) return;
  const int first_turn = state_.game.turn;
  while (turn_.phase() == TurnPhase::AwaitingActions && state_.game.turn - first_turn < rounds) {
    const Id current = state_.game.current_player_id;
    auto it = ais_.find(current);
    if (it == ais_.end()) break;
    play_ai_turn(current, it->second);
  }
}

void GameSession::play_ai_turn(Id player, AiSlot& slot) {
  const Deadline deadline(std::chrono::milliseconds(cfg_.ai_plan_timeout_ms));
  std::vector<ActionRequest> plan;
  try {
    plan = slot.planner->plan(*slot.mirror, player, deadline);
  } catch (const std::exception& e) {
    log::error(concat("session: ", slot.planner->name(), " AI for player ", player, " failed: ", e.what()));
    plan.clear();
  }

  if (deadline.expired()) {
    log::warn(concat("session: ", slot.planner->name(), " AI for player ", player, " exceeded ",
                     cfg_.ai_plan_timeout_ms, " ms, passing"));
    plan.clear();
  }

  for (ActionRequest& req : plan) {
    if (turn_.phase() != TurnPhase::AwaitingActions || state_.game.current_player_id != player) break;
    req.player = player;
    req.seq = 0;
    process(req);
  }

  if (turn_.phase() == TurnPhase::AwaitingActions && state_.game.current_player_id == player) {
    ActionRequest done;
    done.player = player;
    done.verb = "end_turn";
    process(done);
  }
}

void GameSession::set_scoring_policy(std::unique_ptr<ScoringPolicy> policy) {
  check_not_reentrant("set_scoring_policy");
  std::lock_guard<std::mutex> lock(mu_);
  turn_.set_scoring_policy(std::move(policy));
}

void GameSession::add_player_hook(TurnEngine::PlayerHook hook) {
  check_not_reentrant("add_player_hook");
  std::lock_guard<std::mutex> lock(mu_);
  turn_.add_player_hook(std::move(hook));
}

IntegrityReport GameSession::check_integrity(bool fix) {
  check_not_reentrant("check_integrity");
  std::lock_guard<std::mutex> lock(mu_);
  WriterMark mark(writer_);
  ChangeSet cs;
  IntegrityReport report;
  {
    ChangeScope scope(registry_, cs);
    report = check_game(registry_, fix, &cs);
  }
  if (!cs.empty()) dispatcher_.dispatch(cs, kInvalidId);
  return report;
}

TurnPhase GameSession::phase() const {
  check_not_reentrant("phase");
  std::lock_guard<std::mutex> lock(mu_);
  return turn_.phase();
}

int GameSession::turn() const {
  check_not_reentrant("turn");
  std::lock_guard<std::mutex> lock(mu_);
  return state_.game.turn;
}

Id GameSession::current_player() const {
  check_not_reentrant("current_player");
  std::lock_guard<std::mutex> lock(mu_);
  return state_.game.current_player_id;
}

GameState GameSession::snapshot() const {
  check_not_reentrant("snapshot");
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

std::string GameSession::save_json() const {
  check_not_reentrant("save_json");
  std::lock_guard<std::mutex> lock(mu_);
  return serialize_game_to_json(state_);
}

void GameSession::save(const std::string& path) const {
  check_not_reentrant("save");
  std::lock_guard<std::mutex> lock(mu_);
  save_game_file(state_, path);
  log::info(concat("session: saved turn ", state_.game.turn, " to ", path));
}

std::optional<ClientMirror> GameSession::ai_view(Id player) const {
  check_not_reentrant("ai_view");
  std::lock_guard<std::mutex> lock(mu_);
  auto it = ais_.find(player);
  if (it == ais_.end()) return std::nullopt;
  return *it->second.mirror;
}

} // namespace colonia
