#include "colonia/core/turn_engine.h"

#include <algorithm>

#include "colonia/core/errors.h"
#include "colonia/core/visibility.h"
#include "colonia/util/log.h"
#include "colonia/util/strings.h"

namespace colonia {
namespace {

constexpr int kGoldPerSettlement = 10;
constexpr int kFoodPerInhabitant = 20;

template <typename Map, typename Pred>
std::vector<Id> sorted_ids_where(const Map& m, Pred pred) {
  std::vector<Id> out;
  for (const auto& [id, v] : m) {
    if (pred(v)) out.push_back(id);
  }
  std::sort(out.begin(), out.end());
  return out;
}

// Marks an advance as in progress for the guard's lifetime.
class AdvanceGuard {
 public:
  explicit AdvanceGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~AdvanceGuard() { flag_ = false; }
  AdvanceGuard(const AdvanceGuard&) = delete;
  AdvanceGuard& operator=(const AdvanceGuard&) = delete;

 private:
  bool& flag_;
};

} // namespace

const char* turn_phase_name(TurnPhase p) {
  switch (p) {
    case TurnPhase::AwaitingActions: return "awaiting_actions";
    case TurnPhase::AdvancingTurn: return "advancing_turn";
    case TurnPhase::GlobalEvents: return "global_events";
    case TurnPhase::Terminated: return "terminated";
  }
  return "awaiting_actions";
}

int AssetScoringPolicy::score(const EntityRegistry& registry, const Rules&, Id player) const {
  const GameState& s = registry.state();
  int score = 0;
  for (const auto& [_, st] : s.settlements) {
    if (st.owner_id == player) score += 10 + 10 * st.population;
  }
  for (const auto& [_, u] : s.units) {
    if (u.owner_id == player) score += 2;
  }
  if (const Player* p = registry.player(player)) score += p->gold / 100;
  return score;
}

TurnEngine::TurnEngine(EntityRegistry& registry, const Rules& rules, const GameConfig& cfg)
    : registry_(registry), rules_(rules), cfg_(cfg), scoring_(std::make_unique<AssetScoringPolicy>()) {
  if (registry_.state().game.game_over) phase_ = TurnPhase::Terminated;
}

void TurnEngine::set_scoring_policy(std::unique_ptr<ScoringPolicy> policy) {
  if (policy) scoring_ = std::move(policy);
}

void TurnEngine::add_player_hook(PlayerHook hook) { hooks_.push_back(std::move(hook)); }

std::size_t TurnEngine::order_index(Id player) const {
  const auto& order = registry_.state().player_order;
  auto it = std::find(order.begin(), order.end(), player);
  return static_cast<std::size_t>(it - order.begin());
}

void TurnEngine::set_current(ChangeSet& cs, Id player) {
  GameInfo& g = registry_.state().game;
  if (g.current_player_id == player) return;
  g.current_player_id = player;
  cs.append_partial(registry_.ref(g.id), {"current_player_id"}, ChangePriority::State, See::all());
}

void TurnEngine::add_history(HistoryEventType type, StringTemplate text) {
  GameState& s = registry_.state();
  HistoryEvent ev;
  ev.seq = s.next_history_seq++;
  ev.turn = s.game.turn;
  ev.type = type;
  ev.text = std::move(text);
  s.history.push_back(std::move(ev));
}

void TurnEngine::start(ChangeSet& cs) {
  GameState& s = registry_.state();
  if (s.game.game_over) {
    phase_ = TurnPhase::Terminated;
    return;
  }
  phase_ = TurnPhase::GlobalEvents;
  if (check_victory(cs)) return;

  if (!is_live_player(s, s.game.current_player_id)) {
    const std::vector<Id> live = live_players_in_order(s);
    if (live.empty()) {
      log::warn("TurnEngine: no live players, nothing to start");
      phase_ = TurnPhase::Terminated;
      return;
    }
    set_current(cs, live.front());
  }
  phase_ = TurnPhase::AwaitingActions;
  log::info(concat("turn ", s.game.turn, ": player ", s.game.current_player_id, " to act"));
}

bool TurnEngine::end_turn(ChangeSet& cs) {
  if (advancing_) throw ProtocolError("turn advancement already in progress");
  if (phase_ == TurnPhase::Terminated) throw ValidationError("the game is over");
  AdvanceGuard guard(advancing_);

  GameState& s = registry_.state();
  const auto& order = s.player_order;
  const std::size_t n = order.size();
  const std::size_t pos = order_index(s.game.current_player_id);

  phase_ = TurnPhase::AdvancingTurn;

  // Passing the end of the join order starts a new turn.
  bool wraps = true;
  for (std::size_t i = pos + 1; i < n; ++i) {
    if (is_live_player(s, order[i])) {
      wraps = false;
      break;
    }
  }
  if (pos >= n) wraps = false;
  if (wraps) new_turn(cs);

  phase_ = TurnPhase::GlobalEvents;
  if (wraps) run_power_transfer(cs);
  if (check_victory(cs)) return wraps;

  Id next = kInvalidId;
  const std::size_t first = (wraps || pos >= n) ? 0 : pos + 1;
  for (std::size_t i = first; i < n; ++i) {
    if (is_live_player(s, order[i])) {
      next = order[i];
      break;
    }
  }
  if (next == kInvalidId) {
    log::warn("TurnEngine: no live player left to hand control to");
    phase_ = TurnPhase::Terminated;
    return wraps;
  }
  set_current(cs, next);
  phase_ = TurnPhase::AwaitingActions;
  log::debug(concat("turn ", s.game.turn, ": player ", next, " to act"));
  return wraps;
}

void TurnEngine::new_turn(ChangeSet& cs) {
  GameState& s = registry_.state();
  s.game.turn += 1;
  cs.append_partial(registry_.ref(s.game.id), {"turn"}, ChangePriority::Trivial, See::all());
  log::info(concat("new turn ", s.game.turn));

  TurnContext ctx{registry_, rules_, cfg_, cs};
  for (Id pid : live_players_in_order(s)) {
    run_upkeep(ctx, pid);
    for (auto& hook : hooks_) hook(ctx, pid);
  }

  if (!cfg_.eliminate_players_without_assets) return;
  for (Id pid : live_players_in_order(s)) {
    const Player& p = s.players.at(pid);
    if (p.is_ref) continue;
    const bool has_units = std::any_of(s.units.begin(), s.units.end(),
                                       [pid](const auto& kv) { return kv.second.owner_id == pid; });
    const bool has_settlements = std::any_of(s.settlements.begin(), s.settlements.end(),
                                             [pid](const auto& kv) { return kv.second.owner_id == pid; });
    if (!has_units && !has_settlements) kill_player(cs, pid, "no units or settlements left");
  }
}

void TurnEngine::run_upkeep(TurnContext& ctx, Id pid) {
  EntityRegistry& reg = ctx.registry;
  GameState& s = reg.state();

  for (Id uid : sorted_ids_where(s.units, [pid](const Unit& u) { return u.owner_id == pid; })) {
    Unit& u = s.units.at(uid);
    const UnitTypeDef* def = ctx.rules.find_unit_type(u.type_id);
    const int moves = def ? def->moves : 1;
    if (u.moves_left == moves) continue;
    u.moves_left = moves;
    ctx.changes.append_partial(reg.ref(uid), {"moves_left"}, ChangePriority::State, See::only_owner());
  }

  int income = 0;
  for (Id sid : sorted_ids_where(s.settlements, [pid](const Settlement& st) { return st.owner_id == pid; })) {
    Settlement& st = s.settlements.at(sid);
    std::vector<std::string> fields = {"goods"};
    int& food = st.goods["food"];
    food += st.population + 2 + st.production_bonus;
    const int needed = kFoodPerInhabitant * st.population;
    if (food >= needed) {
      food -= needed;
      st.population += 1;
      fields.push_back("population");
    }
    See see = See::perceived();
    see.always(pid);
    ctx.changes.append_partial(reg.ref(sid), std::move(fields), ChangePriority::State, see);
    income += kGoldPerSettlement;
  }

  if (income > 0) {
    s.players.at(pid).gold += income;
    ctx.changes.append_partial(reg.ref(pid), {"gold"}, ChangePriority::State, See::only(pid));
  }
}

void TurnEngine::kill_player(ChangeSet& cs, Id pid, const std::string& reason) {
  GameState& s = registry_.state();
  Player* p = registry_.player(pid);
  if (!p || p->dead) return;
  p->dead = true;
  const std::string nation = p->nation;
  cs.append_partial(registry_.ref(pid), {"dead"}, ChangePriority::State, See::all());

  for (Id sid : sorted_ids_where(s.settlements, [pid](const Settlement& st) { return st.owner_id == pid; })) {
    registry_.dispose(sid);
  }
  for (Id uid : sorted_ids_where(s.units, [pid](const Unit& u) { return u.owner_id == pid; })) {
    registry_.dispose(uid);
  }
  for (Id wid : sorted_ids_where(s.wishes, [pid](const Wish& w) { return w.player_id == pid; })) {
    registry_.dispose(wid);
  }
  for (Id tid : sorted_ids_where(s.tiles, [pid](const Tile& t) { return t.owner_id == pid; })) {
    s.tiles.at(tid).owner_id = kInvalidId;
    cs.append_partial(registry_.ref(tid), {"owner_id"}, ChangePriority::State, See::perceived());
  }

  StringTemplate msg;
  msg.key = "model.player.dead";
  msg.add("%nation%", nation);
  cs.append_message(See::all(), msg);
  add_history(HistoryEventType::PlayerKilled, msg);
  log::info(concat("player ", pid, " (", nation, ") killed: ", reason));
}

bool TurnEngine::run_power_transfer(ChangeSet& cs) {
  GameState& s = registry_.state();
  const PowerTransferConfig& pt = cfg_.power_transfer;
  if (!pt.enabled || s.game.power_transfer_done || s.game.turn < pt.min_turn) return false;

  const std::vector<Id> live = live_players_in_order(s);
  bool ready = false;
  for (Id pid : live) {
    if (s.players.at(pid).is_ref) continue;
    if (scoring_->score(registry_, rules_, pid) >= pt.strong_threshold) ready = true;
  }
  if (!ready) return false;

  // Ties go to the earlier player in join order.
  Id strongest = kInvalidId;
  int best = 0;
  for (Id pid : live) {
    const Player& p = s.players.at(pid);
    if (p.is_ref || p.control != PlayerControl::AI) continue;
    const int score = scoring_->score(registry_, rules_, pid);
    if (strongest == kInvalidId || score > best) {
      strongest = pid;
      best = score;
    }
  }
  Id weakest = kInvalidId;
  int worst = 0;
  for (Id pid : live) {
    const Player& p = s.players.at(pid);
    if (pid == strongest || p.is_ref || p.control != PlayerControl::AI) continue;
    const int score = scoring_->score(registry_, rules_, pid);
    if (score > pt.weak_threshold) continue;
    if (weakest == kInvalidId || score < worst) {
      weakest = pid;
      worst = score;
    }
  }
  if (strongest == kInvalidId || weakest == kInvalidId) return false;

  const std::string loser_nation = s.players.at(weakest).nation;
  const std::string winner_nation = s.players.at(strongest).nation;

  std::vector<Id> sight_sources;
  for (Id sid : sorted_ids_where(s.settlements, [weakest](const Settlement& st) { return st.owner_id == weakest; })) {
    s.settlements.at(sid).owner_id = strongest;
    cs.append_owner_change(registry_.ref(sid), weakest, strongest, See::perceived());
    for (Id child : registry_.contents_of(sid)) {
      if (registry_.building(child)) {
        cs.append(ChangeKind::UpdateFull, registry_.ref(child), ChangePriority::State, See::only_owner());
      }
    }
    sight_sources.push_back(sid);
  }
  for (Id tid : sorted_ids_where(s.tiles, [weakest](const Tile& t) { return t.owner_id == weakest; })) {
    s.tiles.at(tid).owner_id = strongest;
    cs.append_partial(registry_.ref(tid), {"owner_id"}, ChangePriority::State, See::perceived());
  }
  for (Id uid : sorted_ids_where(s.units, [weakest](const Unit& u) { return u.owner_id == weakest; })) {
    s.units.at(uid).owner_id = strongest;
    cs.append_owner_change(registry_.ref(uid), weakest, strongest, See::perceived());
    for (Id child : registry_.contents_of(uid)) {
      if (registry_.mission(child)) {
        cs.append(ChangeKind::UpdateFull, registry_.ref(child), ChangePriority::State, See::only_owner());
      }
    }
    sight_sources.push_back(uid);
  }

  // The new owner sees what its new assets see.
  for (Id src : sight_sources) {
    const Id center = registry_.tile_of(src);
    if (center == kInvalidId) continue;
    for (Id t : explore_from(s, strongest, center, sight_radius(registry_, rules_, cfg_, src))) {
      cs.append(ChangeKind::UpdateFull, registry_.ref(t), ChangePriority::State, See::only(strongest));
    }
  }

  StringTemplate msg;
  msg.key = "model.diplomacy.powerTransfer";
  msg.add("%loserNation%", loser_nation).add("%nation%", winner_nation);
  cs.append_message(See::all(), msg);
  add_history(HistoryEventType::PowerTransfer, msg);

  s.game.power_transfer_done = true;
  cs.append_partial(registry_.ref(s.game.id), {"power_transfer_done"}, ChangePriority::State, See::all());

  log::info(concat("power transfer: ", loser_nation, " cedes to ", winner_nation, " (scores ", worst, " / ", best,
                   ")"));
  kill_player(cs, weakest, "ceded to " + winner_nation);
  return true;
}

bool TurnEngine::check_victory(ChangeSet& cs) {
  GameState& s = registry_.state();
  if (s.game.game_over) {
    phase_ = TurnPhase::Terminated;
    return true;
  }

  int non_ref_total = 0;
  int human_total = 0;
  for (Id pid : s.player_order) {
    const Player* p = registry_.player(pid);
    if (!p || p->is_ref) continue;
    ++non_ref_total;
    if (p->control == PlayerControl::Human) ++human_total;
  }

  std::vector<Id> live_non_ref;
  std::vector<Id> live_humans;
  Id independent = kInvalidId;
  for (Id pid : live_players_in_order(s)) {
    const Player& p = s.players.at(pid);
    if (p.is_ref) continue;
    live_non_ref.push_back(pid);
    if (p.control == PlayerControl::Human) live_humans.push_back(pid);
    if (p.is_independent && independent == kInvalidId) independent = pid;
  }

  Id winner = kInvalidId;
  if (cfg_.victory.defeat_ref && independent != kInvalidId) {
    winner = independent;
  } else if (cfg_.victory.last_player_standing && non_ref_total >= 2 && live_non_ref.size() == 1) {
    winner = live_non_ref.front();
  } else if (cfg_.victory.last_human_standing && human_total >= 2 && live_humans.size() == 1) {
    winner = live_humans.front();
  }
  const bool nobody_left = live_non_ref.empty();
  if (winner == kInvalidId && !nobody_left) return false;

  s.game.game_over = true;
  s.game.winner_id = winner;
  cs.append_partial(registry_.ref(s.game.id), {"game_over", "winner_id"}, ChangePriority::State, See::all());

  StringTemplate msg;
  if (winner != kInvalidId) {
    msg.key = "model.game.victory";
    msg.add("%nation%", s.players.at(winner).nation);
    log::info(concat("player ", winner, " (", s.players.at(winner).nation, ") wins on turn ", s.game.turn));
  } else {
    msg.key = "model.game.over";
    log::info(concat("game over on turn ", s.game.turn, ": no players left"));
  }
  cs.append_message(See::all(), msg);
  add_history(HistoryEventType::Victory, msg);
  phase_ = TurnPhase::Terminated;
  return true;
}

} // namespace colonia
