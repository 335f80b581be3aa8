#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "colonia/core/ai.h"
#include "colonia/core/inbound_queue.h"
#include "colonia/core/scenario.h"
#include "colonia/core/serialization.h"
#include "colonia/core/session.h"
#include "colonia/core/wire.h"
#include "log_capture.h"
#include "test_world.h"

#define COLONIA_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

using colonia::ActionRequest;
using colonia::ClientMirror;
using colonia::Id;

ActionRequest request(Id player, const std::string& verb, colonia::json::Object params = {}, std::uint64_t seq = 0) {
  ActionRequest req;
  req.seq = seq;
  req.player = player;
  req.verb = verb;
  req.params = std::move(params);
  return req;
}

std::shared_ptr<colonia::Connection> mirror_connection(const std::shared_ptr<ClientMirror>& mirror) {
  return std::make_shared<colonia::DirectConnection>([mirror](const std::string& text) { mirror->apply_wire(text); });
}

} // namespace

int test_session() {
  using namespace colonia;
  using namespace colonia::testworld;

  const Rules rules = make_default_rules();

  GameState s = make_flat_world(10, 10, 2, PlayerControl::Human);
  const Id dutch = player_at(s, 0);
  const Id english = player_at(s, 1);
  const Id soldier = add_unit(s, dutch, tile_at(s, 4, 4), "soldier");
  const Id redcoat = add_unit(s, english, tile_at(s, 8, 8), "soldier");
  const Id t45 = tile_at(s, 4, 5);
  const Id t87 = tile_at(s, 8, 7);

  GameSession session(std::move(s), rules, GameConfig{});
  auto dm = std::make_shared<ClientMirror>(dutch);
  auto em = std::make_shared<ClientMirror>(english);
  session.connect(dutch, mirror_connection(dm));
  session.connect(english, mirror_connection(em));
  COLONIA_ASSERT(dm->last_seq() == 1);
  COLONIA_ASSERT(em->last_seq() == 1);

  bool unknown_threw = false;
  try {
    session.connect(4242, mirror_connection(std::make_shared<ClientMirror>(4242)));
  } catch (const NotFoundError&) {
    unknown_threw = true;
  }
  COLONIA_ASSERT(unknown_threw);

  // Nothing is accepted before the game starts.
  {
    const UpdateBatch early = session.submit(request(dutch, "move", {{"unit", soldier}, {"tile", t45}}));
    COLONIA_ASSERT(early.rejection.has_value());
    COLONIA_ASSERT(early.rejection->kind == ErrorKind::Validation);
    COLONIA_ASSERT(dm->last_rejection().has_value());
  }

  session.start();
  COLONIA_ASSERT(session.phase() == TurnPhase::AwaitingActions);
  COLONIA_ASSERT(session.current_player() == dutch);

  {
    const UpdateBatch reply = session.submit(request(dutch, "move", {{"unit", soldier}, {"tile", t45}}));
    COLONIA_ASSERT(!reply.rejection.has_value());
    COLONIA_ASSERT(reply.seq == dm->last_seq());
    COLONIA_ASSERT(dm->int_field(soldier, "location_id") == static_cast<std::int64_t>(t45));
    COLONIA_ASSERT(dm->int_field(soldier, "moves_left") == 0);
  }

  // Out of turn.
  {
    const std::uint64_t english_seq = em->last_seq();
    const UpdateBatch reply = session.submit(request(english, "move", {{"unit", redcoat}, {"tile", t87}}));
    COLONIA_ASSERT(reply.rejection.has_value());
    COLONIA_ASSERT(reply.rejection->message == "not your turn");
    COLONIA_ASSERT(em->last_seq() == english_seq + 1);
    COLONIA_ASSERT(session.snapshot().units.at(redcoat).location_id == tile_at(session.snapshot(), 8, 8));
  }

  {
    const UpdateBatch reply = session.submit(request(dutch, "end_turn"));
    COLONIA_ASSERT(!reply.rejection.has_value());
    COLONIA_ASSERT(session.current_player() == english);
    COLONIA_ASSERT(static_cast<Id>(dm->current_player()) == english);
    COLONIA_ASSERT(static_cast<Id>(em->current_player()) == english);
  }

  // Wire requests carry a per-player sequence.
  {
    const UpdateBatch first = decode_update(
        session.submit_wire(encode_action(request(english, "move", {{"unit", redcoat}, {"tile", t87}}, 1))));
    COLONIA_ASSERT(!first.rejection.has_value());
    COLONIA_ASSERT(first.observer == english);

    const UpdateBatch skipped = decode_update(session.submit_wire(encode_action(request(english, "end_turn", {}, 3))));
    COLONIA_ASSERT(skipped.rejection.has_value());
    COLONIA_ASSERT(skipped.rejection->kind == ErrorKind::Protocol);
    COLONIA_ASSERT(skipped.rejection->message.find("expected 2") != std::string::npos);
    COLONIA_ASSERT(session.current_player() == english);

    const UpdateBatch ended = decode_update(session.submit_wire(encode_action(request(english, "end_turn", {}, 2))));
    COLONIA_ASSERT(!ended.rejection.has_value());
    COLONIA_ASSERT(session.turn() == 2);
    COLONIA_ASSERT(session.current_player() == dutch);
    COLONIA_ASSERT(em->turn() == 2);

    const UpdateBatch garbage = decode_update(session.submit_wire("{not json"));
    COLONIA_ASSERT(garbage.rejection.has_value());
    COLONIA_ASSERT(garbage.rejection->kind == ErrorKind::Protocol);
    COLONIA_ASSERT(garbage.seq == 0);
  }

  // Every mirror stays consistent with what it was told.
  COLONIA_ASSERT(dm->dangling_references().empty());
  COLONIA_ASSERT(em->dangling_references().empty());
  COLONIA_ASSERT(session.check_integrity(false).clean());

  // A detached observer hears nothing more.
  {
    session.disconnect(english);
    const std::uint64_t english_seq = em->last_seq();
    const UpdateBatch reply = session.submit(request(dutch, "end_turn"));
    COLONIA_ASSERT(!reply.rejection.has_value());
    COLONIA_ASSERT(em->last_seq() == english_seq);

    // The English player is human and not connected: the game waits for it.
    COLONIA_ASSERT(session.current_player() == english);
    COLONIA_ASSERT(session.phase() == TurnPhase::AwaitingActions);
  }

  // Saves reload into the same state.
  {
    const GameState reloaded = deserialize_game_from_json(session.save_json());
    COLONIA_ASSERT(reloaded.game.turn == session.turn());
    COLONIA_ASSERT(reloaded.game.current_player_id == english);
    COLONIA_ASSERT(reloaded.units.at(redcoat).location_id == t87);
  }

  // Observers that call back into the session are refused.
  {
    GameState g = make_flat_world(8, 8, 2, PlayerControl::Human);
    const Id a = player_at(g, 0);
    const Id b = player_at(g, 1);
    add_unit(g, a, tile_at(g, 2, 2), "soldier");
    GameSession nested(std::move(g), rules, GameConfig{});

    std::atomic<int> refused{0};
    std::atomic<int> received{0};
    nested.connect(b, std::make_shared<DirectConnection>([&nested, &refused, &received, b](const std::string&) {
      ++received;
      try {
        nested.submit(request(b, "end_turn"));
      } catch (const ProtocolError&) {
        ++refused;
      }
      try {
        (void)nested.turn();
      } catch (const ProtocolError&) {
        ++refused;
      }
    }));
    COLONIA_ASSERT(received == 1);
    COLONIA_ASSERT(refused == 2);

    nested.start();
    const UpdateBatch reply = nested.submit(request(a, "end_turn"));
    COLONIA_ASSERT(!reply.rejection.has_value());
    COLONIA_ASSERT(received == 2);
    COLONIA_ASSERT(refused == 4);
    COLONIA_ASSERT(nested.current_player() == b);
  }

  // Player hooks run for every live player on each new turn.
  {
    GameState g = make_flat_world(8, 8, 2, PlayerControl::Human);
    const Id a = player_at(g, 0);
    const Id b = player_at(g, 1);
    add_unit(g, a, tile_at(g, 1, 1), "soldier");
    add_unit(g, b, tile_at(g, 6, 6), "soldier");
    GameSession hooked(std::move(g), rules, GameConfig{});
    int calls = 0;
    hooked.add_player_hook([&calls](TurnContext&, Id) { ++calls; });
    hooked.start();
    COLONIA_ASSERT(!hooked.submit(request(a, "end_turn")).rejection.has_value());
    COLONIA_ASSERT(calls == 0);
    COLONIA_ASSERT(!hooked.submit(request(b, "end_turn")).rejection.has_value());
    COLONIA_ASSERT(calls == 2);
    COLONIA_ASSERT(hooked.turn() == 2);
  }
  return 0;
}

int test_session_concurrency() {
  using namespace colonia;
  using namespace colonia::testworld;

  const Rules rules = make_default_rules();

  // Independent sessions on separate threads. Equal seeds give equal games.
  {
    constexpr int kSessions = 4;
    std::vector<std::string> saves(kSessions);
    std::vector<int> turns(kSessions, 0);
    std::vector<std::thread> threads;
    for (int i = 0; i < kSessions; ++i) {
      threads.emplace_back([i, &rules, &saves, &turns] {
        ScenarioConfig sc;
        sc.width = 16;
        sc.height = 12;
        sc.players = 3;
        sc.seed = i < 2 ? 11 : 100 + static_cast<std::uint64_t>(i);
        GameConfig cfg;
        cfg.ai_rounds_per_drive = 0;
        cfg.ai_plan_timeout_ms = 10000;
        GameState st = make_scenario(sc, rules, cfg);
        const std::vector<Id> order = st.player_order;
        GameSession session(std::move(st), rules, cfg);
        for (Id pid : order) session.attach_ai(pid, std::make_unique<ExplorerAi>(rules));
        session.start();
        session.run_ai_rounds(3);
        turns[static_cast<std::size_t>(i)] = session.turn();
        saves[static_cast<std::size_t>(i)] = session.save_json();
      });
    }
    for (auto& t : threads) t.join();
    for (int t : turns) COLONIA_ASSERT(t == 4);
    COLONIA_ASSERT(saves[0] == saves[1]);
    COLONIA_ASSERT(saves[0] != saves[2]);
  }

  // Queued requests are processed one at a time, in arrival order.
  {
    GameState g = make_flat_world(10, 10, 2, PlayerControl::Human);
    const Id dutch = player_at(g, 0);
    const Id english = player_at(g, 1);
    const Id scout = add_unit(g, dutch, tile_at(g, 1, 1), "scout", 4);
    add_unit(g, english, tile_at(g, 8, 8), "soldier");
    std::vector<Id> path;
    for (int x = 2; x <= 4; ++x) path.push_back(tile_at(g, x, 1));

    GameSession session(std::move(g), rules, GameConfig{});
    session.start();

    std::mutex mu;
    std::vector<std::string> replies;
    InboundQueue queue(session);

    // A reader polling the session while the queue works.
    std::atomic<bool> done{false};
    std::thread reader([&session, &done] {
      while (!done) {
        (void)session.turn();
        std::this_thread::yield();
      }
    });

    std::uint64_t seq = 0;
    for (Id step : path) {
      queue.post(request(dutch, "move", {{"unit", scout}, {"tile", step}}, ++seq), [&mu, &replies](const UpdateBatch& b) {
        std::lock_guard<std::mutex> lock(mu);
        replies.push_back(b.rejection ? "rejected" : "move");
      });
    }
    queue.post(request(dutch, "end_turn", {}, ++seq), [&mu, &replies](const UpdateBatch& b) {
      std::lock_guard<std::mutex> lock(mu);
      replies.push_back(b.rejection ? "rejected" : "end_turn");
    });
    queue.post_wire(encode_action(request(english, "end_turn", {}, 1)), [&mu, &replies](const std::string& text) {
      const UpdateBatch b = decode_update(text);
      std::lock_guard<std::mutex> lock(mu);
      replies.push_back(b.rejection ? "rejected" : "wire end_turn");
    });
    queue.drain();
    done = true;
    reader.join();

    COLONIA_ASSERT(queue.processed() == 5);
    {
      std::lock_guard<std::mutex> lock(mu);
      COLONIA_ASSERT((replies == std::vector<std::string>{"move", "move", "move", "end_turn", "wire end_turn"}));
    }
    COLONIA_ASSERT(session.turn() == 2);
    COLONIA_ASSERT(session.current_player() == dutch);
    COLONIA_ASSERT(session.snapshot().units.at(scout).location_id == path.back());

    LogCapture capture;
    queue.stop();
    queue.post(request(dutch, "end_turn"));
    COLONIA_ASSERT(capture.contains("dropping request posted after stop"));
    COLONIA_ASSERT(queue.processed() == 5);
    COLONIA_ASSERT(session.current_player() == dutch);
  }

  // Submissions racing from several threads are serialized.
  {
    GameState g = make_flat_world(8, 8, 2, PlayerControl::Human);
    const Id dutch = player_at(g, 0);
    add_unit(g, dutch, tile_at(g, 2, 2), "soldier");
    add_unit(g, player_at(g, 1), tile_at(g, 6, 6), "soldier");
    GameSession session(std::move(g), rules, GameConfig{});
    session.start();

    std::atomic<int> accepted{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
      threads.emplace_back([&session, &accepted, &rejected, dutch] {
        const UpdateBatch b = session.submit(request(dutch, "end_turn"));
        if (b.rejection) {
          ++rejected;
        } else {
          ++accepted;
        }
      });
    }
    for (auto& t : threads) t.join();
    COLONIA_ASSERT(accepted == 1);
    COLONIA_ASSERT(rejected == 7);
    COLONIA_ASSERT(session.current_player() != dutch);
  }
  return 0;
}

int test_turn_timeout() {
  using namespace colonia;
  using namespace colonia::testworld;

  const Rules rules = make_default_rules();

  GameState s = make_flat_world(10, 10, 2, PlayerControl::Human);
  const Id dutch = player_at(s, 0);
  const Id english = player_at(s, 1);
  add_unit(s, dutch, tile_at(s, 2, 2), "soldier");
  add_unit(s, english, tile_at(s, 7, 7), "soldier");

  // The operator can end anyone's turn; without a limit nothing is overdue.
  {
    GameSession session(s, rules, GameConfig{});
    COLONIA_ASSERT(!session.force_end_turn("not started"));
    session.start();
    COLONIA_ASSERT(!session.end_overdue_turn());
    COLONIA_ASSERT(session.current_player() == dutch);
    COLONIA_ASSERT(session.force_end_turn("operator"));
    COLONIA_ASSERT(session.current_player() == english);
    COLONIA_ASSERT(session.turn() == 1);
    COLONIA_ASSERT(session.force_end_turn("operator"));
    COLONIA_ASSERT(session.turn() == 2);
    COLONIA_ASSERT(session.current_player() == dutch);
  }

  // A player who never acts loses the turn once the limit has passed.
  {
    GameConfig cfg;
    cfg.turn_timeout_ms = 200;
    GameSession session(s, rules, cfg);
    auto em = std::make_shared<ClientMirror>(english);
    session.connect(english, mirror_connection(em));
    LogCapture capture;
    session.start();
    COLONIA_ASSERT(!session.end_overdue_turn());
    COLONIA_ASSERT(session.current_player() == dutch);

    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    COLONIA_ASSERT(session.turn_age_ms() >= 200);
    COLONIA_ASSERT(session.end_overdue_turn());
    COLONIA_ASSERT(session.current_player() == english);
    COLONIA_ASSERT(em->current_player() == english);
    COLONIA_ASSERT(capture.contains("forcing end of turn for player " + std::to_string(dutch)));
    // The clock restarts for the next player.
    COLONIA_ASSERT(session.turn_age_ms() < 200);
  }

  // The queued entry point enforces the limit while nobody submits anything.
  {
    GameConfig cfg;
    cfg.turn_timeout_ms = 30;
    GameSession session(s, rules, cfg);
    session.start();
    {
      InboundQueue queue(session);
      const auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(5);
      while (session.turn() < 2 && std::chrono::steady_clock::now() < give_up) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      }
      queue.stop();
    }
    COLONIA_ASSERT(session.turn() >= 2);
  }

  // Nothing to force once the game is over.
  {
    GameState over = s;
    over.game.game_over = true;
    GameConfig cfg;
    cfg.turn_timeout_ms = 1;
    GameSession session(std::move(over), rules, cfg);
    session.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    COLONIA_ASSERT(!session.end_overdue_turn());
    COLONIA_ASSERT(!session.force_end_turn("operator"));
  }

  return 0;
}
