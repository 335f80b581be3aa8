#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "colonia/core/messages.h"

namespace colonia {

class GameSession;

// Queued entry point to a session: requests are processed one at a time, in
// arrival order, on the queue's worker thread. Posting never blocks on the
// game. With a turn_timeout_ms configured, the idle worker also ends turns
// that have run past the limit.
class InboundQueue {
 public:
  using ReplyHandler = std::function<void(const UpdateBatch&)>;
  using WireReplyHandler = std::function<void(const std::string&)>;

  explicit InboundQueue(GameSession& session);
  ~InboundQueue();

  InboundQueue(const InboundQueue&) = delete;
  InboundQueue& operator=(const InboundQueue&) = delete;

  void post(ActionRequest req, ReplyHandler on_reply = {});
  void post_wire(std::string text, WireReplyHandler on_reply = {});

  // Blocks until everything posted so far has been processed.
  void drain();

  // Processes what is queued, then stops the worker. Later posts are dropped.
  void stop();

  std::size_t processed() const { return processed_; }

 private:
  void enqueue(std::function<void()> work);
  void run();

  GameSession& session_;
  std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::deque<std::function<void()>> queue_;
  bool stopping_{false};
  bool busy_{false};
  std::atomic<std::size_t> processed_{0};
  std::thread worker_;
};

} // namespace colonia
