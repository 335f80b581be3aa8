#include "colonia/core/inbound_queue.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>

#include "colonia/core/session.h"
#include "colonia/util/log.h"
#include "colonia/util/strings.h"

namespace colonia {

InboundQueue::InboundQueue(GameSession& session) : session_(session) {
  worker_ = std::thread([this] { run(); });
}

InboundQueue::~InboundQueue() { stop(); }

void InboundQueue::post(ActionRequest req, ReplyHandler on_reply) {
  enqueue([this, req = std::move(req), on_reply = std::move(on_reply)] {
    UpdateBatch reply = session_.submit(req);
    if (on_reply) on_reply(reply);
  });
}

void InboundQueue::post_wire(std::string text, WireReplyHandler on_reply) {
  enqueue([this, text = std::move(text), on_reply = std::move(on_reply)] {
    const std::string reply = session_.submit_wire(text);
    if (on_reply) on_reply(reply);
  });
}

void InboundQueue::enqueue(std::function<void()> work) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (stopping_) {
      log::warn("inbound queue: dropping request posted after stop");
      return;
    }
    queue_.push_back(std::move(work));
  }
  cv_.notify_one();
}

void InboundQueue::drain() {
  std::unique_lock<std::mutex> lock(mu_);
  idle_cv_.wait(lock, [this] { return queue_.empty() && !busy_; });
}

void InboundQueue::stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

void InboundQueue::run() {
  // While idle, the worker also enforces the turn time limit.
  const int limit_ms = session_.config().turn_timeout_ms;
  const auto poll = std::chrono::milliseconds(std::max(1, std::min(limit_ms / 4, 100)));

  for (;;) {
    std::function<void()> work;
    {
      std::unique_lock<std::mutex> lock(mu_);
      const auto ready = [this] { return stopping_ || !queue_.empty(); };
      if (limit_ms <= 0) {
        cv_.wait(lock, ready);
      } else if (!cv_.wait_for(lock, poll, ready)) {
        busy_ = true;
        lock.unlock();
        try {
          session_.end_overdue_turn();
        } catch (const std::exception& e) {
          log::error(concat("inbound queue: turn limit check failed: ", e.what()));
        }
        lock.lock();
        busy_ = false;
        if (queue_.empty()) idle_cv_.notify_all();
        continue;
      }
      if (queue_.empty()) {
        idle_cv_.notify_all();
        return;
      }
      work = std::move(queue_.front());
      queue_.pop_front();
      busy_ = true;
    }

    try {
      work();
    } catch (const std::exception& e) {
      log::error(concat("inbound queue: request failed: ", e.what()));
    }
    ++processed_;

    {
      std::lock_guard<std::mutex> lock(mu_);
      busy_ = false;
      if (queue_.empty()) idle_cv_.notify_all();
    }
  }
}

} // namespace colonia
