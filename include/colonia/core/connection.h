#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace colonia {

// Outbound transport to one observer. Messages are wire text (see wire.h).
class Connection {
 public:
  virtual ~Connection() = default;

  // Must not block on the receiver. Messages sent after close() are dropped.
  virtual void send(const std::string& message) = 0;

  virtual void close() = 0;
  virtual bool closed() const = 0;
};

// Delivers on the sender's thread. Used for in-process AI observers and
// tests.
class DirectConnection : public Connection {
 public:
  using Handler = std::function<void(const std::string&)>;

  explicit DirectConnection(Handler handler) : handler_(std::move(handler)) {}

  void send(const std::string& message) override;
  void close() override { closed_ = true; }
  bool closed() const override { return closed_; }

 private:
  Handler handler_;
  std::atomic<bool> closed_{false};
};

// Queues messages and hands them to the handler on its own drain thread, so
// a slow receiver never holds up the game session that produced them.
//
// Messages are delivered in send order. Closing stops the drain thread after
// the messages already queued have been delivered.
class QueuedConnection : public Connection {
 public:
  using Handler = std::function<void(const std::string&)>;

  explicit QueuedConnection(Handler handler);
  ~QueuedConnection() override;

  QueuedConnection(const QueuedConnection&) = delete;
  QueuedConnection& operator=(const QueuedConnection&) = delete;

  void send(const std::string& message) override;
  void close() override;
  bool closed() const override;

  // Blocks until every message queued so far has been handed to the handler.
  void flush();

  std::size_t delivered() const { return delivered_; }
  std::size_t dropped() const { return dropped_; }

 private:
  void drain_loop();

  Handler handler_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::deque<std::string> queue_;
  bool closed_{false};
  bool busy_{false};
  std::atomic<std::size_t> delivered_{0};
  std::atomic<std::size_t> dropped_{0};
  std::thread worker_;
};

} // namespace colonia
