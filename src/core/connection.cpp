#include "colonia/core/connection.h"

#include <exception>

#include "colonia/util/log.h"

namespace colonia {

void DirectConnection::send(const std::string& message) {
  if (closed_) {
    log::warn("DirectConnection: dropping message on closed connection");
    return;
  }
  if (handler_) handler_(message);
}

QueuedConnection::QueuedConnection(Handler handler) : handler_(std::move(handler)) {
  worker_ = std::thread([this] { drain_loop(); });
}

QueuedConnection::~QueuedConnection() {
  close();
  if (worker_.joinable()) worker_.join();
}

void QueuedConnection::send(const std::string& message) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!closed_) {
      queue_.push_back(message);
      cv_.notify_one();
      return;
    }
  }
  ++dropped_;
  log::warn("QueuedConnection: dropping message on closed connection");
}

void QueuedConnection::close() {
  std::lock_guard<std::mutex> lock(mu_);
  closed_ = true;
  cv_.notify_all();
}

bool QueuedConnection::closed() const {
  std::lock_guard<std::mutex> lock(mu_);
  return closed_;
}

void QueuedConnection::flush() {
  std::unique_lock<std::mutex> lock(mu_);
  idle_cv_.wait(lock, [this] { return queue_.empty() && !busy_; });
}

void QueuedConnection::drain_loop() {
  std::unique_lock<std::mutex> lock(mu_);
  for (;;) {
    cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) break;  // closed and drained

    std::string msg = std::move(queue_.front());
    queue_.pop_front();
    busy_ = true;
    lock.unlock();
    try {
      if (handler_) handler_(msg);
    } catch (const std::exception& e) {
      log::error(std::string("QueuedConnection: receiver failed: ") + e.what());
    }
    ++delivered_;
    lock.lock();
    busy_ = false;
    if (queue_.empty()) idle_cv_.notify_all();
  }
  busy_ = false;
  idle_cv_.notify_all();
}

} // namespace colonia
