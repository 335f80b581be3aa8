#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "colonia/util/log.h"

namespace colonia::testworld {

// Collects warnings and errors for the lifetime of the capture.
class LogCapture {
 public:
  LogCapture() : saved_(log::level()) {
    log::set_level(log::Level::Warn);
    log::set_sink([this](log::Level, const std::string& msg) {
      std::lock_guard<std::mutex> lock(mu_);
      lines_.push_back(msg);
    });
  }
  ~LogCapture() {
    log::set_sink({});
    log::set_level(saved_);
  }
  LogCapture(const LogCapture&) = delete;
  LogCapture& operator=(const LogCapture&) = delete;

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& l : lines_) {
      if (l.find(needle) != std::string::npos) return true;
    }
    return false;
  }

 private:
  log::Level saved_;
  mutable std::mutex mu_;
  std::vector<std::string> lines_;
};

} // namespace colonia::testworld
