#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "colonia/core/client_mirror.h"
#include "colonia/core/messages.h"
#include "colonia/core/rules.h"

namespace colonia {

// Wall-clock budget for one planning call.
class Deadline {
 public:
  using Clock = std::chrono::steady_clock;

  explicit Deadline(std::chrono::milliseconds budget) : end_(Clock::now() + budget) {}

  bool expired() const { return Clock::now() >= end_; }

  std::chrono::milliseconds remaining() const {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(end_ - Clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
  }

 private:
  Clock::time_point end_;
};

// Decides what an AI player does with its turn.
//
// A planner sees the game only through the player's mirror, the same view a
// human client would have, and answers with action requests. It should check
// the deadline and return early; a plan returned after the deadline is thrown
// away and the player passes.
class AiPlanner {
 public:
  virtual ~AiPlanner() = default;

  virtual std::vector<ActionRequest> plan(const ClientMirror& view, Id player, const Deadline& deadline) = 0;

  virtual std::string name() const { return "ai"; }
};

// Founds one settlement with the first unit able to, then walks every unit
// with moves left toward the nearest edge of the explored map.
class ExplorerAi : public AiPlanner {
 public:
  explicit ExplorerAi(const Rules& rules) : rules_(rules) {}

  std::vector<ActionRequest> plan(const ClientMirror& view, Id player, const Deadline& deadline) override;

  std::string name() const override { return "explorer"; }

 private:
  const Rules& rules_;
};

} // namespace colonia
