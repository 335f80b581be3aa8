#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "colonia/core/change.h"

namespace colonia {

// Changes produced by one logical operation (an action, a combat, a turn
// advance).
//
// Appends are compacted per subject as they arrive:
// - two partial updates merge into one with the union of their fields and the
//   later priority;
// - a partial update after an add or full update of the same subject is
//   absorbed by it;
// - a full update discards earlier partial updates;
// - a removal discards every other pending change for the subject, and later
//   changes for a removed subject are ignored;
// - ownership changes merge into one transfer from the first old owner to the
//   last new owner.
// Messages are never compacted.
class ChangeSet {
 public:
  ChangeSet() = default;

  ChangeSet(const ChangeSet&) = delete;
  ChangeSet& operator=(const ChangeSet&) = delete;
  ChangeSet(ChangeSet&&) = default;
  ChangeSet& operator=(ChangeSet&&) = default;

  // Add, Remove or UpdateFull.
  void append(ChangeKind kind, const EntityRef& subject, ChangePriority priority, See see);

  void append_partial(const EntityRef& subject, std::vector<std::string> fields, ChangePriority priority, See see);

  // Both owners are added to the audience.
  void append_owner_change(const EntityRef& subject, Id old_owner, Id new_owner, See see);

  void append_message(See see, StringTemplate text, ChangePriority priority = ChangePriority::State);

  // Live changes in delivery order: (priority, insertion order).
  std::vector<Change> sorted() const;

  // Live changes in insertion order.
  std::vector<Change> in_insertion_order() const;

  std::size_t size() const { return live_count_; }
  bool empty() const { return live_count_ == 0; }

  bool removed(Id subject) const { return removed_.count(subject) != 0; }

 private:
  void push(Change c);
  void replace(std::size_t index, Change c);
  void drop(std::size_t index);

  // Index of the live change for `subject` with kind `kind`, or npos.
  std::size_t find_live(Id subject, ChangeKind kind) const;

  static constexpr std::size_t npos = static_cast<std::size_t>(-1);

  std::vector<Change> entries_;
  std::vector<bool> live_;
  std::size_t live_count_{0};
  std::uint64_t next_seq_{1};

  // Live entry indices per subject.
  std::unordered_map<Id, std::vector<std::size_t>> by_subject_;
  std::unordered_set<Id> removed_;
};

} // namespace colonia
