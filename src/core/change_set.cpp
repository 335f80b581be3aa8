#include "colonia/core/change_set.h"

#include <algorithm>
#include <iterator>
#include <stdexcept>

#include "colonia/util/log.h"
#include "colonia/util/strings.h"

namespace colonia {
namespace {

std::vector<std::string> sorted_unique(std::vector<std::string> v) {
  std::sort(v.begin(), v.end());
  v.erase(std::unique(v.begin(), v.end()), v.end());
  return v;
}

std::vector<std::string> field_union(const std::vector<std::string>& a, const std::vector<std::string>& b) {
  std::vector<std::string> out;
  out.reserve(a.size() + b.size());
  std::set_union(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(out));
  return out;
}

bool change_before(const Change& a, const Change& b) {
  if (a.priority != b.priority) return a.priority < b.priority;
  return a.seq < b.seq;
}

} // namespace

void ChangeSet::push(Change c) {
  c.seq = next_seq_++;
  const std::size_t idx = entries_.size();
  if (c.kind != ChangeKind::Message) by_subject_[c.subject.id].push_back(idx);
  entries_.push_back(std::move(c));
  live_.push_back(true);
  ++live_count_;
}

void ChangeSet::replace(std::size_t index, Change c) {
  entries_[index] = std::move(c);
}

void ChangeSet::drop(std::size_t index) {
  if (!live_[index]) return;
  live_[index] = false;
  --live_count_;
  auto it = by_subject_.find(entries_[index].subject.id);
  if (it == by_subject_.end()) return;
  auto& v = it->second;
  v.erase(std::remove(v.begin(), v.end(), index), v.end());
  if (v.empty()) by_subject_.erase(it);
}

std::size_t ChangeSet::find_live(Id subject, ChangeKind kind) const {
  auto it = by_subject_.find(subject);
  if (it == by_subject_.end()) return npos;
  for (std::size_t idx : it->second) {
    if (live_[idx] && entries_[idx].kind == kind) return idx;
  }
  return npos;
}

void ChangeSet::append(ChangeKind kind, const EntityRef& subject, ChangePriority priority, See see) {
  if (kind == ChangeKind::UpdatePartial || kind == ChangeKind::Message || kind == ChangeKind::OwnerChange) {
    throw std::invalid_argument(concat("ChangeSet::append: use the dedicated append for '",
                                       change_kind_name(kind), "'"));
  }

  if (kind == ChangeKind::Remove) {
    if (removed_.count(subject.id)) {
      log::debug(concat("ChangeSet: duplicate removal of ", subject.id, " ignored"));
      return;
    }
    auto it = by_subject_.find(subject.id);
    if (it != by_subject_.end()) {
      const std::vector<std::size_t> pending = it->second;
      for (std::size_t idx : pending) drop(idx);
    }
    removed_.insert(subject.id);
    Change c;
    c.kind = ChangeKind::Remove;
    c.subject = subject;
    c.priority = priority;
    c.see = std::move(see);
    push(std::move(c));
    return;
  }

  if (removed_.count(subject.id)) {
    log::warn(concat("ChangeSet: ignoring '", change_kind_name(kind), "' for removed ",
                     entity_kind_name(subject.kind), " ", subject.id));
    return;
  }

  if (kind == ChangeKind::UpdateFull) {
    auto it = by_subject_.find(subject.id);
    if (it != by_subject_.end()) {
      const std::vector<std::size_t> pending = it->second;
      for (std::size_t idx : pending) {
        if (entries_[idx].kind == ChangeKind::UpdatePartial) {
          see.merge(entries_[idx].see);
          drop(idx);
        }
      }
    }
  }

  // An add or full update already pending for the subject covers this one:
  // the projection reads current values at flush time.
  std::size_t existing = find_live(subject.id, ChangeKind::Add);
  if (existing == npos) existing = find_live(subject.id, ChangeKind::UpdateFull);
  if (existing != npos) {
    Change c = entries_[existing];
    c.see.merge(see);
    c.subject = subject;
    if (kind == ChangeKind::Add) c.kind = ChangeKind::Add;
    replace(existing, std::move(c));
    return;
  }

  Change c;
  c.kind = kind;
  c.subject = subject;
  c.priority = priority;
  c.see = std::move(see);
  push(std::move(c));
}

void ChangeSet::append_partial(const EntityRef& subject, std::vector<std::string> fields, ChangePriority priority,
                               See see) {
  if (removed_.count(subject.id)) {
    log::warn(concat("ChangeSet: ignoring partial update for removed ", entity_kind_name(subject.kind), " ",
                     subject.id));
    return;
  }
  fields = sorted_unique(std::move(fields));
  if (fields.empty()) return;

  std::size_t whole = find_live(subject.id, ChangeKind::Add);
  if (whole == npos) whole = find_live(subject.id, ChangeKind::UpdateFull);
  if (whole != npos) {
    Change c = entries_[whole];
    c.see.merge(see);
    c.subject = subject;
    replace(whole, std::move(c));
    return;
  }

  const std::size_t prev = find_live(subject.id, ChangeKind::UpdatePartial);
  if (prev != npos) {
    Change c = entries_[prev];
    c.fields = field_union(c.fields, fields);
    c.priority = priority;
    c.see.merge(see);
    c.subject = subject;
    c.seq = next_seq_++;
    replace(prev, std::move(c));
    return;
  }

  Change c;
  c.kind = ChangeKind::UpdatePartial;
  c.subject = subject;
  c.priority = priority;
  c.see = std::move(see);
  c.fields = std::move(fields);
  push(std::move(c));
}

void ChangeSet::append_owner_change(const EntityRef& subject, Id old_owner, Id new_owner, See see) {
  if (removed_.count(subject.id)) {
    log::warn(concat("ChangeSet: ignoring owner change for removed ", entity_kind_name(subject.kind), " ",
                     subject.id));
    return;
  }
  const See plain = see;
  see.always(old_owner).always(new_owner);

  const std::size_t prev = find_live(subject.id, ChangeKind::OwnerChange);
  if (prev != npos) {
    if (entries_[prev].old_owner == new_owner) {
      // Back with its first owner: no transfer is reported, and the
      // intermediate owner is not named. Attributes still go out in full.
      drop(prev);
      append(ChangeKind::UpdateFull, subject, ChangePriority::State, plain);
      return;
    }
    Change c = entries_[prev];
    c.new_owner = new_owner;
    c.see.merge(see);
    c.subject = subject;
    c.seq = next_seq_++;
    replace(prev, std::move(c));
    return;
  }

  Change c;
  c.kind = ChangeKind::OwnerChange;
  c.subject = subject;
  c.priority = ChangePriority::Ownership;
  c.see = std::move(see);
  c.old_owner = old_owner;
  c.new_owner = new_owner;
  push(std::move(c));
}

void ChangeSet::append_message(See see, StringTemplate text, ChangePriority priority) {
  Change c;
  c.kind = ChangeKind::Message;
  c.priority = priority;
  c.see = std::move(see);
  c.message = std::move(text);
  push(std::move(c));
}

std::vector<Change> ChangeSet::sorted() const {
  std::vector<Change> out = in_insertion_order();
  std::stable_sort(out.begin(), out.end(), change_before);
  return out;
}

std::vector<Change> ChangeSet::in_insertion_order() const {
  std::vector<Change> out;
  out.reserve(live_count_);
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    if (live_[i]) out.push_back(entries_[i]);
  }
  std::sort(out.begin(), out.end(), [](const Change& a, const Change& b) { return a.seq < b.seq; });
  return out;
}

} // namespace colonia
