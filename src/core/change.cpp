#include "colonia/core/change.h"

#include <algorithm>

namespace colonia {

const char* change_kind_name(ChangeKind k) {
  switch (k) {
    case ChangeKind::Add: return "add";
    case ChangeKind::Remove: return "remove";
    case ChangeKind::UpdateFull: return "full";
    case ChangeKind::UpdatePartial: return "partial";
    case ChangeKind::Message: return "message";
    case ChangeKind::OwnerChange: return "owner";
  }
  return "full";
}

bool change_kind_from_name(const std::string& s, ChangeKind& out) {
  if (s == "add") out = ChangeKind::Add;
  else if (s == "remove") out = ChangeKind::Remove;
  else if (s == "full") out = ChangeKind::UpdateFull;
  else if (s == "partial") out = ChangeKind::UpdatePartial;
  else if (s == "message") out = ChangeKind::Message;
  else if (s == "owner") out = ChangeKind::OwnerChange;
  else return false;
  return true;
}

See See::all() {
  See s;
  s.all_ = true;
  return s;
}

See See::only_owner() {
  See s;
  s.owner_ = true;
  return s;
}

See See::perceived() {
  See s;
  s.perceived_ = true;
  return s;
}

See See::only(Id player) {
  See s;
  s.always(player);
  return s;
}

See See::players(std::vector<Id> ids) {
  See s;
  for (Id id : ids) s.always(id);
  return s;
}

See& See::always(Id player) {
  if (player == kInvalidId) return *this;
  auto it = std::lower_bound(named_.begin(), named_.end(), player);
  if (it == named_.end() || *it != player) named_.insert(it, player);
  return *this;
}

See& See::merge(const See& other) {
  all_ = all_ || other.all_;
  owner_ = owner_ || other.owner_;
  perceived_ = perceived_ || other.perceived_;
  for (Id id : other.named_) always(id);
  return *this;
}

bool See::names(Id player) const { return std::binary_search(named_.begin(), named_.end(), player); }

See default_see_for(EntityKind kind) {
  switch (kind) {
    case EntityKind::Game:
    case EntityKind::Player:
      return See::all();
    case EntityKind::Tile:
    case EntityKind::Unit:
    case EntityKind::Settlement:
      return See::perceived();
    case EntityKind::Building:
    case EntityKind::Wish:
    case EntityKind::Mission:
      return See::only_owner();
  }
  return See::only_owner();
}

} // namespace colonia
