#include "colonia/core/projection.h"

#include <algorithm>

#include "colonia/core/entity_codec.h"
#include "colonia/util/log.h"
#include "colonia/util/strings.h"

namespace colonia {
namespace {

class Projector {
 public:
  Projector(const VisibilityOracle& oracle, const EntityRegistry& registry, ObserverState& obs,
            std::vector<ProjectedChange>& out)
      : oracle_(oracle), registry_(registry), obs_(obs), out_(out) {}

  bool knows(Id id) const { return obs_.known.count(id) != 0; }

  void introduce(Id id, Visibility level) {
    const auto kind = registry_.kind_of(id);
    if (!kind) return;
    pending_.insert(id);
    ProjectedChange pc;
    pc.op = ChangeKind::Add;
    pc.id = id;
    pc.kind = *kind;
    pc.data = visible_fields(registry_.state(), id, *kind, level);
    resolve_references(pc.data, *kind);
    pending_.erase(id);
    obs_.known.insert(id);
    out_.push_back(std::move(pc));
  }

  // Removes `id` and whatever the observer knows inside it from the mirror.
  void withdraw(Id id) {
    for (Id child : registry_.contents_of(id)) {
      if (knows(child)) withdraw(child);
    }
    obs_.known.erase(id);
    ProjectedChange pc;
    pc.op = ChangeKind::Remove;
    pc.id = id;
    if (const auto kind = registry_.kind_of(id)) pc.kind = *kind;
    out_.push_back(std::move(pc));
  }

  // Introduces what `data` refers to, or blanks references the observer is
  // not entitled to.
  void resolve_references(json::Object& data, EntityKind kind) {
    const EntityCodec& codec = codec_for(kind);
    for (const auto& field : codec.strong_references()) {
      auto it = data.find(field);
      if (it == data.end()) continue;
      const Id ref = static_cast<Id>(it->second.int_value());
      if (ref == kInvalidId || knows(ref) || pending_.count(ref)) continue;
      const Visibility v = default_visibility(ref);
      if (v == Visibility::None) {
        log::debug(concat("projection: hiding ", field, "=", ref, " from player ", obs_.player));
        it->second = kInvalidId;
        continue;
      }
      introduce(ref, v);
    }
    for (const auto& field : codec.weak_references()) {
      auto it = data.find(field);
      if (it == data.end()) continue;
      const Id ref = static_cast<Id>(it->second.int_value());
      if (ref == kInvalidId || knows(ref) || pending_.count(ref)) continue;
      const Visibility v = default_visibility(ref);
      if (v == Visibility::None) {
        // Hidden or disposed targets read as NOT_FOUND on the client.
        it->second = kInvalidId;
        continue;
      }
      introduce(ref, v);
    }
  }

  void apply(const Change& c) {
    switch (c.kind) {
      case ChangeKind::Message: {
        if (!oracle_.receives_message(obs_.player, c.see)) return;
        ProjectedChange pc;
        pc.op = ChangeKind::Message;
        pc.message = c.message;
        out_.push_back(std::move(pc));
        return;
      }
      case ChangeKind::Remove: {
        if (obs_.known.erase(c.subject.id) == 0) return;
        ProjectedChange pc;
        pc.op = ChangeKind::Remove;
        pc.id = c.subject.id;
        pc.kind = c.subject.kind;
        out_.push_back(std::move(pc));
        return;
      }
      case ChangeKind::Add:
      case ChangeKind::UpdateFull:
      case ChangeKind::UpdatePartial:
      case ChangeKind::OwnerChange:
        break;
    }

    const Id id = c.subject.id;
    const auto kind = registry_.kind_of(id);
    if (!kind) return;

    const Visibility v = oracle_.visible(obs_.player, registry_.ref(id), c.see);
    if (v == Visibility::None) {
      // A unit that moved out of everything the observer knows is withdrawn
      // from its mirror rather than left behind at a stale location.
      if (*kind == EntityKind::Unit && knows(id) && default_visibility(id) == Visibility::None) withdraw(id);
      return;
    }
    if (!knows(id)) {
      introduce(id, v);
      return;
    }

    ProjectedChange pc;
    pc.id = id;
    pc.kind = *kind;
    switch (c.kind) {
      case ChangeKind::UpdatePartial:
        pc.op = ChangeKind::UpdatePartial;
        pc.data = visible_fields(registry_.state(), id, *kind, v, &c.fields);
        if (pc.data.empty()) return;
        break;
      case ChangeKind::OwnerChange:
        pc.op = ChangeKind::OwnerChange;
        pc.old_owner = c.old_owner;
        pc.new_owner = c.new_owner;
        pc.data = visible_fields(registry_.state(), id, *kind, v);
        break;
      default:
        pc.op = ChangeKind::UpdateFull;
        pc.data = visible_fields(registry_.state(), id, *kind, v);
        break;
    }
    resolve_references(pc.data, *kind);
    out_.push_back(std::move(pc));
  }

 private:
  Visibility default_visibility(Id id) const {
    const auto kind = registry_.kind_of(id);
    if (!kind) return Visibility::None;
    return oracle_.visible(obs_.player, registry_.ref(id), default_see_for(*kind));
  }

  const VisibilityOracle& oracle_;
  const EntityRegistry& registry_;
  ObserverState& obs_;
  std::vector<ProjectedChange>& out_;
  // Entities whose add is being assembled. References to them are allowed.
  std::unordered_set<Id> pending_;
};

} // namespace

std::vector<ProjectedChange> project(const ChangeSet& cs, const VisibilityOracle& oracle,
                                     const EntityRegistry& registry, ObserverState& obs) {
  std::vector<ProjectedChange> out;
  Projector p(oracle, registry, obs, out);
  for (const Change& c : cs.sorted()) p.apply(c);
  return out;
}

std::vector<ProjectedChange> project_snapshot(const VisibilityOracle& oracle, const EntityRegistry& registry,
                                              ObserverState& obs) {
  std::vector<ProjectedChange> out;
  Projector p(oracle, registry, obs, out);

  std::vector<Id> ids;
  ids.reserve(registry.state().kinds.size());
  for (const auto& [id, _] : registry.state().kinds) ids.push_back(id);
  std::sort(ids.begin(), ids.end());

  for (Id id : ids) {
    if (p.knows(id)) continue;
    const EntityKind kind = registry.state().kinds.at(id);
    const Visibility v = oracle.visible(obs.player, registry.ref(id), default_see_for(kind));
    if (v != Visibility::None) p.introduce(id, v);
  }
  return out;
}

} // namespace colonia
