#include "colonia/core/client_mirror.h"

#include "colonia/core/entity_codec.h"
#include "colonia/core/wire.h"
#include "colonia/util/strings.h"

namespace colonia {

void ClientMirror::apply(const UpdateBatch& batch) {
  if (player_ != kInvalidId && batch.observer != player_) {
    throw ProtocolError(concat("batch for player ", batch.observer, " delivered to player ", player_));
  }
  if (batch.seq != last_seq_ + 1) {
    throw ProtocolError(concat("out of sequence batch: expected ", last_seq_ + 1, ", got ", batch.seq));
  }

  if (batch.rejection) {
    last_seq_ = batch.seq;
    last_rejection_ = batch.rejection;
    return;
  }

  // Applied to a copy so that a bad batch leaves the mirror untouched.
  std::map<Id, MirrorEntity> next = entities_;
  std::vector<Id> added;
  std::vector<StringTemplate> new_messages;
  for (const auto& c : batch.changes) {
    switch (c.op) {
      case ChangeKind::Add:
        next[c.id] = MirrorEntity{c.kind, c.data};
        added.push_back(c.id);
        break;
      case ChangeKind::UpdateFull: {
        auto it = next.find(c.id);
        if (it == next.end()) throw ProtocolError(concat("full update for unknown entity ", c.id));
        it->second = MirrorEntity{c.kind, c.data};
        break;
      }
      case ChangeKind::UpdatePartial: {
        auto it = next.find(c.id);
        if (it == next.end()) throw ProtocolError(concat("partial update for unknown entity ", c.id));
        for (const auto& [k, v] : c.data) it->second.fields[k] = v;
        break;
      }
      case ChangeKind::OwnerChange: {
        auto it = next.find(c.id);
        if (it == next.end()) throw ProtocolError(concat("owner change for unknown entity ", c.id));
        for (const auto& [k, v] : c.data) it->second.fields[k] = v;
        break;
      }
      case ChangeKind::Remove:
        if (next.erase(c.id) == 0) throw ProtocolError(concat("removal of unknown entity ", c.id));
        break;
      case ChangeKind::Message:
        new_messages.push_back(c.message);
        break;
    }
  }

  entities_ = std::move(next);
  introduced_.insert(added.begin(), added.end());
  messages_.insert(messages_.end(), new_messages.begin(), new_messages.end());
  last_seq_ = batch.seq;
  last_rejection_.reset();
}

void ClientMirror::apply_wire(const std::string& text) { apply(decode_update(text)); }

const MirrorEntity* ClientMirror::find(Id id) const {
  auto it = entities_.find(id);
  return it == entities_.end() ? nullptr : &it->second;
}

std::vector<Id> ClientMirror::ids_of_kind(EntityKind kind) const {
  std::vector<Id> out;
  for (const auto& [id, e] : entities_) {
    if (e.kind == kind) out.push_back(id);
  }
  return out;
}

std::int64_t ClientMirror::int_field(Id id, const std::string& field, std::int64_t def) const {
  const MirrorEntity* e = find(id);
  if (!e) return def;
  auto it = e->fields.find(field);
  if (it == e->fields.end() || !it->second.is_number()) return def;
  return it->second.int_value(def);
}

std::string ClientMirror::string_field(Id id, const std::string& field, const std::string& def) const {
  const MirrorEntity* e = find(id);
  if (!e) return def;
  auto it = e->fields.find(field);
  if (it == e->fields.end()) return def;
  return it->second.string_value(def);
}

Id ClientMirror::game_id() const {
  for (const auto& [id, e] : entities_) {
    if (e.kind == EntityKind::Game) return id;
  }
  return kInvalidId;
}

int ClientMirror::turn() const { return static_cast<int>(int_field(game_id(), "turn", 0)); }

Id ClientMirror::current_player() const {
  return static_cast<Id>(int_field(game_id(), "current_player_id", 0));
}

std::vector<std::string> ClientMirror::dangling_references() const {
  std::vector<std::string> out;
  for (const auto& [id, e] : entities_) {
    for (const auto& field : codec_for(e.kind).strong_references()) {
      auto it = e.fields.find(field);
      if (it == e.fields.end()) continue;
      const Id ref = static_cast<Id>(it->second.int_value());
      if (ref == kInvalidId || entities_.count(ref)) continue;
      out.push_back(concat(entity_kind_name(e.kind), " ", id, ".", field, " -> ", ref));
    }
    for (const auto& field : codec_for(e.kind).weak_references()) {
      auto it = e.fields.find(field);
      if (it == e.fields.end()) continue;
      const Id ref = static_cast<Id>(it->second.int_value());
      if (ref == kInvalidId || entities_.count(ref) || introduced_.count(ref)) continue;
      out.push_back(concat(entity_kind_name(e.kind), " ", id, ".", field, " -> ", ref));
    }
  }
  return out;
}

} // namespace colonia
