#include "colonia/core/wire.h"

#include <exception>

#include "colonia/util/strings.h"

namespace colonia {
namespace {

using json::Array;
using json::Object;
using json::Value;

const Object& expect_object(const Value& v, const char* what) {
  const Object* o = v.as_object();
  if (!o) throw ProtocolError(concat(what, " must be an object"));
  return *o;
}

const Value& expect_key(const Object& o, const char* key, const char* what) {
  auto it = o.find(key);
  if (it == o.end()) throw ProtocolError(concat(what, ": missing '", key, "'"));
  return it->second;
}

std::string expect_string(const Object& o, const char* key, const char* what) {
  const Value& v = expect_key(o, key, what);
  if (!v.is_string()) throw ProtocolError(concat(what, ": '", key, "' must be a string"));
  return *v.as_string();
}

std::uint64_t expect_uint(const Object& o, const char* key, const char* what) {
  const Value& v = expect_key(o, key, what);
  if (!v.is_int() || v.int_value() < 0) throw ProtocolError(concat(what, ": '", key, "' must be a non-negative integer"));
  return static_cast<std::uint64_t>(v.int_value());
}

Value parse_document(const std::string& text) {
  try {
    return json::parse(text);
  } catch (const std::exception& e) {
    throw ProtocolError(concat("malformed message: ", e.what()));
  }
}

} // namespace

json::Value projected_change_to_json(const ProjectedChange& c) {
  Object o;
  o["op"] = change_kind_name(c.op);
  if (c.op == ChangeKind::Message) {
    Object args;
    for (const auto& [name, value] : c.message.args) args[name] = value;
    Object tmpl;
    tmpl["key"] = c.message.key;
    tmpl["args"] = std::move(args);
    o["template"] = std::move(tmpl);
    return o;
  }
  o["id"] = c.id;
  o["entity"] = entity_kind_name(c.kind);
  if (c.op == ChangeKind::Remove) return o;
  if (c.op == ChangeKind::OwnerChange) {
    o["old_owner"] = c.old_owner;
    o["new_owner"] = c.new_owner;
  }
  o["data"] = c.data;
  return o;
}

ProjectedChange projected_change_from_json(const json::Value& v) {
  const Object& o = expect_object(v, "change");
  ProjectedChange c;
  const std::string op = expect_string(o, "op", "change");
  if (!change_kind_from_name(op, c.op)) throw ProtocolError(concat("change: unknown op '", op, "'"));

  if (c.op == ChangeKind::Message) {
    const Object& tmpl = expect_object(expect_key(o, "template", "message"), "message template");
    c.message.key = expect_string(tmpl, "key", "message template");
    if (const auto it = tmpl.find("args"); it != tmpl.end()) {
      for (const auto& [name, value] : expect_object(it->second, "message args")) {
        if (!value.is_string()) throw ProtocolError(concat("message arg '", name, "' must be a string"));
        c.message.add(name, *value.as_string());
      }
    }
    return c;
  }

  c.id = expect_uint(o, "id", "change");
  if (c.id == kInvalidId) throw ProtocolError("change: id must be non-zero");
  const std::string entity = expect_string(o, "entity", "change");
  if (!entity_kind_from_name(entity, c.kind)) throw ProtocolError(concat("change: unknown entity '", entity, "'"));
  if (c.op == ChangeKind::Remove) return c;

  if (c.op == ChangeKind::OwnerChange) {
    c.old_owner = expect_uint(o, "old_owner", "owner change");
    c.new_owner = expect_uint(o, "new_owner", "owner change");
  }
  c.data = expect_object(expect_key(o, "data", "change"), "change data");
  return c;
}

std::string encode_update(const UpdateBatch& batch) {
  Object o;
  o["seq"] = batch.seq;
  o["observer"] = batch.observer;
  if (batch.rejection) {
    Object err;
    err["kind"] = error_kind_name(batch.rejection->kind);
    err["message"] = batch.rejection->message;
    o["type"] = "reject";
    o["error"] = std::move(err);
  } else {
    Array changes;
    changes.reserve(batch.changes.size());
    for (const auto& c : batch.changes) changes.push_back(projected_change_to_json(c));
    o["type"] = "update";
    o["changes"] = std::move(changes);
  }
  return json::stringify(o, 0);
}

UpdateBatch decode_update(const std::string& text) {
  const Value root = parse_document(text);
  const Object& o = expect_object(root, "update");
  UpdateBatch b;
  b.seq = expect_uint(o, "seq", "update");
  b.observer = expect_uint(o, "observer", "update");

  const std::string type = expect_string(o, "type", "update");
  if (type == "reject") {
    const Object& err = expect_object(expect_key(o, "error", "reject"), "reject error");
    ActionError e;
    const std::string kind = expect_string(err, "kind", "reject error");
    if (!error_kind_from_name(kind, e.kind)) throw ProtocolError(concat("reject: unknown error kind '", kind, "'"));
    e.message = expect_string(err, "message", "reject error");
    b.rejection = std::move(e);
    return b;
  }
  if (type != "update") throw ProtocolError(concat("unexpected message type '", type, "'"));

  const Value& changes = expect_key(o, "changes", "update");
  const Array* arr = changes.as_array();
  if (!arr) throw ProtocolError("update: 'changes' must be an array");
  b.changes.reserve(arr->size());
  for (const auto& c : *arr) b.changes.push_back(projected_change_from_json(c));
  return b;
}

std::string encode_action(const ActionRequest& req) {
  Object o;
  o["type"] = "action";
  o["seq"] = req.seq;
  o["player"] = req.player;
  o["verb"] = req.verb;
  o["params"] = req.params;
  return json::stringify(o, 0);
}

ActionRequest decode_action(const std::string& text) {
  const Value root = parse_document(text);
  const Object& o = expect_object(root, "action");
  if (expect_string(o, "type", "action") != "action") throw ProtocolError("action: 'type' must be \"action\"");
  ActionRequest req;
  req.seq = expect_uint(o, "seq", "action");
  req.player = expect_uint(o, "player", "action");
  req.verb = expect_string(o, "verb", "action");
  if (req.verb.empty()) throw ProtocolError("action: empty verb");
  if (const auto it = o.find("params"); it != o.end()) req.params = expect_object(it->second, "action params");
  return req;
}

} // namespace colonia
