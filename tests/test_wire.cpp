#include <iostream>
#include <string>

#include "colonia/core/errors.h"
#include "colonia/core/wire.h"

#define COLONIA_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool decode_update_throws(const std::string& text) {
  try {
    (void)colonia::decode_update(text);
  } catch (const colonia::ProtocolError&) {
    return true;
  }
  return false;
}

bool decode_action_throws(const std::string& text) {
  try {
    (void)colonia::decode_action(text);
  } catch (const colonia::ProtocolError&) {
    return true;
  }
  return false;
}

} // namespace

int test_wire() {
  using namespace colonia;

  UpdateBatch batch;
  batch.seq = 7;
  batch.observer = 2;
  {
    ProjectedChange gone;
    gone.op = ChangeKind::Remove;
    gone.id = 40;
    gone.kind = EntityKind::Unit;
    batch.changes.push_back(gone);

    ProjectedChange owner;
    owner.op = ChangeKind::OwnerChange;
    owner.id = 41;
    owner.kind = EntityKind::Settlement;
    owner.old_owner = 3;
    owner.new_owner = 2;
    owner.data["name"] = "Jamestown";
    owner.data["owner_id"] = 2;
    batch.changes.push_back(owner);

    ProjectedChange msg;
    msg.op = ChangeKind::Message;
    msg.message.key = "model.diplomacy.powerTransfer";
    msg.message.add("%loserNation%", "English").add("%nation%", "Dutch");
    batch.changes.push_back(msg);
  }

  const std::string text = encode_update(batch);
  COLONIA_ASSERT(text.find('\n') == std::string::npos);
  COLONIA_ASSERT(text.find("\"type\":\"update\"") != std::string::npos);

  const UpdateBatch back = decode_update(text);
  COLONIA_ASSERT(back.seq == 7);
  COLONIA_ASSERT(back.observer == 2);
  COLONIA_ASSERT(!back.rejection.has_value());
  COLONIA_ASSERT(back.changes.size() == 3);
  COLONIA_ASSERT(back.changes[0].op == ChangeKind::Remove);
  COLONIA_ASSERT(back.changes[0].kind == EntityKind::Unit);
  COLONIA_ASSERT(back.changes[0].data.empty());
  COLONIA_ASSERT(back.changes[1].op == ChangeKind::OwnerChange);
  COLONIA_ASSERT(back.changes[1].old_owner == 3);
  COLONIA_ASSERT(back.changes[1].new_owner == 2);
  COLONIA_ASSERT(back.changes[1].data.at("name").string_value() == "Jamestown");
  COLONIA_ASSERT(back.changes[2].op == ChangeKind::Message);
  COLONIA_ASSERT(back.changes[2].message.key == "model.diplomacy.powerTransfer");
  COLONIA_ASSERT(back.changes[2].message.args.size() == 2);

  // Rejections.
  UpdateBatch reject;
  reject.seq = 8;
  reject.observer = 2;
  reject.rejection = ownership_error("unit 9 is not owned by player 2");
  const UpdateBatch reject_back = decode_update(encode_update(reject));
  COLONIA_ASSERT(reject_back.rejection.has_value());
  COLONIA_ASSERT(reject_back.rejection->kind == ErrorKind::Ownership);
  COLONIA_ASSERT(reject_back.rejection->message == "unit 9 is not owned by player 2");
  COLONIA_ASSERT(reject_back.changes.empty());

  // Actions.
  ActionRequest req;
  req.seq = 3;
  req.player = 2;
  req.verb = "move";
  req.params["unit"] = 12;
  req.params["tile"] = 30;
  const ActionRequest req_back = decode_action(encode_action(req));
  COLONIA_ASSERT(req_back.seq == 3);
  COLONIA_ASSERT(req_back.player == 2);
  COLONIA_ASSERT(req_back.verb == "move");
  COLONIA_ASSERT(req_back.params.at("tile").int_value() == 30);

  const ActionRequest bare = decode_action(R"({"type":"action","seq":1,"player":2,"verb":"end_turn"})");
  COLONIA_ASSERT(bare.params.empty());

  // Malformed input.
  COLONIA_ASSERT(decode_update_throws("not json"));
  COLONIA_ASSERT(decode_update_throws(R"({"type":"update","seq":1,"observer":2})"));
  COLONIA_ASSERT(decode_update_throws(R"({"type":"update","seq":-1,"observer":2,"changes":[]})"));
  COLONIA_ASSERT(decode_update_throws(R"({"type":"update","seq":1,"observer":2,"changes":[{"op":"teleport","id":3,"entity":"unit"}]})"));
  COLONIA_ASSERT(decode_update_throws(R"({"type":"update","seq":1,"observer":2,"changes":[{"op":"full","id":3,"entity":"dragon","data":{}}]})"));
  COLONIA_ASSERT(decode_update_throws(R"({"type":"update","seq":1,"observer":2,"changes":[{"op":"partial","id":0,"entity":"unit","data":{}}]})"));
  COLONIA_ASSERT(decode_action_throws(R"({"type":"update","seq":1,"player":2,"verb":"move"})"));
  COLONIA_ASSERT(decode_action_throws(R"({"type":"action","seq":1,"player":2,"verb":""})"));
  COLONIA_ASSERT(decode_action_throws(R"({"type":"action","seq":1,"player":2,"verb":"move","params":[]})"));
  COLONIA_ASSERT(decode_action_throws("[1,2,3]"));

  return 0;
}
