#pragma once

#include <string>

#include "colonia/core/messages.h"

namespace colonia {

// One JSON document per message, on a single line.
//
// Decoders throw ProtocolError for malformed input. They do not check batch
// sequence numbers; that is the receiver's job (see ClientMirror).
std::string encode_update(const UpdateBatch& batch);
UpdateBatch decode_update(const std::string& text);

std::string encode_action(const ActionRequest& req);
ActionRequest decode_action(const std::string& text);

json::Value projected_change_to_json(const ProjectedChange& c);
ProjectedChange projected_change_from_json(const json::Value& v);

} // namespace colonia
