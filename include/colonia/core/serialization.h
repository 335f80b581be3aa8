#pragma once

#include <string>

#include "colonia/core/game_state.h"
#include "colonia/util/json.h"

namespace colonia {

constexpr int kCurrentSaveVersion = 1;

// Serialize the game state into an in-memory JSON document.
json::Value serialize_game_to_json_value(const GameState& state);

// Serialize the game state into a JSON text document (pretty-printed).
std::string serialize_game_to_json(const GameState& state);

// Parse a saved game from JSON text. Every entity keeps its id, so weak
// references issued before the save resolve the same way after loading.
//
// Throws std::runtime_error for malformed documents and for a missing or
// newer save_version.
GameState deserialize_game_from_json(const std::string& json_text);

// File helpers. Writes are atomic (temp sibling + rename).
void save_game_file(const GameState& state, const std::string& path);
GameState load_game_file(const std::string& path);

} // namespace colonia
