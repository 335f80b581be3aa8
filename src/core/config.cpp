#include "colonia/core/config.h"

#include <set>
#include <stdexcept>

#include "colonia/util/file_io.h"
#include "colonia/util/log.h"

namespace colonia {
namespace {

using json::Object;
using json::Value;

// Reads known keys from one object level and warns about the rest.
class Reader {
 public:
  Reader(const Value& v, std::string where) : where_(std::move(where)) {
    obj_ = v.as_object();
    if (!obj_) throw std::runtime_error(where_ + ": expected an object");
  }

  ~Reader() {
    for (const auto& [key, _] : *obj_) {
      if (seen_.count(key) == 0) log::warn(where_ + ": ignoring unknown config key '" + key + "'");
    }
  }

  void read(const char* key, int& out) {
    if (const Value* v = take(key)) {
      if (!v->is_number()) throw std::runtime_error(where_ + ": '" + key + "' must be a number");
      out = static_cast<int>(v->int_value(out));
    }
  }

  void read(const char* key, std::uint64_t& out) {
    if (const Value* v = take(key)) {
      if (!v->is_number() || v->int_value() < 0) {
        throw std::runtime_error(where_ + ": '" + key + "' must be a non-negative number");
      }
      out = static_cast<std::uint64_t>(v->int_value());
    }
  }

  void read(const char* key, bool& out) {
    if (const Value* v = take(key)) {
      if (!v->is_bool()) throw std::runtime_error(where_ + ": '" + key + "' must be a boolean");
      out = v->bool_value(out);
    }
  }

  const Value* take(const char* key) {
    seen_.insert(key);
    auto it = obj_->find(key);
    return it == obj_->end() ? nullptr : &it->second;
  }

  const std::string& where() const { return where_; }

 private:
  const Object* obj_{nullptr};
  std::string where_;
  std::set<std::string> seen_;
};

} // namespace

GameConfig load_game_config_from_json(const json::Value& root, const std::string& source) {
  GameConfig cfg;
  Reader r(root, source);
  r.read("settlement_line_of_sight", cfg.settlement_line_of_sight);
  r.read("eliminate_players_without_assets", cfg.eliminate_players_without_assets);
  r.read("ai_plan_timeout_ms", cfg.ai_plan_timeout_ms);
  r.read("ai_rounds_per_drive", cfg.ai_rounds_per_drive);
  r.read("turn_timeout_ms", cfg.turn_timeout_ms);
  r.read("combat_seed", cfg.combat_seed);

  if (const Value* pt = r.take("power_transfer")) {
    Reader p(*pt, source + ".power_transfer");
    p.read("enabled", cfg.power_transfer.enabled);
    p.read("min_turn", cfg.power_transfer.min_turn);
    p.read("strong_threshold", cfg.power_transfer.strong_threshold);
    p.read("weak_threshold", cfg.power_transfer.weak_threshold);
  }
  if (const Value* vc = r.take("victory")) {
    Reader v(*vc, source + ".victory");
    v.read("defeat_ref", cfg.victory.defeat_ref);
    v.read("last_player_standing", cfg.victory.last_player_standing);
    v.read("last_human_standing", cfg.victory.last_human_standing);
  }

  if (cfg.settlement_line_of_sight < 0) throw std::runtime_error(source + ": settlement_line_of_sight < 0");
  if (cfg.ai_plan_timeout_ms <= 0) throw std::runtime_error(source + ": ai_plan_timeout_ms must be positive");
  if (cfg.ai_rounds_per_drive < 0) throw std::runtime_error(source + ": ai_rounds_per_drive < 0");
  if (cfg.turn_timeout_ms < 0) throw std::runtime_error(source + ": turn_timeout_ms < 0");
  return cfg;
}

GameConfig load_game_config_from_file(const std::string& path) {
  return load_game_config_from_json(json::parse(read_text_file(path)), path);
}

json::Value game_config_to_json(const GameConfig& cfg) {
  Object pt;
  pt["enabled"] = cfg.power_transfer.enabled;
  pt["min_turn"] = cfg.power_transfer.min_turn;
  pt["strong_threshold"] = cfg.power_transfer.strong_threshold;
  pt["weak_threshold"] = cfg.power_transfer.weak_threshold;

  Object vc;
  vc["defeat_ref"] = cfg.victory.defeat_ref;
  vc["last_player_standing"] = cfg.victory.last_player_standing;
  vc["last_human_standing"] = cfg.victory.last_human_standing;

  Object o;
  o["settlement_line_of_sight"] = cfg.settlement_line_of_sight;
  o["power_transfer"] = std::move(pt);
  o["victory"] = std::move(vc);
  o["eliminate_players_without_assets"] = cfg.eliminate_players_without_assets;
  o["ai_plan_timeout_ms"] = cfg.ai_plan_timeout_ms;
  o["ai_rounds_per_drive"] = cfg.ai_rounds_per_drive;
  o["turn_timeout_ms"] = cfg.turn_timeout_ms;
  o["combat_seed"] = cfg.combat_seed;
  return o;
}

} // namespace colonia
