#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "colonia/core/ai.h"
#include "colonia/core/config.h"
#include "colonia/core/rules.h"
#include "colonia/core/scenario.h"
#include "colonia/core/serialization.h"
#include "colonia/core/session.h"
#include "colonia/util/log.h"

namespace {

#ifndef COLONIA_VERSION
#define COLONIA_VERSION "unknown"
#endif

int get_int_arg(int argc, char** argv, const std::string& key, int def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stoi(argv[i + 1]);
  }
  return def;
}

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

void print_usage(const char* exe) {
  std::cout << "Colonia server v" << COLONIA_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "colonia_server") << " [options]\n\n";
  std::cout << "Runs a headless game with every player driven by the built-in AI.\n\n";
  std::cout << "Options:\n";
  std::cout << "  --players N      Colonial players in a new game (default: 4)\n";
  std::cout << "  --width N        Map width (default: 24)\n";
  std::cout << "  --height N       Map height (default: 16)\n";
  std::cout << "  --seed N         Map seed (default: 42)\n";
  std::cout << "  --rounds N       Full turns to play (default: 20)\n";
  std::cout << "  --config PATH    Game config JSON (default: built-in defaults)\n";
  std::cout << "  --rules PATH     Rules JSON (default: built-in rules)\n";
  std::cout << "  --load PATH      Continue a saved game instead of generating one\n";
  std::cout << "  --save PATH      Save the game after playing\n";
  std::cout << "  --log-level L    debug|info|warn|error|off (default: info)\n";
  std::cout << "  --check          Run the integrity checker after playing; exit 2 if broken\n";
  std::cout << "  --version        Print version and exit\n";
  std::cout << "  --help           Show this help\n";
}

void print_summary(const colonia::GameState& s) {
  std::cout << "Turn " << s.game.turn;
  if (s.game.game_over) {
    std::cout << " (game over";
    if (const auto* w = colonia::find_ptr(s.players, s.game.winner_id)) std::cout << ", winner: " << w->name;
    std::cout << ")";
  }
  std::cout << "\n";

  for (colonia::Id pid : s.player_order) {
    const colonia::Player& p = s.players.at(pid);
    int settlements = 0;
    int population = 0;
    for (const auto& [_, st] : s.settlements) {
      if (st.owner_id != pid) continue;
      ++settlements;
      population += st.population;
    }
    int units = 0;
    for (const auto& [_, u] : s.units) {
      if (u.owner_id == pid) ++units;
    }
    std::cout << "  " << p.name << (p.dead ? " [dead]" : "") << ": settlements=" << settlements
              << " population=" << population << " units=" << units << " gold=" << p.gold
              << " explored=" << p.explored_tiles.size() << "\n";
  }

  if (!s.history.empty()) {
    std::cout << "History:\n";
    for (const auto& h : s.history) {
      std::cout << "  turn " << h.turn << ": " << colonia::history_event_type_name(h.type) << " " << h.text.key;
      for (const auto& [k, v] : h.text.args) std::cout << " " << k << "=" << v;
      std::cout << "\n";
    }
  }
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << COLONIA_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    const std::string level_text = get_str_arg(argc, argv, "--log-level", "info");
    colonia::log::Level level = colonia::log::Level::Info;
    if (!colonia::log::parse_level(level_text, level)) {
      std::cerr << "Unknown log level: " << level_text << "\n";
      return 1;
    }
    colonia::log::set_level(level);

    const int rounds = get_int_arg(argc, argv, "--rounds", 20);
    const std::string config_path = get_str_arg(argc, argv, "--config", "");
    const std::string rules_path = get_str_arg(argc, argv, "--rules", "");
    const std::string load_path = get_str_arg(argc, argv, "--load", "");
    const std::string save_path = get_str_arg(argc, argv, "--save", "");
    const bool check = has_flag(argc, argv, "--check");

    colonia::Rules rules = rules_path.empty() ? colonia::make_default_rules() : colonia::load_rules_from_file(rules_path);
    colonia::GameConfig cfg = config_path.empty() ? colonia::GameConfig{} : colonia::load_game_config_from_file(config_path);
    // Turns are driven explicitly below.
    cfg.ai_rounds_per_drive = 0;

    colonia::GameState state;
    if (!load_path.empty()) {
      state = colonia::load_game_file(load_path);
    } else {
      colonia::ScenarioConfig sc;
      sc.players = get_int_arg(argc, argv, "--players", sc.players);
      sc.width = get_int_arg(argc, argv, "--width", sc.width);
      sc.height = get_int_arg(argc, argv, "--height", sc.height);
      sc.seed = static_cast<std::uint64_t>(get_int_arg(argc, argv, "--seed", static_cast<int>(sc.seed)));
      state = colonia::make_scenario(sc, rules, cfg);
    }

    std::vector<colonia::Id> players = state.player_order;
    colonia::GameSession session(std::move(state), std::move(rules), cfg);
    for (colonia::Id pid : players) {
      session.attach_ai(pid, std::make_unique<colonia::ExplorerAi>(session.rules()));
    }

    session.start();
    session.run_ai_rounds(rounds);

    const colonia::GameState result = session.snapshot();
    print_summary(result);

    int exit_code = 0;
    if (check) {
      const colonia::IntegrityReport report = session.check_integrity(false);
      std::cout << "Integrity: ok=" << report.ok << " repaired=" << report.repaired << " broken=" << report.broken
                << "\n";
      for (const auto& p : report.problems) std::cout << "  " << p << "\n";
      if (report.broken > 0) exit_code = 2;
    }

    if (!save_path.empty()) {
      session.save(save_path);
      std::cout << "Saved to " << save_path << "\n";
    }
    return exit_code;
  } catch (const std::exception& e) {
    colonia::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
