#include "gsnake_config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <unordered_map>

namespace gsnake {

namespace {

std::string trim(const std::string& text) {
  const auto first = text.find_first_not_of(" \t\r");
  if (first == std::string::npos) {
    return std::string();
  }
  const auto last = text.find_last_not_of(" \t\r");
  return text.substr(first, last - first + 1);
}

int parseInt(const std::string& key, const std::string& value) {
  std::size_t pos = 0;
  int result = 0;
  try {
    result = std::stoi(value, &pos);
  } catch (const std::invalid_argument&) {
    throw ConfigError("'" + key + "' expects an integer, got '" + value + "'");
  } catch (const std::out_of_range&) {
    throw ConfigError("'" + key + "' is out of range: '" + value + "'");
  }
  if (pos != value.size()) {
    throw ConfigError("'" + key + "' expects an integer, got '" + value + "'");
  }
  return result;
}

std::uint32_t parseSeed(const std::string& value) {
  std::size_t pos = 0;
  unsigned long result = 0;
  try {
    result = std::stoul(value, &pos);
  } catch (const std::exception&) {
    throw ConfigError("'seed' expects an unsigned integer, got '" + value + "'");
  }
  if (pos != value.size() || value.front() == '-' || result > UINT32_MAX) {
    throw ConfigError("'seed' expects an unsigned integer, got '" + value + "'");
  }
  return static_cast<std::uint32_t>(result);
}

using Setter = std::function<void(GameConfig&, const std::string&)>;

const std::unordered_map<std::string, Setter>& setters() {
  static const std::unordered_map<std::string, Setter> table = {
      {"rows", [](GameConfig& c, const std::string& v) { c.rows = parseInt("rows", v); }},
      {"cols", [](GameConfig& c, const std::string& v) { c.cols = parseInt("cols", v); }},
      {"starting_delay_ms",
       [](GameConfig& c, const std::string& v) {
         c.starting_delay_ms = parseInt("starting_delay_ms", v);
       }},
      {"delay_floor_ms",
       [](GameConfig& c, const std::string& v) {
         c.delay_floor_ms = parseInt("delay_floor_ms", v);
       }},
      {"snake_color", [](GameConfig& c, const std::string& v) { c.snake_color = v; }},
      {"food_color", [](GameConfig& c, const std::string& v) { c.food_color = v; }},
      {"background_color",
       [](GameConfig& c, const std::string& v) { c.background_color = v; }},
      {"grid_color", [](GameConfig& c, const std::string& v) { c.grid_color = v; }},
      {"window_width",
       [](GameConfig& c, const std::string& v) {
         c.window_width = parseInt("window_width", v);
       }},
      {"window_height",
       [](GameConfig& c, const std::string& v) {
         c.window_height = parseInt("window_height", v);
       }},
      {"view", [](GameConfig& c, const std::string& v) { c.view = v; }},
      {"log_file", [](GameConfig& c, const std::string& v) { c.log_file = v; }},
      {"log_level", [](GameConfig& c, const std::string& v) { c.log_level = v; }},
      {"seed", [](GameConfig& c, const std::string& v) { c.seed = parseSeed(v); }},
  };
  return table;
}

std::string homeDir() {
  const char* home = std::getenv("HOME");
  return (home != nullptr && *home != '\0') ? std::string(home) : std::string(".");
}

}  // namespace

void apply_setting(GameConfig& config, const std::string& key,
                   const std::string& value) {
  const auto& table = setters();
  const auto it = table.find(key);
  if (it == table.end()) {
    throw ConfigError("unknown setting '" + key + "'");
  }
  it->second(config, value);
}

GameConfig load_config(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigError("cannot open config file " + path);
  }

  GameConfig config;
  std::string line;
  int line_no = 0;
  while (std::getline(file, line)) {
    ++line_no;
    const auto hash = line.find('#');
    if (hash != std::string::npos) {
      line.erase(hash);
    }
    line = trim(line);
    if (line.empty()) {
      continue;
    }

    const auto eq = line.find('=');
    if (eq == std::string::npos) {
      throw ConfigError(path + ":" + std::to_string(line_no) +
                        ": expected 'key = value'");
    }
    const std::string key = trim(line.substr(0, eq));
    const std::string value = trim(line.substr(eq + 1));
    if (key.empty() || value.empty()) {
      throw ConfigError(path + ":" + std::to_string(line_no) +
                        ": expected 'key = value'");
    }

    try {
      apply_setting(config, key, value);
    } catch (const ConfigError& e) {
      throw ConfigError(path + ":" + std::to_string(line_no) + ": " + e.what());
    }
  }

  spdlog::debug("loaded settings from {}", path);
  return config;
}

GameConfig load_default_config() {
  const std::string path = home_path(GSNAKE_SETTINGS_FILE);
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    return load_config(path);
  }
  return GameConfig{};
}

void validate(const GameConfig& config) {
  if (config.rows < GSNAKE_MIN_SIDE || config.cols < GSNAKE_MIN_SIDE) {
    throw ConfigError("rows and cols must be at least 2");
  }
  if (config.starting_delay_ms <= 0) {
    throw ConfigError("starting_delay_ms must be positive");
  }
  if (config.delay_floor_ms < 0 ||
      config.delay_floor_ms > config.starting_delay_ms) {
    throw ConfigError("delay_floor_ms must be within [0, starting_delay_ms]");
  }
  if (config.window_width <= 0 || config.window_height <= 0) {
    throw ConfigError("window dimensions must be positive");
  }
  if (config.snake_color.empty() || config.food_color.empty() ||
      config.background_color.empty() || config.grid_color.empty()) {
    throw ConfigError("color names must not be empty");
  }
  if (config.view != "cli" && config.view != "desktop") {
    throw ConfigError("view must be 'cli' or 'desktop', got '" + config.view + "'");
  }
  // from_str возвращает off для неизвестных имён
  if (config.log_level != "off" &&
      spdlog::level::from_str(config.log_level) == spdlog::level::off) {
    throw ConfigError("unknown log_level '" + config.log_level + "'");
  }
}

std::string home_path(const std::string& name) {
  return (std::filesystem::path(homeDir()) / GSNAKE_HOME_DIR / name).string();
}

std::string resolved_log_file(const GameConfig& config) {
  if (config.log_file.empty()) {
    return home_path(GSNAKE_LOG_FILE);
  }
  if (config.log_file.rfind("~/", 0) == 0) {
    return (std::filesystem::path(homeDir()) / config.log_file.substr(2)).string();
  }
  return config.log_file;
}

}  // namespace gsnake
