#pragma once
/*
 * Settings
 *
 * Purpose: runtime options read from ~/.fneditrc and changed with :set.
 * Format: one command per line; blank lines and lines starting with '#', '"'
 *         or '//' are skipped; a leading ':' is allowed.
 * Commands: set tabwidth N | set number on|off | set loglevel L |
 *           set logfile PATH | set formatter EXT CMD [ARGS...]
 */
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>
#include "config.hpp"
#include "formatter.hpp"

struct Settings {
  int tab_width = FN_TAB_WIDTH;
  bool show_line_numbers = false;
  std::string log_level = FN_DEFAULT_LOG_LEVEL;
  std::filesystem::path log_path = FN_DEFAULT_LOG_PATH;
  // extension (lowercase, no dot) -> argv
  std::map<std::string, std::vector<std::string>> formatters = {
    {"zig", {"zig", "fmt", "--stdin"}},
  };
};

std::vector<std::string> split_words(std::string_view line);

// Applies one `set ...` command (words already split, "set" included).
// Returns false with msg when the command is unknown or its value is invalid.
bool apply_setting(Settings& settings, const std::vector<std::string>& words, std::string& msg);

// Missing file is fine. Bad lines are skipped and reported in msg ("line N: ...").
// Returns false only when the file exists but can not be read.
bool load_settings(const std::filesystem::path& path, Settings& settings, std::string& msg);

std::filesystem::path default_rc_path();

FormatterRegistry make_formatter_registry(const Settings& settings);
