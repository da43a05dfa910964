#include "settings.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <spdlog/spdlog.h>
#include "file_io.hpp"
#include "log.hpp"

std::vector<std::string> split_words(std::string_view line) {
  std::vector<std::string> words;
  std::size_t i = 0;
  while (i < line.size()) {
    while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) i++;
    std::size_t j = i;
    while (j < line.size() && !std::isspace(static_cast<unsigned char>(line[j]))) j++;
    if (j > i) words.emplace_back(line.substr(i, j - i));
    i = j;
  }
  return words;
}

static bool parse_on_off(const std::string& v, bool& out) {
  if (v == "on" || v == "1" || v == "true") { out = true; return true; }
  if (v == "off" || v == "0" || v == "false") { out = false; return true; }
  return false;
}

bool apply_setting(Settings& settings, const std::vector<std::string>& words, std::string& msg) {
  if (words.size() < 2 || words[0] != "set") {
    msg = words.empty() ? "empty command" : "unknown command: " + words[0];
    return false;
  }
  const std::string& name = words[1];

  if (name == "tabwidth") {
    if (words.size() != 3) { msg = "set tabwidth: use set tabwidth <width>"; return false; }
    const std::string& s = words[2];
    bool digits = !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
    if (!digits || s.size() > 3) { msg = "set tabwidth: width must be a number"; return false; }
    int w = std::stoi(s);
    if (w < 1) { msg = "set tabwidth: width must be >= 1"; return false; }
    settings.tab_width = w;
    msg = "tabwidth=" + s;
    return true;
  }
  if (name == "number") {
    bool on = !settings.show_line_numbers;
    if (words.size() == 3 && !parse_on_off(words[2], on)) { msg = "set number: use set number on|off"; return false; }
    if (words.size() > 3) { msg = "set number: use set number on|off"; return false; }
    settings.show_line_numbers = on;
    msg = on ? "number on" : "number off";
    return true;
  }
  if (name == "loglevel") {
    spdlog::level::level_enum lvl;
    if (words.size() != 3 || !parse_log_level(words[2], lvl)) {
      msg = "set loglevel: use trace|debug|info|warn|error|off";
      return false;
    }
    settings.log_level = words[2];
    msg = "loglevel=" + words[2];
    return true;
  }
  if (name == "logfile") {
    if (words.size() != 3) { msg = "set logfile: use set logfile <path>"; return false; }
    settings.log_path = words[2];
    msg = "logfile=" + words[2];
    return true;
  }
  if (name == "formatter") {
    if (words.size() < 4) { msg = "set formatter: use set formatter <ext> <cmd> [args...]"; return false; }
    std::string ext = words[2];
    if (!ext.empty() && ext[0] == '.') ext.erase(ext.begin());
    for (char& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    settings.formatters[ext] = std::vector<std::string>(words.begin() + 3, words.end());
    msg = "formatter " + ext + "=" + words[3];
    return true;
  }
  msg = "unknown option: " + name;
  return false;
}

bool load_settings(const std::filesystem::path& path, Settings& settings, std::string& msg) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return true;
  std::string contents;
  if (!read_whole_file(path, contents, msg)) return false;

  msg.clear();
  std::size_t line_no = 0;
  std::size_t start = 0;
  while (start <= contents.size()) {
    std::size_t nl = contents.find('\n', start);
    std::string_view line(contents.data() + start, (nl == std::string::npos ? contents.size() : nl) - start);
    start = nl == std::string::npos ? contents.size() + 1 : nl + 1;
    ++line_no;

    std::vector<std::string> words = split_words(line);
    if (words.empty()) continue;
    const std::string& first = words[0];
    if (first[0] == '#' || first[0] == '"') continue;
    if (first.size() >= 2 && first[0] == '/' && first[1] == '/') continue;
    if (first[0] == ':') {
      words[0].erase(words[0].begin());
      if (words[0].empty()) words.erase(words.begin());
      if (words.empty()) continue;
    }

    std::string err;
    if (!apply_setting(settings, words, err)) {
      spdlog::warn("{}:{}: {}", path.string(), line_no, err);
      if (msg.empty()) msg = "line " + std::to_string(line_no) + ": " + err;
    }
  }
  return true;
}

std::filesystem::path default_rc_path() {
  const char* home = std::getenv("HOME");
  if (!home) return {};
  return std::filesystem::path(home) / FN_RC_NAME;
}

FormatterRegistry make_formatter_registry(const Settings& settings) {
  FormatterRegistry registry;
  for (const auto& [ext, argv] : settings.formatters) {
    registry.register_formatter(ext, std::make_unique<ProcessFormatter>(argv));
  }
  return registry;
}
