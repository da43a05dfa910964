#include "app.hpp"
#include <ncurses.h>
#include <algorithm>
#include <spdlog/spdlog.h>
#include "log.hpp"

static constexpr int ESC = 27;

static bool is_backspace(int ch) { return ch == KEY_BACKSPACE || ch == 127 || ch == 8; }
static bool is_enter(int ch) { return ch == '\n' || ch == '\r' || ch == KEY_ENTER; }

App::App(ITerminal& term, Settings settings) : term_(term), settings_(std::move(settings)) {
  apply_settings();
  register_commands();
}

void App::apply_settings() {
  view_.tab_width = settings_.tab_width;
  view_.show_line_numbers = settings_.show_line_numbers;
  formatters_ = make_formatter_registry(settings_);
}

bool App::open(const std::filesystem::path& path) {
  std::string msg;
  bool ok = ed_.open_file(path, msg);
  view_.message = msg;
  view_.vp = Viewport{};
  if (ok) modified_ = false;
  return ok;
}

void App::register_commands() {
  registry_.register_command("w", [this](const std::vector<std::string>& args, std::string& msg) {
    if (!args.empty()) { msg = "w: takes no arguments"; return false; }
    if (!ed_.save_file(msg)) return false;
    if (!ed_.filename().empty()) modified_ = false;
    return true;
  });
  registry_.register_command("q", [this](const std::vector<std::string>&, std::string& msg) {
    if (modified_) { msg = "unsaved changes, use :q! to discard"; return false; }
    should_quit_ = true;
    return true;
  });
  registry_.register_command("q!", [this](const std::vector<std::string>&, std::string&) {
    should_quit_ = true;
    return true;
  });
  registry_.register_command("wq", [this](const std::vector<std::string>&, std::string& msg) {
    if (ed_.filename().empty() && modified_) { msg = "no file name"; return false; }
    if (!ed_.save_file(msg)) return false;
    modified_ = false;
    should_quit_ = true;
    return true;
  });
  registry_.register_command("e", [this](const std::vector<std::string>& args, std::string& msg) {
    if (args.size() != 1) { msg = "e: use :e <path>"; return false; }
    if (modified_) { msg = "unsaved changes, use :w first"; return false; }
    bool ok = ed_.open_file(args[0], msg);
    if (ok) { modified_ = false; view_.vp = Viewport{}; }
    return ok;
  });
  registry_.register_command("fmt", [this](const std::vector<std::string>&, std::string& msg) {
    if (!ed_.format_buffer(formatters_, msg)) return false;
    modified_ = true;
    return true;
  });
}

void App::execute_command(const std::string& line) {
  std::vector<std::string> words = split_words(line);
  if (words.empty()) return;
  std::string msg;
  if (words[0] == "set") {
    if (apply_setting(settings_, words, msg)) {
      apply_settings();
      if (words[1] == "loglevel" || words[1] == "logfile") {
        std::string log_msg;
        if (!setup_logging(settings_.log_path, settings_.log_level, log_msg)) msg = log_msg;
      }
    }
    view_.message = msg;
    return;
  }
  std::vector<std::string> args(words.begin() + 1, words.end());
  if (!registry_.execute(words[0], args, msg)) spdlog::debug("command '{}' failed: {}", line, msg);
  view_.message = msg;
}

void App::render() { renderer_.render(term_, ed_, view_); }

void App::run() {
  while (!should_quit_) {
    render();
    int ch = getch();
    if (ch == ERR || ch == KEY_RESIZE) continue;
    handle_key(ch);
  }
}

void App::handle_key(int ch) {
  if (view_.mode == Mode::Command) { handle_command_key(ch); return; }
  if (view_.mode == Mode::Insert) { handle_insert_key(ch); return; }
  handle_normal_key(ch);
}

bool App::handle_arrow(int ch) {
  switch (ch) {
    case KEY_LEFT: ed_.move_selections_left(); return true;
    case KEY_RIGHT: ed_.move_selections_right(); return true;
    case KEY_UP: ed_.move_selections_up(); return true;
    case KEY_DOWN: ed_.move_selections_down(); return true;
    case KEY_HOME: ed_.move_selections_to_start_of_line(); return true;
    case KEY_END: ed_.move_selections_to_end_of_line(); return true;
    default: return false;
  }
}

void App::add_cursor_below() {
  Pos last = ed_.selections().back().cursor;
  if (last.row + 1 >= ed_.line_count()) { view_.message = "no line below"; return; }
  std::string below = ed_.get_line(last.row + 1);
  std::size_t len = below.size() - (!below.empty() && below.back() == '\n' ? 1 : 0);
  ed_.append_selection(Selection::create_cursor(Pos{last.row + 1, std::min(last.col, len)}));
}

void App::handle_normal_key(int ch) {
  if (handle_arrow(ch)) return;
  switch (ch) {
    case 'h': ed_.move_selections_left(); break;
    case 'j': ed_.move_selections_down(); break;
    case 'k': ed_.move_selections_up(); break;
    case 'l': ed_.move_selections_right(); break;
    case '0': ed_.move_selections_to_start_of_line(); break;
    case '$': ed_.move_selections_to_end_of_line(); break;
    case 'i':
      ed_.move_cursor_before_anchor_for_all_selections();
      view_.mode = Mode::Insert;
      break;
    case 'a':
      ed_.move_cursor_after_anchor_for_all_selections();
      view_.mode = Mode::Insert;
      break;
    case 'd':
      ed_.delete_character_before_cursors();
      modified_ = true;
      break;
    case 'C': add_cursor_below(); break;
    case ESC: {
      Selection primary = ed_.get_primary_selection();
      ed_.reset_selections(primary);
      break;
    }
    case ':':
      view_.cmdline.clear();
      view_.mode = Mode::Command;
      break;
    default: break;
  }
}

void App::handle_insert_key(int ch) {
  if (ch == ESC) { view_.mode = Mode::Normal; return; }
  if (handle_arrow(ch)) return;
  if (is_backspace(ch)) {
    ed_.delete_character_before_cursors();
    modified_ = true;
    return;
  }
  if (is_enter(ch)) {
    ed_.insert_text_at_cursors("\n");
    modified_ = true;
    return;
  }
  if (ch == '\t') {
    ed_.insert_text_at_cursors(std::string(static_cast<std::size_t>(std::max(1, view_.tab_width)), ' '));
    modified_ = true;
    return;
  }
  if (ch >= 32 && ch <= 126) {
    ed_.insert_text_at_cursors(std::string(1, static_cast<char>(ch)));
    modified_ = true;
  }
}

void App::handle_command_key(int ch) {
  if (ch == ESC) { view_.cmdline.clear(); view_.mode = Mode::Normal; return; }
  if (is_backspace(ch)) {
    if (view_.cmdline.empty()) view_.mode = Mode::Normal;
    else view_.cmdline.pop_back();
    return;
  }
  if (is_enter(ch)) {
    std::string line = view_.cmdline;
    view_.cmdline.clear();
    view_.mode = Mode::Normal;
    execute_command(line);
    return;
  }
  if (ch >= 32 && ch <= 126) view_.cmdline.push_back(static_cast<char>(ch));
}
