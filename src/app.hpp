#pragma once
/*
 * App
 *
 * Purpose: modal front end over one Editor: normal / insert / command keys,
 *          command line, settings and formatters.
 * Note: handle_key takes ncurses key codes; run() is the only place reading input,
 *       so the rest can be driven with a HeadlessTerminal.
 */
#include <filesystem>
#include <string>
#include <vector>
#include "cmd_registry.hpp"
#include "editor.hpp"
#include "formatter.hpp"
#include "iterminal.hpp"
#include "renderer.hpp"
#include "settings.hpp"

class App {
public:
  App(ITerminal& term, Settings settings);

  bool open(const std::filesystem::path& path);
  void run();
  void handle_key(int ch);
  void render();
  // one command line without the leading ':'
  void execute_command(const std::string& line);
  void set_message(std::string msg) { view_.message = std::move(msg); }

  const Editor& editor() const { return ed_; }
  Editor& editor() { return ed_; }
  const View& view() const { return view_; }
  const Settings& settings() const { return settings_; }
  bool modified() const { return modified_; }
  bool should_quit() const { return should_quit_; }

private:
  void register_commands();
  void apply_settings();
  void handle_normal_key(int ch);
  void handle_insert_key(int ch);
  void handle_command_key(int ch);
  bool handle_arrow(int ch);
  void add_cursor_below();

  ITerminal& term_;
  Settings settings_;
  FormatterRegistry formatters_;
  CommandRegistry registry_;
  Renderer renderer_;
  Editor ed_;
  View view_;
  bool modified_ = false;
  bool should_quit_ = false;
};
