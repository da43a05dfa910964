#include <filesystem>
#include <iostream>
#include <spdlog/spdlog.h>
#include "app.hpp"
#include "log.hpp"
#include "ncurses_terminal.hpp"
#include "settings.hpp"
#include "terminal.hpp"

int main(int argc, char** argv) {
  if (argc > 2) {
    std::cerr << "usage: fnedit [path]\n";
    return 2;
  }

  Settings settings;
  std::string rc_msg;
  std::filesystem::path rc = default_rc_path();
  if (!rc.empty() && !load_settings(rc, settings, rc_msg)) std::cerr << "fnedit: " << rc_msg << "\n";

  std::string log_msg;
  if (!setup_logging(settings.log_path, settings.log_level, log_msg)) {
    std::cerr << "fnedit: " << log_msg << "\n";
  }
  spdlog::info("fnedit starting");
  if (!rc_msg.empty()) spdlog::warn("{}: {}", rc.string(), rc_msg);

  Terminal terminal;
  NcursesTerminal term;
  App app(term, std::move(settings));
  std::filesystem::path path;
  if (argc == 2) path = argv[1];
  if (!app.open(path)) spdlog::info("starting with an empty buffer");
  if (!rc_msg.empty()) app.set_message(rc.string() + ": " + rc_msg);
  app.run();
  spdlog::info("fnedit exiting");
  return 0;
}
