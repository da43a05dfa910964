#include "settings.hpp"
#include <unistd.h>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

int main() {
  assert((split_words("  set  tabwidth\t8 ") == std::vector<std::string>{"set", "tabwidth", "8"}));
  assert(split_words("   ").empty());

  Settings s;
  std::string msg;
  assert(s.tab_width == FN_TAB_WIDTH);
  assert(s.formatters.count("zig") == 1);

  assert(apply_setting(s, {"set", "tabwidth", "2"}, msg));
  assert(s.tab_width == 2);
  assert(!apply_setting(s, {"set", "tabwidth", "0"}, msg));
  assert(!apply_setting(s, {"set", "tabwidth", "abc"}, msg));
  assert(!apply_setting(s, {"set", "tabwidth"}, msg));
  assert(s.tab_width == 2);

  assert(apply_setting(s, {"set", "number"}, msg));
  assert(s.show_line_numbers);
  assert(apply_setting(s, {"set", "number", "off"}, msg));
  assert(!s.show_line_numbers);
  assert(!apply_setting(s, {"set", "number", "maybe"}, msg));

  assert(apply_setting(s, {"set", "loglevel", "debug"}, msg));
  assert(s.log_level == "debug");
  assert(!apply_setting(s, {"set", "loglevel", "loud"}, msg));
  assert(s.log_level == "debug");

  assert(apply_setting(s, {"set", "formatter", ".PY", "black", "-q", "-"}, msg));
  assert((s.formatters["py"] == std::vector<std::string>{"black", "-q", "-"}));
  assert(!apply_setting(s, {"set", "formatter", "py"}, msg));
  assert(!apply_setting(s, {"set", "colour", "on"}, msg));
  assert(msg == "unknown option: colour");
  assert(!apply_setting(s, {"edit", "x"}, msg));

  FormatterRegistry reg = make_formatter_registry(s);
  assert(reg.find("a.py") != nullptr);
  assert(reg.find("a.zig") != nullptr);

  fs::path dir = fs::temp_directory_path() / ("fnedit_rc_test_" + std::to_string(::getpid()));
  fs::create_directories(dir);
  fs::path rc = dir / "rc";
  {
    std::ofstream o(rc);
    o << "# comment\n"
      << "\" vim style comment\n"
      << "// another\n"
      << "\n"
      << ":set tabwidth 8\n"
      << "set number on\n"
      << "set bogus 1\n"
      << "   set logfile /tmp/fnedit-test.log  \n"
      << "set formatter c cat";
  }
  Settings loaded;
  assert(load_settings(rc, loaded, msg));
  assert(loaded.tab_width == 8);
  assert(loaded.show_line_numbers);
  assert(loaded.log_path == fs::path("/tmp/fnedit-test.log"));
  assert((loaded.formatters["c"] == std::vector<std::string>{"cat"}));
  assert(msg == "line 7: unknown option: bogus");

  Settings untouched;
  assert(load_settings(dir / "missing", untouched, msg));
  assert(untouched.tab_width == FN_TAB_WIDTH);
  assert(!load_settings(dir, untouched, msg));

  fs::remove_all(dir);
  return 0;
}
