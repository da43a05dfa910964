#include "editor.hpp"
#include "formatter.hpp"
#include <unistd.h>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

int main() {
  std::string out, msg;

  ProcessFormatter cat(std::vector<std::string>{"cat"});
  assert(cat.format("abc\n", out, msg));
  assert(out == "abc\n");
  assert(cat.format("", out, msg));
  assert(out.empty());

  // more than a pipe buffer each way
  std::string big;
  for (int i = 0; i < 20000; ++i) big += "line " + std::to_string(i) + "\n";
  assert(cat.format(big, out, msg));
  assert(out == big);

  out = "untouched";
  ProcessFormatter fails(std::vector<std::string>{"false"});
  assert(!fails.format("x", out, msg));
  assert(msg.rfind("failed to format", 0) == 0);
  assert(out == "untouched");

  ProcessFormatter complains(std::vector<std::string>{"sh", "-c", "cat >/dev/null; echo 'bad token' >&2; exit 3"});
  assert(!complains.format("x", out, msg));
  assert(msg == "failed to format: bad token");

  ProcessFormatter missing(std::vector<std::string>{"fnedit-no-such-formatter"});
  assert(!missing.format("x", out, msg));

  ProcessFormatter empty_argv(std::vector<std::string>{});
  assert(!empty_argv.format("x", out, msg));

  FormatterRegistry reg;
  reg.register_formatter("ZIG", std::make_unique<ProcessFormatter>(std::vector<std::string>{"cat"}));
  reg.register_formatter(".up", std::make_unique<ProcessFormatter>(std::vector<std::string>{"tr", "a-z", "A-Z"}));
  assert(reg.size() == 2);
  assert(reg.find("src/main.zig") != nullptr);
  assert(reg.find("main.Zig") != nullptr);
  assert(reg.find("notes.txt") == nullptr);
  assert(reg.find("Makefile") == nullptr);
  assert(reg.find_ext("up") != nullptr);

  fs::path dir = fs::temp_directory_path() / ("fnedit_fmt_test_" + std::to_string(::getpid()));
  fs::create_directories(dir);
  {
    std::ofstream o(dir / "a.up");
    o << "abc\ndef\n";
  }
  {
    std::ofstream o(dir / "a.txt");
    o << "abc\n";
  }

  Editor e;
  assert(e.open_file(dir / "a.up", msg));
  e.reset_selections(Selection::create_cursor(Pos{1, 2}));
  assert(e.format_buffer(reg, msg));
  assert(e.get_all_text() == "ABC\nDEF\n");
  assert((e.get_primary_selection() == Selection::create_cursor(Pos{1, 2})));

  assert(e.open_file(dir / "a.txt", msg));
  assert(!e.format_buffer(reg, msg));
  assert(e.get_all_text() == "abc\n");

  // a failing formatter leaves the buffer alone
  reg.register_formatter("txt", std::make_unique<ProcessFormatter>(std::vector<std::string>{"false"}));
  assert(!e.format_buffer(reg, msg));
  assert(e.get_all_text() == "abc\n");

  fs::remove_all(dir);
  return 0;
}
