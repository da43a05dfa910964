#include "editor.hpp"
#include "file_io.hpp"
#include <unistd.h>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static std::string slurp(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

int main() {
  fs::path dir = fs::temp_directory_path() / ("fnedit_file_test_" + std::to_string(::getpid()));
  fs::create_directories(dir);
  fs::path file = dir / "a.txt";
  {
    std::ofstream out(file, std::ios::binary);
    out << "one\r\ntwo\n";
  }

  std::string msg;
  Editor e;
  e.insert_text_at_cursors("scratch");
  e.append_selection(Selection::create_cursor(Pos{0, 2}));
  assert(e.open_file(file, msg));
  // bytes are kept as-is, selections reset to the origin
  assert(e.get_all_text() == "one\r\ntwo\n");
  assert(e.line_count() == 3);
  assert((e.selections() == std::vector<Selection>{Selection{}}));
  assert(e.filename() == file);

  e.reset_selections(Selection::create_cursor(Pos{2, 0}));
  e.insert_text_at_cursors("three");
  assert(e.save_file(msg));
  assert(slurp(file) == "one\r\ntwo\nthree");
  assert(!fs::exists(dir / "a.txt.tmp"));

  // a failed open leaves everything as it was
  std::string before = e.get_all_text();
  assert(!e.open_file(dir / "missing.txt", msg));
  assert(msg.find("can not open file") != std::string::npos);
  assert(e.get_all_text() == before);
  assert(e.filename() == file);
  assert(!e.open_file(dir, msg));

  // empty files and scratch buffers
  fs::path empty = dir / "empty.txt";
  { std::ofstream out(empty); }
  assert(e.open_file(empty, msg));
  assert(e.length() == 0);
  assert(e.line_count() == 1);
  assert(e.open_file(fs::path(), msg));
  assert(e.filename().empty());
  assert(e.save_file(msg));
  assert(msg == "no file name");

  // write into a directory that does not exist
  std::string out_msg;
  assert(!write_whole_file(dir / "nope" / "x.txt", "abc", out_msg));
  assert(!out_msg.empty());

  std::string got;
  assert(write_whole_file(dir / "b.txt", std::string(200000, 'q'), out_msg));
  assert(read_whole_file(dir / "b.txt", got, out_msg));
  assert(got.size() == 200000);

  fs::remove_all(dir);
  return 0;
}
