#include "line_index.hpp"
#include <cassert>
#include <vector>

static std::vector<std::size_t> flat(const LineIndex& li) {
  std::vector<std::size_t> out;
  for (IndexPos p : li.offsets()) out.push_back(p.to_int());
  return out;
}

int main() {
  LineIndex li;
  assert(li.line_count() == 1);
  assert(li.line_start(0).to_int() == 0);

  GapBuffer g;
  g.assign("012\n\n\n67\n\n0");
  li.build(g);
  assert((flat(li) == std::vector<std::size_t>{0, 4, 5, 6, 9, 10}));
  assert(li.line_count() == 6);
  assert(li.find_row(IndexPos::from_int(0)) == 0);
  assert(li.find_row(IndexPos::from_int(3)) == 0);
  assert(li.find_row(IndexPos::from_int(4)) == 1);
  assert(li.find_row(IndexPos::from_int(8)) == 3);
  assert(li.find_row(IndexPos::from_int(11)) == 5);

  g.assign("");
  li.build(g);
  assert((flat(li) == std::vector<std::size_t>{0}));

  g.assign("\n");
  li.build(g);
  assert((flat(li) == std::vector<std::size_t>{0, 1}));

  // small blocks give the same answers as one big block
  std::string text;
  for (int i = 0; i < 50; ++i) text += std::string(static_cast<std::size_t>(i % 4), 'a') + "\n";
  g.assign(text);
  LineIndex big;
  big.build(g);
  LineIndex small;
  small.block_size = 3;
  small.build(g);
  assert(flat(big) == flat(small));
  assert(small.line_count() == 51);
  for (std::size_t off = 0; off <= g.length(); ++off) {
    assert(big.find_row(IndexPos::from_int(off)) == small.find_row(IndexPos::from_int(off)));
  }
  for (std::size_t r = 0; r < small.line_count(); ++r) {
    assert(small.find_row(small.line_start(r)) == r);
  }
  return 0;
}
