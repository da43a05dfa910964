#include "pos.hpp"
#include <cassert>

int main() {
  Pos a{0, 5}, b{1, 0}, c{1, 2};
  assert(a.comes_before(b));
  assert(b.comes_before(c));
  assert(!c.comes_before(b));
  assert(c.comes_after(a));
  assert(!a.comes_before(a));
  assert(!a.comes_after(a));
  assert(a < b && b < c);
  assert((Pos{2, 3} == Pos{2, 3}));

  IndexPos i = IndexPos::from_int(7);
  assert(i.to_int() == 7);
  assert(IndexPos::from_int(3).comes_before(i));
  assert(i.comes_after(IndexPos::from_int(0)));
  assert(!i.comes_before(i));
  assert(IndexPos{} == IndexPos::from_int(0));
  return 0;
}
