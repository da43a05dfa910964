#include "editor.hpp"
#include <cassert>
#include <vector>

static Selection cur(std::size_t r, std::size_t c) { return Selection::create_cursor(Pos{r, c}); }
static Selection sel(std::size_t ar, std::size_t ac, std::size_t cr, std::size_t cc) {
  return Selection{Pos{ar, ac}, Pos{cr, cc}};
}

int main() {
  {
    Editor e;
    e.reset_selections(sel(0, 2, 0, 3));
    e.append_selection(sel(0, 6, 0, 8));
    assert(e.selections().size() == 2);
    // bridges both existing selections
    e.append_selection(sel(0, 3, 0, 9));
    assert((e.selections() == std::vector<Selection>{sel(0, 2, 0, 9)}));
  }
  {
    Editor e;
    e.reset_selections(sel(0, 2, 0, 3));
    e.append_selection(sel(0, 6, 0, 8));
    e.append_selection(sel(0, 7, 0, 9));
    assert((e.selections() == std::vector<Selection>{sel(0, 2, 0, 3), sel(0, 6, 0, 9)}));
  }
  {
    // a later merge can swallow an element the scan already passed
    Editor e;
    e.reset_selections(cur(0, 1));
    e.append_selection(cur(0, 5));
    e.append_selection(cur(0, 9));
    e.append_selection(sel(0, 0, 0, 9));
    assert((e.selections() == std::vector<Selection>{sel(0, 0, 0, 9)}));
    assert(!e.has_overlapping_selections());
  }
  {
    // touching cursors merge
    Editor e;
    e.reset_selections(cur(0, 4));
    e.append_selection(cur(0, 4));
    assert((e.selections() == std::vector<Selection>{cur(0, 4)}));
  }
  {
    Editor e;
    e.append_selection(cur(2, 0));
    e.append_selection(cur(1, 0));
    assert(e.selections().size() == 3);
    assert((e.get_primary_selection() == cur(0, 0)));
    e.reset_selections(cur(1, 0));
    assert((e.selections() == std::vector<Selection>{cur(1, 0)}));
  }
  return 0;
}
