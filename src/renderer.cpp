#include "renderer.hpp"
#include <algorithm>
#include <sstream>
#include <vector>

namespace {

struct ScreenLine {
  std::string text;
  std::vector<bool> hl;
  // screen column of every byte column, plus one past the end
  std::vector<std::size_t> col_of;
};

std::string line_content(const Editor& ed, std::size_t row) {
  std::string s = ed.get_line(row);
  if (!s.empty() && s.back() == '\n') s.pop_back();
  return s;
}

ScreenLine expand(const std::string& s, const std::vector<bool>& hl, int tab_width) {
  ScreenLine out;
  std::size_t tw = static_cast<std::size_t>(std::max(1, tab_width));
  out.col_of.reserve(s.size() + 1);
  for (std::size_t i = 0; i < s.size(); ++i) {
    out.col_of.push_back(out.text.size());
    std::size_t n = s[i] == '\t' ? tw - out.text.size() % tw : 1;
    char ch = s[i] == '\t' ? ' ' : s[i];
    out.text.append(n, ch);
    out.hl.insert(out.hl.end(), n, hl[i]);
  }
  out.col_of.push_back(out.text.size());
  // selected line break or a cursor past the end shows as one cell
  if (hl[s.size()]) {
    out.text.push_back(' ');
    out.hl.push_back(true);
  }
  return out;
}

// byte columns of `row` covered by a selection or showing a secondary cursor
std::vector<bool> highlight_for_row(const Editor& ed, std::size_t row, std::size_t len) {
  std::vector<bool> hl(len + 1, false);
  const auto& sels = ed.selections();
  for (std::size_t i = 0; i < sels.size(); ++i) {
    const Selection& s = sels[i];
    if (s.is_cursor()) {
      if (i != 0 && s.cursor.row == row) hl[std::min(s.cursor.col, len)] = true;
      continue;
    }
    Pos b = s.before(), a = s.after();
    if (row < b.row || row > a.row) continue;
    std::size_t from = row == b.row ? std::min(b.col, len + 1) : 0;
    std::size_t to = row == a.row ? std::min(a.col, len + 1) : len + 1;
    for (std::size_t c = from; c < to; ++c) hl[c] = true;
  }
  return hl;
}

const char* mode_name(Mode m) {
  switch (m) {
    case Mode::Normal: return "NORMAL";
    case Mode::Insert: return "INSERT";
    case Mode::Command: return "COMMAND";
  }
  return "";
}

}

void Renderer::render(ITerminal& term, const Editor& ed, View& view) {
  TermSize sz = term.size();
  int rows = sz.rows, cols = sz.cols;
  term.clear();
  if (rows <= 0 || cols <= 0) { term.refresh(); return; }
  const std::size_t text_rows = static_cast<std::size_t>(rows - 1);

  int indent = 0;
  int ln_width = 0;
  if (view.show_line_numbers) {
    std::size_t total = ed.line_count();
    ln_width = 1;
    while (total >= 10) { total /= 10; ln_width++; }
    indent = ln_width + 1;
  }
  const std::size_t text_cols = static_cast<std::size_t>(std::max(0, cols - indent));

  Pos primary = ed.get_primary_selection().cursor;
  Viewport& vp = view.vp;
  if (primary.row < vp.top_line) vp.top_line = primary.row;
  if (text_rows > 0 && primary.row >= vp.top_line + text_rows) vp.top_line = primary.row - text_rows + 1;

  std::string primary_line = line_content(ed, primary.row);
  std::vector<bool> no_hl(primary_line.size() + 1, false);
  std::size_t primary_screen_col = expand(primary_line, no_hl, view.tab_width).col_of[std::min(primary.col, primary_line.size())];
  if (text_cols == 0) vp.left_col = 0;
  else if (primary_screen_col < vp.left_col) vp.left_col = primary_screen_col;
  else if (primary_screen_col >= vp.left_col + text_cols) vp.left_col = primary_screen_col - text_cols + 1;

  for (std::size_t i = 0; i < text_rows; ++i) {
    std::size_t row = vp.top_line + i;
    if (row >= ed.line_count()) break;
    int screen_row = static_cast<int>(i);
    if (view.show_line_numbers) {
      std::string num = std::to_string(row + 1);
      std::string pad(std::max(0, ln_width - static_cast<int>(num.size())), ' ');
      term.draw_text(screen_row, 0, pad + num + " ");
    }
    std::string s = line_content(ed, row);
    ScreenLine sl = expand(s, highlight_for_row(ed, row, s.size()), view.tab_width);

    std::size_t start = std::min(vp.left_col, sl.text.size());
    std::size_t end = std::min(sl.text.size(), start + text_cols);
    int col = indent;
    std::size_t p = start;
    while (p < end) {
      std::size_t q = p;
      while (q < end && sl.hl[q] == sl.hl[p]) q++;
      std::string run = sl.text.substr(p, q - p);
      if (sl.hl[p]) term.draw_highlighted(screen_row, col, run, 0, static_cast<int>(run.size()));
      else term.draw_text(screen_row, col, run);
      col += static_cast<int>(q - p);
      p = q;
    }
    term.clear_to_eol(screen_row, col);
  }

  std::string status;
  if (view.mode == Mode::Command) {
    status = ":" + view.cmdline;
  } else {
    std::ostringstream oss;
    oss << mode_name(view.mode) << "  "
        << (ed.filename().empty() ? "[no file]" : ed.filename().string())
        << "  row:" << (primary.row + 1) << " col:" << (primary.col + 1);
    if (ed.selections().size() > 1) oss << "  sel:" << ed.selections().size();
    if (!view.message.empty()) oss << "  | " << view.message;
    status = oss.str();
  }
  term.draw_text(rows - 1, 0, status.substr(0, static_cast<std::size_t>(cols)));

  if (view.mode == Mode::Command) {
    term.move_cursor(rows - 1, std::min(cols - 1, static_cast<int>(view.cmdline.size()) + 1));
  } else {
    std::size_t screen_row = primary.row - vp.top_line;
    int screen_col = indent + static_cast<int>(primary_screen_col - vp.left_col);
    term.move_cursor(static_cast<int>(screen_row), std::min(screen_col, cols - 1));
  }
  term.refresh();
}
