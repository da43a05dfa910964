#include "editor.hpp"
#include <algorithm>
#include <cassert>
#include <spdlog/spdlog.h>
#include "file_io.hpp"
#include "formatter.hpp"

Editor::Editor() {
  selections_.push_back(Selection{});
  tokens_.push_back(Token{Pos{}, TokenType::Text, std::string()});
}

std::vector<Token> Editor::default_tokenize(std::string_view text) {
  return {Token{Pos{}, TokenType::Text, std::string(text)}};
}

void Editor::set_tokenizer(Tokenizer tokenizer) {
  tokenizer_ = std::move(tokenizer);
  tokenize();
}

void Editor::tokenize() {
  std::string all = text_.str();
  tokens_ = tokenizer_ ? tokenizer_(all) : default_tokenize(all);
}

void Editor::update_lines() { lines_.build(text_); }

void Editor::replace_text(std::string_view bytes) {
  text_.assign(bytes);
  update_lines();
  tokenize();
}

bool Editor::open_file(const std::filesystem::path& path, std::string& msg) {
  if (path.empty()) {
    filename_.clear();
    replace_text({});
    reset_selections(Selection{});
    msg = "new buffer";
    return true;
  }

  std::string contents;
  if (!read_whole_file(path, contents, msg)) {
    spdlog::warn("open '{}' failed: {}", path.string(), msg);
    return false;
  }
  replace_text(contents);
  filename_ = path;
  reset_selections(Selection{});
  spdlog::info("opened '{}' ({} bytes, {} lines)", path.string(), text_.length(), line_count());
  return true;
}

bool Editor::save_file(std::string& msg) const {
  if (filename_.empty()) {
    msg = "no file name";
    return true;
  }
  if (!write_whole_file(filename_, text_.str(), msg)) {
    spdlog::warn("save '{}' failed: {}", filename_.string(), msg);
    return false;
  }
  spdlog::info("saved '{}' ({} bytes)", filename_.string(), text_.length());
  return true;
}

bool Editor::format_buffer(const FormatterRegistry& formatters, std::string& msg) {
  const Formatter* f = formatters.find(filename_);
  if (!f) {
    msg = "no formatter for '" + filename_.string() + "'";
    return false;
  }
  std::string out;
  if (!f->format(text_.str(), out, msg)) return false;

  replace_text(out);
  std::vector<Selection> old;
  old.swap(selections_);
  auto clamp = [this](Pos p) {
    p.row = std::min(p.row, line_count() - 1);
    p.col = std::min(p.col, max_col_for_row(p.row));
    return p;
  };
  for (const Selection& s : old) append_selection(Selection{clamp(s.anchor), clamp(s.cursor)});
  msg = "formatted";
  return true;
}

std::string Editor::get_line(std::size_t row) const {
  assert(row < line_count());
  std::size_t start = lines_.line_start(row).to_int();
  std::size_t end = row + 1 < line_count() ? lines_.line_start(row + 1).to_int() : text_.length();
  assert(start <= end);
  return text_.slice(start, end - start);
}

std::size_t Editor::line_content_len(std::size_t row) const {
  std::size_t start = lines_.line_start(row).to_int();
  if (row + 1 < line_count()) return lines_.line_start(row + 1).to_int() - start - 1;
  return text_.length() - start;
}

// the last row may hold one virtual column past its end
std::size_t Editor::max_col_for_row(std::size_t row) const {
  std::size_t len = line_content_len(row);
  return row + 1 == line_count() ? len + 1 : len;
}

const Selection& Editor::get_primary_selection() const {
  assert(!selections_.empty());
  return selections_[0];
}

Pos Editor::to_pos(IndexPos pos) const {
  assert(pos.to_int() <= text_.length());
  std::size_t row = lines_.find_row(pos);
  return Pos{row, pos.to_int() - lines_.line_start(row).to_int()};
}

bool Editor::has_overlapping_selections() const {
  for (std::size_t i = 0; i + 1 < selections_.size(); ++i) {
    for (std::size_t j = i + 1; j < selections_.size(); ++j) {
      if (Selection::has_overlap(selections_[i], selections_[j])) return true;
    }
  }
  return false;
}

static void swap_remove(std::vector<Selection>& v, std::size_t i) {
  if (i + 1 != v.size()) v[i] = v.back();
  v.pop_back();
}

void Editor::append_selection(const Selection& selection) {
  selections_.push_back(selection);

  // a merge can newly overlap an earlier element, so rescan from it
  std::size_t outer = 0;
  while (outer < selections_.size()) {
    bool merged = false;
    for (std::size_t inner = outer + 1; inner < selections_.size(); ++inner) {
      if (Selection::has_overlap(selections_[outer], selections_[inner])) {
        selections_[outer] = Selection::merge(selections_[outer], selections_[inner]);
        swap_remove(selections_, inner);
        merged = true;
        break;
      }
    }
    if (!merged) ++outer;
  }

  assert(!has_overlapping_selections());
}

void Editor::reset_selections(const Selection& selection) {
  Selection keep = selection;
  selections_.clear();
  selections_.push_back(keep);
}

void Editor::insert_text_at_cursors(std::string_view text) {
  const std::size_t num_new_lines = static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n'));
  const std::size_t last_new_line = text.rfind('\n');
  const std::size_t trailing = last_new_line == std::string_view::npos ? text.size() : text.size() - last_new_line - 1;

  // where q (at or after the insertion point at) lands once text is inserted at at
  auto shift = [&](Pos q, Pos at) {
    if (q.row != at.row) return Pos{q.row + num_new_lines, q.col};
    if (num_new_lines == 0) return Pos{q.row, q.col + text.size()};
    return Pos{q.row + num_new_lines, trailing + (q.col - at.col)};
  };

  [[maybe_unused]] const bool was_disjoint = !has_overlapping_selections();

  for (std::size_t i = 0; i < selections_.size(); ++i) {
    Selection& s = selections_[i];

    // the line index is stale after the first insertion, so walk the buffer
    IndexPos at = to_index_pos(text_, s.cursor);
    IndexPos row_start = to_index_pos(text_, Pos{s.cursor.row, 0});
    Pos p{s.cursor.row, at.to_int() - row_start.to_int()};
    if (p != s.cursor) {
      if (s.is_cursor()) s.anchor = p;
      s.cursor = p;
    }

    text_.insert(at.to_int(), text);

    for (std::size_t j = 0; j < selections_.size(); ++j) {
      if (j == i) continue;
      Selection& other = selections_[j];
      if (Selection::eql(s, other)) continue;
      if (!other.before().comes_before(p)) {
        other.cursor = shift(other.cursor, p);
        other.anchor = shift(other.anchor, p);
      }
    }

    if (s.is_cursor()) {
      s.cursor = shift(s.cursor, p);
      s.anchor = s.cursor;
    } else if (s.cursor.comes_before(s.anchor)) {
      s.cursor = shift(s.cursor, p);
      s.anchor = shift(s.anchor, p);
    } else {
      s.cursor = shift(s.cursor, p);
    }
  }

  assert(!was_disjoint || !has_overlapping_selections());

  update_lines();
  tokenize();
  spdlog::debug("inserted {} bytes at {} cursors", text.size(), selections_.size());
}

void Editor::delete_character_before_cursors() {
  const std::size_t n = selections_.size();
  std::vector<std::size_t> cursors(n);
  std::vector<std::size_t> anchors(n);
  for (std::size_t i = 0; i < n; ++i) {
    cursors[i] = to_index_pos(selections_[i].cursor).to_int();
    anchors[i] = to_index_pos(selections_[i].anchor).to_int();
  }

  // unique cursor offsets, so coinciding cursors delete once
  std::vector<std::size_t> cuts = cursors;
  std::sort(cuts.begin(), cuts.end());
  cuts.erase(std::unique(cuts.begin(), cuts.end()), cuts.end());

  // highest first: earlier offsets stay valid
  for (auto it = cuts.rbegin(); it != cuts.rend(); ++it) {
    if (*it == 0) continue;
    text_.erase(*it - 1, 1);
  }

  update_lines();
  tokenize();

  // movement = own deletion + deletions strictly before this cursor.
  // A cursor at offset 0 deleted nothing, so it moves neither itself nor the others.
  const std::size_t zero_cut = (!cuts.empty() && cuts.front() == 0) ? 1 : 0;
  auto movement_of = [&](std::size_t cursor) -> std::size_t {
    if (cursor == 0) return 0;
    std::size_t rank = static_cast<std::size_t>(std::lower_bound(cuts.begin(), cuts.end(), cursor) - cuts.begin());
    return 1 + rank - zero_cut;
  };
  auto back = [](std::size_t off, std::size_t by) { return off > by ? off - by : 0; };

  for (std::size_t i = 0; i < n; ++i) {
    Selection& s = selections_[i];
    const std::size_t movement = movement_of(cursors[i]);

    if (s.is_cursor()) {
      s.cursor = to_pos(IndexPos::from_int(back(cursors[i], movement)));
      s.anchor = s.cursor;
      continue;
    }

    if (s.cursor.comes_before(s.anchor)) {
      s.cursor = to_pos(IndexPos::from_int(back(cursors[i], movement)));
      s.anchor = to_pos(IndexPos::from_int(back(anchors[i], movement)));
    } else {
      s.cursor = to_pos(IndexPos::from_int(back(cursors[i], movement)));
      // the anchor sits before this selection's own deletion
      if (movement > 1) s.anchor = to_pos(IndexPos::from_int(back(anchors[i], movement - 1)));
      if (s.cursor.comes_before(s.anchor)) s.anchor = s.cursor;
    }
  }

  // exact duplicates only; touching selections are left as they are
  for (std::size_t i = 0; i + 1 < selections_.size(); ++i) {
    std::size_t j = i + 1;
    while (j < selections_.size()) {
      if (Selection::eql(selections_[i], selections_[j])) {
        swap_remove(selections_, j);
        continue;
      }
      ++j;
    }
  }

  spdlog::debug("deleted {} bytes for {} selections", cuts.size() - zero_cut, selections_.size());
}
