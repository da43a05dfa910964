#pragma once
/*
 * Editor
 *
 * Purpose: managed editing core for one file: byte buffer, line index, tokens
 *          and a set of selections edited together.
 * Invariant (between public calls): no two selections overlap, the line index
 *          matches the buffer, there is at least one selection.
 * Note: single writer; callers serialize access. Positions are byte based.
 */
#include <cassert>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>
#include "gap_buffer.hpp"
#include "line_index.hpp"
#include "pos.hpp"
#include "selection.hpp"
#include "types.hpp"

class FormatterRegistry;

class Editor {
public:
  using Tokenizer = std::function<std::vector<Token>(std::string_view)>;

  Editor();

  /* file */
  bool open_file(const std::filesystem::path& path, std::string& msg);
  bool save_file(std::string& msg) const;
  bool format_buffer(const FormatterRegistry& formatters, std::string& msg);
  const std::filesystem::path& filename() const { return filename_; }

  /* queries */
  std::size_t line_count() const { return lines_.line_count(); }
  std::string get_line(std::size_t row) const;
  std::string get_all_text() const { return text_.str(); }
  std::size_t length() const { return text_.length(); }
  std::vector<IndexPos> line_indexes() const { return lines_.offsets(); }
  const std::vector<Token>& tokens() const { return tokens_; }
  const std::vector<Selection>& selections() const { return selections_; }
  const Selection& get_primary_selection() const;
  bool has_overlapping_selections() const;

  Pos to_pos(IndexPos pos) const;
  IndexPos to_index_pos(Pos pos) const { return to_index_pos(text_, pos); }

  // Text is anything with size() and operator[] yielding bytes.
  template <typename Text>
  static IndexPos to_index_pos(const Text& text, Pos pos);

  /* selections */
  void append_selection(const Selection& selection);
  void reset_selections(const Selection& selection);

  /* batch edits */
  void insert_text_at_cursors(std::string_view text);
  void delete_character_before_cursors();

  /* movement (editor_motion.cpp); collapses selections, never merges them */
  void move_selections_left();
  void move_selections_right();
  void move_selections_up();
  void move_selections_down();
  void move_selections_to_start_of_line();
  void move_selections_to_end_of_line();
  void move_cursor_before_anchor_for_all_selections();
  void move_cursor_after_anchor_for_all_selections();

  void set_tokenizer(Tokenizer tokenizer);
  static std::vector<Token> default_tokenize(std::string_view text);

private:
  void replace_text(std::string_view bytes);
  void update_lines();
  void tokenize();
  std::size_t line_content_len(std::size_t row) const;
  std::size_t max_col_for_row(std::size_t row) const;

  std::filesystem::path filename_;
  GapBuffer text_;
  LineIndex lines_;
  std::vector<Token> tokens_;
  std::vector<Selection> selections_;
  Tokenizer tokenizer_;
};

template <typename Text>
IndexPos Editor::to_index_pos(const Text& text, Pos pos) {
  const std::size_t len = text.size();
  if (pos.row == 0) return IndexPos::from_int(pos.col < len ? pos.col : len);

  std::size_t line = 0;
  for (std::size_t i = 0; i < len; ++i) {
    if (text[i] != '\n') continue;
    ++line;
    if (line == pos.row) {
      std::size_t off = i + pos.col + 1;
      return IndexPos::from_int(off < len ? off : len);
    }
  }
  assert(false && "row out of range");
  return IndexPos::from_int(len);
}
