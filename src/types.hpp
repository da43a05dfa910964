#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Token/Mode/Viewport).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <string>
#include "pos.hpp"

enum class TokenType { Text, Whitespace };

struct Token {
  Pos pos;
  TokenType type = TokenType::Text;
  std::string text;

  bool operator==(const Token&) const = default;
};

enum class Mode { Normal, Insert, Command };

struct Viewport { std::size_t top_line = 0; std::size_t left_col = 0; };
