#pragma once

#include "lexer/TokenKind.h"

#include <string>

namespace pyjudge::lex {

// Location is 1-based and points at the first character. String and bytes
// tokens keep their prefix and quotes in text; Parser decodes them.
struct Token {
  TokenKind kind{TokenKind::End};
  std::string text{};
  std::string file{};
  int line{1};
  int col{1};
};

} // namespace pyjudge::lex
