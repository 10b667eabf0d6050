/***
 * Name: pyjudge::lex::Lexer
 * Purpose: Tokenize submitted Python source.
 * Theory of Operation:
 *   Sources are pushed as named text buffers and lexed last-pushed first.
 *   The full token vector is built on first access. Logical lines end with a
 *   Newline token; physical line breaks inside brackets, after a trailing
 *   backslash, or inside triple-quoted strings do not. Blank and comment-only
 *   lines produce no tokens. Indentation follows tokenize's rules (tabs to the
 *   next multiple of 8). Lexical errors throw exceptions::ParseError with the
 *   offending position.
 */
#pragma once

#include "lexer/Token.h"
#include "lexer/TokenKind.h"

#include <cstddef>
#include <string>
#include <vector>

namespace pyjudge::lex {

class Lexer {
 public:
  Lexer() = default;

  void pushString(const std::string& text, const std::string& name);

  const Token& peek(size_t lookahead = 0);
  Token next();
  std::vector<Token> tokens();

 private:
  struct OpenBracket {
    char chr;
    int line;
    int col;
  };

  struct State {
    std::string name;
    std::string text;
    size_t cursor{0}; // offset of the next unread physical line in text
    std::string line;
    size_t index{0};
    int lineNo{0};
    std::vector<size_t> indentStack{0};
    std::vector<OpenBracket> brackets;
    bool continued{false};     // previous physical line ended with '\'
    bool lineHasTokens{false}; // current logical line produced a token
  };

  bool finalized_{false};
  std::vector<Token> tokens_{};
  size_t pos_{0};
  std::vector<State> stack_{};

  static bool readNextLine(State& state);
  bool emitIndentTokens(State& state); // true when the line is blank
  void scanLine(State& state);
  Token scanOne(State& state);
  Token scanString(State& state, size_t start, size_t quotePos, bool isBytes);
  Token scanNumber(State& state);
  void push(State& state, Token tok);
  [[noreturn]] static void fail(const State& state, int col, const std::string& msg);
  void buildAll();
};

} // namespace pyjudge::lex
