/***
 * Name: pyjudge::lex::Lexer
 * Purpose: Tokenize Python source(s) into a single token stream (LIFO inputs).
 */
#include "lexer/Lexer.h"
#include "pyjudge/exceptions/parse_error.h"
#include <cctype>
#include <cstddef>
#include <cstring>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace pyjudge::lex {

namespace {
constexpr size_t kTabStop = 8;

bool isIdentStart(char chr) {
  const auto uchr = static_cast<unsigned char>(chr);
  return (std::isalpha(uchr) != 0) || chr == '_' || uchr >= 0x80U;
}
bool isIdentChar(char chr) {
  const auto uchr = static_cast<unsigned char>(chr);
  return (std::isalnum(uchr) != 0) || chr == '_' || uchr >= 0x80U;
}
bool isStringPrefixChar(char chr) { return chr != '\0' && std::strchr("bBrRuUfF", chr) != nullptr; }

char closerFor(char opener) {
  switch (opener) {
    case '(': return ')';
    case '[': return ']';
    default: return '}';
  }
}

const std::unordered_map<std::string, TokenKind>& keywords() {
  static const std::unordered_map<std::string, TokenKind> kKeywords{
      {"def", TokenKind::Def},       {"class", TokenKind::Class},     {"async", TokenKind::Async},
      {"import", TokenKind::Import}, {"from", TokenKind::From},       {"as", TokenKind::As},
      {"if", TokenKind::If},         {"elif", TokenKind::Elif},       {"else", TokenKind::Else},
      {"while", TokenKind::While},   {"for", TokenKind::For},         {"try", TokenKind::Try},
      {"except", TokenKind::Except}, {"finally", TokenKind::Finally}, {"with", TokenKind::With},
      {"lambda", TokenKind::Lambda}, {"True", TokenKind::BoolLit},    {"False", TokenKind::BoolLit},
      {"None", TokenKind::NoneLit},
  };
  return kKeywords;
}

bool isPlainKeyword(const std::string& word) {
  static const std::unordered_set<std::string> kPlain{
      "return", "del", "in", "break", "continue", "pass", "assert", "raise", "global",
      "nonlocal", "yield", "await", "and", "or", "not", "is",
  };
  return kPlain.count(word) != 0;
}
} // namespace

void Lexer::pushString(const std::string& text, const std::string& name) {
  State state;
  state.name = name;
  state.text = text;
  stack_.push_back(std::move(state));
}

bool Lexer::readNextLine(State& state) {
  if (state.cursor >= state.text.size()) { return false; }
  const auto nl = state.text.find('\n', state.cursor);
  const size_t end = nl == std::string::npos ? state.text.size() : nl;
  state.line.assign(state.text, state.cursor, end - state.cursor);
  state.cursor = nl == std::string::npos ? end : nl + 1;
  ++state.lineNo;
  state.index = 0;
  // Handle CRLF
  if (!state.line.empty() && state.line.back() == '\r') { state.line.pop_back(); }
  return true;
}

void Lexer::fail(const State& state, int col, const std::string& msg) {
  throw exceptions::ParseError(state.name, state.lineNo, col, msg);
}

void Lexer::push(State& state, Token tok) {
  tokens_.push_back(std::move(tok));
  state.lineHasTokens = true;
}

bool Lexer::emitIndentTokens(State& state) {
  const auto& line = state.line;
  size_t idx = 0;
  size_t width = 0;
  while (idx < line.size()) {
    const char chr = line[idx];
    if (chr == ' ') { ++width; }
    else if (chr == '\t') { width = (width / kTabStop + 1) * kTabStop; }
    else if (chr == '\f') { width = 0; }
    else { break; }
    ++idx;
  }
  // Blank or comment-only line: no tokens, no indentation change
  if (idx >= line.size() || line[idx] == '#') { return true; }

  auto makeTok = [&](TokenKind kind, const char* text) {
    Token tok;
    tok.kind = kind;
    tok.text = text;
    tok.file = state.name;
    tok.line = state.lineNo;
    tok.col = static_cast<int>(idx + 1);
    return tok;
  };
  if (width > state.indentStack.back()) {
    state.indentStack.push_back(width);
    tokens_.push_back(makeTok(TokenKind::Indent, "<INDENT>"));
  } else {
    while (width < state.indentStack.back()) {
      state.indentStack.pop_back();
      tokens_.push_back(makeTok(TokenKind::Dedent, "<DEDENT>"));
    }
    if (width != state.indentStack.back()) {
      fail(state, static_cast<int>(idx + 1), "unindent does not match any outer indentation level");
    }
  }
  state.index = idx;
  return false;
}

void Lexer::scanLine(State& state) {
  for (;;) {
    const auto& line = state.line;
    size_t& idx = state.index;
    while (idx < line.size() && (line[idx] == ' ' || line[idx] == '\t' || line[idx] == '\f')) { ++idx; }
    if (idx >= line.size()) { return; }
    if (line[idx] == '#') {
      idx = line.size();
      return;
    }
    if (line[idx] == '\\') {
      if (idx + 1 == line.size()) {
        state.continued = true;
        idx = line.size();
        return;
      }
      fail(state, static_cast<int>(idx + 1), "unexpected character after line continuation character");
    }
    push(state, scanOne(state));
  }
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
Token Lexer::scanString(State& state, const size_t start, const size_t quotePos, const bool isBytes) {
  const int startLine = state.lineNo;
  const int startCol = static_cast<int>(start + 1);
  auto unterminated = [&](const char* msg) {
    throw exceptions::ParseError(state.name, startLine, startCol, msg);
  };
  const char quote = state.line[quotePos];
  const bool triple = quotePos + 2 < state.line.size() && state.line[quotePos + 1] == quote &&
                      state.line[quotePos + 2] == quote;
  std::string text = state.line.substr(start, quotePos - start);
  size_t pos = 0;
  if (triple) {
    text.append(3, quote);
    pos = quotePos + 3;
    for (;;) {
      const auto& line = state.line;
      bool closed = false;
      while (pos < line.size()) {
        const char chr = line[pos];
        if (chr == '\\' && pos + 1 < line.size()) {
          text += chr;
          text += line[pos + 1];
          pos += 2;
          continue;
        }
        if (chr == quote && pos + 2 < line.size() && line[pos + 1] == quote && line[pos + 2] == quote) {
          text.append(3, quote);
          pos += 3;
          closed = true;
          break;
        }
        text += chr;
        ++pos;
      }
      if (closed) { break; }
      text += '\n';
      if (!readNextLine(state)) { unterminated("unterminated triple-quoted string literal"); }
      pos = 0;
    }
  } else {
    text += quote;
    pos = quotePos + 1;
    for (;;) {
      const auto& line = state.line;
      bool closed = false;
      bool escapedNewline = false;
      while (pos < line.size()) {
        const char chr = line[pos];
        if (chr == '\\') {
          text += chr;
          if (pos + 1 < line.size()) {
            text += line[pos + 1];
            pos += 2;
            continue;
          }
          escapedNewline = true;
          ++pos;
          break;
        }
        text += chr;
        ++pos;
        if (chr == quote) {
          closed = true;
          break;
        }
      }
      if (closed) { break; }
      if (!escapedNewline || !readNextLine(state)) { unterminated("unterminated string literal"); }
      text += '\n';
      pos = 0;
    }
  }
  state.index = pos;
  Token tok;
  tok.kind = isBytes ? TokenKind::Bytes : TokenKind::String;
  tok.text = std::move(text);
  tok.file = state.name;
  tok.line = startLine;
  tok.col = startCol;
  return tok;
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
Token Lexer::scanNumber(State& state) {
  const auto& line = state.line;
  size_t& idx = state.index;
  const size_t begin = idx;

  auto scanDigits = [&](size_t pos, auto isOk) {
    size_t cur = pos;
    bool have = false;
    bool prevUnderscore = false;
    while (cur < line.size()) {
      const char chr = line[cur];
      if (isOk(chr)) { have = true; prevUnderscore = false; ++cur; continue; }
      if (chr == '_' && have && !prevUnderscore) { prevUnderscore = true; ++cur; continue; }
      break;
    }
    if (prevUnderscore) { --cur; } // trim trailing underscore
    return cur;
  };
  // 0x_ff: one underscore may sit between the radix prefix and the first digit
  auto scanRadix = [&](size_t pos, auto isOk) {
    if (pos + 1 < line.size() && line[pos] == '_' && isOk(line[pos + 1])) { ++pos; }
    return scanDigits(pos, isOk);
  };
  auto isDec = [](char chr) { return std::isdigit(static_cast<unsigned char>(chr)) != 0; };
  auto isHex = [](char chr) { return std::isxdigit(static_cast<unsigned char>(chr)) != 0; };
  auto isBin = [](char chr) { return chr == '0' || chr == '1'; };
  auto isOct = [](char chr) { return chr >= '0' && chr <= '7'; };
  auto scanExponent = [&](size_t pos) -> size_t {
    if (pos >= line.size() || (line[pos] != 'e' && line[pos] != 'E')) { return pos; }
    size_t cur = pos + 1;
    if (cur < line.size() && (line[cur] == '+' || line[cur] == '-')) { ++cur; }
    const size_t end = scanDigits(cur, isDec);
    return end == cur ? pos : end; // back out if no digits
  };
  auto finish = [&](TokenKind kind, size_t end) {
    if (end < line.size() && (line[end] == 'j' || line[end] == 'J')) {
      kind = TokenKind::Imag;
      ++end;
    }
    Token tok;
    tok.kind = kind;
    tok.text = line.substr(begin, end - begin);
    tok.file = state.name;
    tok.line = state.lineNo;
    tok.col = static_cast<int>(begin + 1);
    idx = end;
    return tok;
  };

  if (line[idx] == '.') {
    const size_t fracEnd = scanDigits(idx + 1, isDec);
    return finish(TokenKind::Float, scanExponent(fracEnd));
  }
  if (line[idx] == '0' && idx + 1 < line.size()) {
    const char base = line[idx + 1];
    if (base == 'x' || base == 'X') { return finish(TokenKind::Int, scanRadix(idx + 2, isHex)); }
    if (base == 'o' || base == 'O') { return finish(TokenKind::Int, scanRadix(idx + 2, isOct)); }
    if (base == 'b' || base == 'B') { return finish(TokenKind::Int, scanRadix(idx + 2, isBin)); }
  }
  const size_t intEnd = scanDigits(idx, isDec);
  if (intEnd < line.size() && line[intEnd] == '.') {
    const size_t fracEnd = scanDigits(intEnd + 1, isDec);
    return finish(TokenKind::Float, scanExponent(fracEnd));
  }
  const size_t expEnd = scanExponent(intEnd);
  if (expEnd != intEnd) { return finish(TokenKind::Float, expEnd); }
  return finish(TokenKind::Int, intEnd);
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
Token Lexer::scanOne(State& state) {
  const auto& line = state.line;
  size_t& idx = state.index;

  auto makeTok = [&](TokenKind kind, size_t width) {
    Token tok;
    tok.kind = kind;
    tok.text = line.substr(idx, width);
    tok.file = state.name;
    tok.line = state.lineNo;
    tok.col = static_cast<int>(idx + 1);
    idx += width;
    return tok;
  };
  auto at = [&](size_t offset) -> char { return idx + offset < line.size() ? line[idx + offset] : '\0'; };
  // op / op= pairs such as '+' / '+='
  auto withAug = [&](TokenKind plain, size_t width) {
    return at(width) == '=' ? makeTok(TokenKind::AugAssign, width + 1) : makeTok(plain, width);
  };

  const char chr = line[idx];
  const int col = static_cast<int>(idx + 1);
  switch (chr) {
    case '(':
    case '[':
    case '{': {
      state.brackets.push_back(OpenBracket{chr, state.lineNo, col});
      const TokenKind kind = chr == '(' ? TokenKind::LParen : (chr == '[' ? TokenKind::LBracket : TokenKind::LBrace);
      return makeTok(kind, 1);
    }
    case ')':
    case ']':
    case '}': {
      if (state.brackets.empty()) { fail(state, col, std::string("unmatched '") + chr + "'"); }
      const char opener = state.brackets.back().chr;
      if (closerFor(opener) != chr) {
        fail(state, col, std::string("closing parenthesis '") + chr + "' does not match opening parenthesis '" + opener + "'");
      }
      state.brackets.pop_back();
      const TokenKind kind = chr == ')' ? TokenKind::RParen : (chr == ']' ? TokenKind::RBracket : TokenKind::RBrace);
      return makeTok(kind, 1);
    }
    case ':': return at(1) == '=' ? makeTok(TokenKind::ColonEqual, 2) : makeTok(TokenKind::Colon, 1);
    case ';': return makeTok(TokenKind::Semicolon, 1);
    case ',': return makeTok(TokenKind::Comma, 1);
    case '~': return makeTok(TokenKind::Operator, 1);
    case '+': return withAug(TokenKind::Plus, 1);
    case '@': return withAug(TokenKind::At, 1);
    case '%':
    case '|':
    case '&':
    case '^': return withAug(TokenKind::Operator, 1);
    case '=': return at(1) == '=' ? makeTok(TokenKind::Operator, 2) : makeTok(TokenKind::Equal, 1);
    case '!':
      if (at(1) == '=') { return makeTok(TokenKind::Operator, 2); }
      fail(state, col, "invalid syntax '!'");
    case '-':
      if (at(1) == '>') { return makeTok(TokenKind::Operator, 2); }
      return withAug(TokenKind::Minus, 1);
    case '*':
      if (at(1) == '*') { return withAug(TokenKind::StarStar, 2); }
      return withAug(TokenKind::Star, 1);
    case '/':
      return withAug(TokenKind::Operator, at(1) == '/' ? 2 : 1);
    case '<':
    case '>':
      if (at(1) == chr) { return withAug(TokenKind::Operator, 2); }
      return makeTok(TokenKind::Operator, at(1) == '=' ? 2 : 1);
    case '.':
      if (at(1) == '.' && at(2) == '.') { return makeTok(TokenKind::Ellipsis, 3); }
      if (std::isdigit(static_cast<unsigned char>(at(1))) != 0) { return scanNumber(state); }
      return makeTok(TokenKind::Dot, 1);
    case '"':
    case '\'':
      return scanString(state, idx, idx, /*isBytes=*/false);
    default:
      break;
  }

  if (std::isdigit(static_cast<unsigned char>(chr)) != 0) { return scanNumber(state); }

  if (isIdentStart(chr)) {
    // String prefixes: up to two of b/r/u/f directly followed by a quote
    size_t prefixEnd = idx;
    bool hasB = false;
    while (prefixEnd < line.size() && prefixEnd - idx < 2 && isStringPrefixChar(line[prefixEnd])) {
      if (line[prefixEnd] == 'b' || line[prefixEnd] == 'B') { hasB = true; }
      ++prefixEnd;
    }
    if (prefixEnd > idx && prefixEnd < line.size() && (line[prefixEnd] == '\'' || line[prefixEnd] == '"')) {
      return scanString(state, idx, prefixEnd, hasB);
    }
    size_t end = idx + 1;
    while (end < line.size() && isIdentChar(line[end])) { ++end; }
    const std::string ident = line.substr(idx, end - idx);
    const auto found = keywords().find(ident);
    if (found != keywords().end()) { return makeTok(found->second, end - idx); }
    return makeTok(isPlainKeyword(ident) ? TokenKind::Keyword : TokenKind::Ident, end - idx);
  }

  fail(state, col, std::string("invalid character '") + chr + "'");
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
void Lexer::buildAll() {
  if (finalized_) { return; }
  finalized_ = true;
  auto endOfLine = [](const State& state, TokenKind kind, const char* text, int line, int col) {
    Token tok;
    tok.kind = kind;
    tok.text = text;
    tok.file = state.name;
    tok.line = line;
    tok.col = col;
    return tok;
  };
  std::string lastFile;
  int lastLine = 1;
  // Process stack in LIFO order
  while (!stack_.empty()) {
    State state = std::move(stack_.back());
    stack_.pop_back();
    while (readNextLine(state)) {
      if (state.brackets.empty() && !state.continued) {
        if (emitIndentTokens(state)) { continue; }
      } else {
        state.continued = false;
      }
      scanLine(state);
      // Implicit (brackets) or explicit (backslash) line joining
      if (state.continued || !state.brackets.empty()) { continue; }
      if (state.lineHasTokens) {
        tokens_.push_back(endOfLine(state, TokenKind::Newline, "\n", state.lineNo, static_cast<int>(state.line.size() + 1)));
        state.lineHasTokens = false;
      }
    }
    if (!state.brackets.empty()) {
      const auto& open = state.brackets.back();
      throw exceptions::ParseError(state.name, open.line, open.col,
                                   std::string("'") + open.chr + "' was never closed");
    }
    if (state.continued) { fail(state, 1, "unexpected EOF while scanning line continuation"); }
    if (state.lineHasTokens) {
      tokens_.push_back(endOfLine(state, TokenKind::Newline, "\n", state.lineNo, static_cast<int>(state.line.size() + 1)));
    }
    while (state.indentStack.size() > 1) {
      state.indentStack.pop_back();
      tokens_.push_back(endOfLine(state, TokenKind::Dedent, "<DEDENT>", state.lineNo + 1, 1));
    }
    lastFile = state.name;
    lastLine = state.lineNo + 1;
  }
  // End sits on the line after the last one read, as Python reports EOF errors
  Token eof;
  eof.kind = TokenKind::End;
  eof.text = "<EOF>";
  eof.file = lastFile;
  eof.line = lastLine;
  eof.col = 1;
  tokens_.push_back(eof);
}

const Token& Lexer::peek(size_t lookahead) {
  if (!finalized_) { buildAll(); }
  if (pos_ + lookahead < tokens_.size()) {
    return tokens_[pos_ + lookahead];
  }
  return tokens_.back();
}

Token Lexer::next() {
  if (!finalized_) { buildAll(); }
  if (pos_ < tokens_.size()) {
    return tokens_[pos_++];
  }
  return tokens_.back();
}

std::vector<Token> Lexer::tokens() {
  if (!finalized_) { buildAll(); }
  return tokens_;
}

} // namespace pyjudge::lex
