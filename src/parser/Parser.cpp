/***
 * Name: pyjudge::parse::Parser (impl)
 * Purpose: Structural statement parser and literal/call-chain expression parser.
 */
#include "parser/Parser.h"
#include "ast/Nodes.h"
#include "lexer/Lexer.h"
#include "pyjudge/exceptions/parse_error.h"
#include "pyjudge/support/decimal.h"
#include "pyjudge/support/utf8.h"
#include <cctype>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pyjudge::parse {

using TK = lex::TokenKind;

namespace {
bool isCompoundKeyword(TK kind) {
  switch (kind) {
    case TK::If: case TK::Elif: case TK::Else: case TK::While: case TK::For:
    case TK::Try: case TK::Except: case TK::Finally: case TK::With:
    case TK::Def: case TK::Class:
      return true;
    default:
      return false;
  }
}

bool isAssignOp(TK kind) { return kind == TK::Equal || kind == TK::ColonEqual || kind == TK::AugAssign; }

bool isOpen(TK kind) { return kind == TK::LParen || kind == TK::LBracket || kind == TK::LBrace; }
bool isClose(TK kind) { return kind == TK::RParen || kind == TK::RBracket || kind == TK::RBrace; }
bool isStringKind(TK kind) { return kind == TK::String || kind == TK::Bytes; }

bool endsOperand(TK kind) {
  switch (kind) {
    case TK::Ident: case TK::Int: case TK::Float: case TK::Imag: case TK::BoolLit: case TK::NoneLit:
    case TK::String: case TK::Bytes: case TK::RParen: case TK::RBracket: case TK::RBrace:
      return true;
    default:
      return false;
  }
}

// Two operands in a row ("print 'x'", "x 1") is never valid Python; adjacent
// string literals concatenate.
bool adjacentOperands(TK prev, TK next) {
  if (!endsOperand(prev)) { return false; }
  switch (next) {
    case TK::Ident: case TK::Int: case TK::Float: case TK::Imag: case TK::BoolLit: case TK::NoneLit:
      return true;
    case TK::String: case TK::Bytes:
      return !isStringKind(prev);
    default:
      return false;
  }
}

// Canonical base-10 digits of an int token, however large.
bool parseIntText(const std::string& text, std::string& out, std::string& err) {
  std::string digits;
  for (const char chr : text) {
    if (chr != '_') { digits.push_back(chr); }
  }
  unsigned base = 10;
  size_t start = 0;
  if (digits.size() > 1 && digits[0] == '0') {
    const char marker = static_cast<char>(std::tolower(static_cast<unsigned char>(digits[1])));
    if (marker == 'x') { base = 16; }
    else if (marker == 'o') { base = 8; }
    else if (marker == 'b') { base = 2; }
    if (base != 10) { start = 2; }
  }
  if (start >= digits.size()) {
    err = "invalid integer literal";
    return false;
  }
  if (base == 10) {
    if (digits.find_first_not_of("0123456789") != std::string::npos) {
      err = "invalid digit in integer literal";
      return false;
    }
    const auto first = digits.find_first_not_of('0');
    if (first == std::string::npos) {
      out = "0";
      return true;
    }
    if (first > 0) {
      err = "leading zeros in decimal integer literals are not permitted";
      return false;
    }
    out = std::move(digits);
    return true;
  }
  std::string value = "0";
  for (size_t i = start; i < digits.size(); ++i) {
    const auto chr = static_cast<unsigned char>(digits[i]);
    unsigned digit = base;
    if (std::isdigit(chr) != 0) { digit = static_cast<unsigned>(chr - '0'); }
    else if (std::isxdigit(chr) != 0) { digit = static_cast<unsigned>(std::tolower(chr) - 'a' + 10); }
    if (digit >= base) {
      err = "invalid digit in integer literal";
      return false;
    }
    support::MultiplyAddDecimal(value, base, digit);
  }
  out = std::move(value);
  return true;
}
} // namespace

void Parser::initBuffer() {
  if (initialized_) return;
  tokens_ = lexer_.tokens();
  pos_ = 0;
  initialized_ = true;
}

const lex::Token& Parser::peek() const {
  // Safe in presence of End sentry
  return tokens_[pos_ < tokens_.size() ? pos_ : (tokens_.size() - 1)];
}
const lex::Token& Parser::peekNext() const {
  const size_t idx = pos_ + 1;
  return tokens_[idx < tokens_.size() ? idx : (tokens_.size() - 1)];
}
lex::Token Parser::get() {
  if (pos_ < tokens_.size()) {
    return tokens_[pos_++];
  }
  return tokens_.empty() ? lex::Token{} : tokens_.back();
}

bool Parser::match(TK tokenKind) {
  if (peek().kind == tokenKind) { (void)get(); return true; }
  return false;
}

void Parser::failAt(const lex::Token& tok, const std::string& msg) {
  throw exceptions::ParseError(tok.file.empty() ? std::string("<input>") : tok.file, tok.line, tok.col, msg);
}

void Parser::expect(TK tokenKind, const char* what) {
  if (!match(tokenKind)) {
    const auto& got = peek();
    std::string m = "expected ";
    m += what != nullptr ? what : lex::to_string(tokenKind);
    if (got.kind == TK::End) {
      m += " before end of input";
    } else if (got.kind != TK::Newline) {
      m += ", got '" + got.text + "'";
    }
    failAt(got, m);
  }
}

std::unique_ptr<ast::Module> Parser::parseModule() {
  initBuffer();
  auto mod = std::make_unique<ast::Module>();
  // Stamp module with source filename from the first token, if any
  if (!tokens_.empty()) {
    mod->file = tokens_[0].file;
    mod->line = 1; mod->col = 1;
  }
  while (peek().kind != TK::End) {
    if (peek().kind == TK::Newline) { get(); continue; }
    parseStatementInto(mod->body);
  }
  return mod;
}

void Parser::parseStatementInto(std::vector<std::unique_ptr<ast::Stmt>>& out) {
  const auto& tok = peek();
  switch (tok.kind) {
    case TK::Indent: failAt(tok, "unexpected indent");
    case TK::Dedent: failAt(tok, "unindent does not match any outer indentation level");
    case TK::At: out.push_back(parseDecorated()); return;
    case TK::Async:
      get();
      if (peek().kind == TK::Def || peek().kind == TK::For || peek().kind == TK::With) {
        out.push_back(parseCompound(/*isAsync=*/true));
        return;
      }
      failAt(peek(), "invalid syntax");
    default:
      break;
  }
  if (isCompoundKeyword(tok.kind) || isSoftKeywordHeader()) {
    out.push_back(parseCompound(/*isAsync=*/false));
    return;
  }
  parseSimpleLineInto(out);
}

// match/case are keywords only when the line reads like a block header
bool Parser::isSoftKeywordHeader() const {
  const auto& tok = peek();
  if (tok.kind != TK::Ident || (tok.text != "match" && tok.text != "case")) { return false; }
  const TK next = peekNext().kind;
  if (isAssignOp(next) || next == TK::Dot || next == TK::Colon || next == TK::Newline ||
      next == TK::End || next == TK::Semicolon || next == TK::Comma) {
    return false;
  }
  int depth = 0;
  int lambdas = 0;
  for (size_t idx = pos_ + 1; idx < tokens_.size(); ++idx) {
    const TK kind = tokens_[idx].kind;
    if (kind == TK::Newline || kind == TK::End) { return false; }
    if (isOpen(kind)) { ++depth; }
    else if (isClose(kind)) { --depth; }
    else if (kind == TK::Lambda && depth == 0) { ++lambdas; }
    else if (kind == TK::Colon && depth == 0) {
      if (lambdas == 0) { return true; }
      --lambdas;
    }
  }
  return false;
}

std::unique_ptr<ast::Stmt> Parser::parseDecorated() {
  int count = 0;
  while (peek().kind == TK::At) {
    get();
    if (peek().kind == TK::Newline || peek().kind == TK::End) { failAt(peek(), "invalid syntax"); }
    while (peek().kind != TK::Newline && peek().kind != TK::End) { get(); }
    expect(TK::Newline, "newline after decorator");
    ++count;
  }
  const bool isAsync = match(TK::Async);
  if (peek().kind == TK::Def) {
    auto stmt = parseCompound(isAsync);
    static_cast<ast::FunctionDef*>(stmt.get())->decoratorCount = count;
    return stmt;
  }
  if (!isAsync && peek().kind == TK::Class) {
    auto stmt = parseCompound(false);
    static_cast<ast::ClassDef*>(stmt.get())->decoratorCount = count;
    return stmt;
  }
  failAt(peek(), "expected function or class definition after decorator");
}

std::unique_ptr<ast::Stmt> Parser::parseCompound(bool isAsync) {
  const lex::Token head = get();
  if (head.kind == TK::Def) {
    const auto name = get();
    if (name.kind != TK::Ident) { failAt(name, "expected function name"); }
    if (peek().kind != TK::LParen) { failAt(peek(), "expected '('"); }
    skipHeaderToColon(head);
    auto fn = stamp(std::make_unique<ast::FunctionDef>(name.text), head);
    fn->isAsync = isAsync;
    parseSuiteInto(fn->body);
    return fn;
  }
  if (head.kind == TK::Class) {
    const auto name = get();
    if (name.kind != TK::Ident) { failAt(name, "expected class name"); }
    skipHeaderToColon(head);
    auto cls = stamp(std::make_unique<ast::ClassDef>(name.text), head);
    parseSuiteInto(cls->body);
    return cls;
  }
  auto stmt = stamp(std::make_unique<ast::CompoundStmt>(head.text), head);
  stmt->isAsync = isAsync;
  skipHeaderToColon(head);
  parseSuiteInto(stmt->body);
  return stmt;
}

void Parser::skipHeaderToColon(const lex::Token& start) {
  int depth = 0;
  int lambdas = 0; // each lambda at depth 0 owns the next depth-0 colon
  for (;;) {
    const auto& tok = peek();
    switch (tok.kind) {
      case TK::Newline:
      case TK::End:
        failAt(tok, "expected ':' after '" + start.text + "' header");
      case TK::LParen: case TK::LBracket: case TK::LBrace: ++depth; break;
      case TK::RParen: case TK::RBracket: case TK::RBrace: --depth; break;
      case TK::Lambda: if (depth == 0) { ++lambdas; } break;
      case TK::Colon:
        if (depth == 0) {
          if (lambdas == 0) { get(); return; }
          --lambdas;
        }
        break;
      default: break;
    }
    get();
  }
}

void Parser::parseSuiteInto(std::vector<std::unique_ptr<ast::Stmt>>& out) {
  if (peek().kind == TK::Newline) {
    get();
    if (peek().kind != TK::Indent) { failAt(peek(), "expected an indented block"); }
    get();
    while (peek().kind != TK::Dedent && peek().kind != TK::End) {
      parseStatementInto(out);
    }
    (void)match(TK::Dedent);
    return;
  }
  if (peek().kind == TK::End) { failAt(peek(), "expected an indented block"); }
  parseSimpleLineInto(out);
}

void Parser::parseSimpleLineInto(std::vector<std::unique_ptr<ast::Stmt>>& out) {
  for (;;) {
    out.push_back(parseSimpleStatement());
    if (!match(TK::Semicolon)) { break; }
    if (peek().kind == TK::Newline || peek().kind == TK::End) { break; }
  }
  if (peek().kind == TK::Newline) { get(); return; }
  if (peek().kind == TK::End) { return; }
  failAt(peek(), "invalid syntax");
}

std::unique_ptr<ast::Stmt> Parser::parseSimpleStatement() {
  const lex::Token first = peek();
  if (first.kind == TK::Import || first.kind == TK::From) {
    auto stmt = parseImportStmt();
    const TK after = peek().kind;
    if (after != TK::Semicolon && after != TK::Newline && after != TK::End) { failAt(peek(), "invalid syntax"); }
    return stmt;
  }
  if (first.kind == TK::Semicolon || first.kind == TK::Newline || first.kind == TK::End ||
      first.kind == TK::At || first.kind == TK::Async || isCompoundKeyword(first.kind)) {
    failAt(first, "invalid syntax");
  }
  auto stmt = stamp(std::make_unique<ast::SimpleStmt>(first.text), first);
  // 'type X = ...' starts with the soft keyword followed by a name
  const bool typeAlias = first.kind == TK::Ident && first.text == "type";
  int depth = 0;
  TK prev = TK::Newline;
  for (;;) {
    const auto& tok = peek();
    if (tok.kind == TK::Newline || tok.kind == TK::End) { break; }
    if (tok.kind == TK::Semicolon) {
      if (depth == 0) { break; }
      failAt(tok, "invalid syntax");
    }
    if (adjacentOperands(prev, tok.kind) && !(typeAlias && stmt->tokenCount == 1)) {
      failAt(tok, "invalid syntax");
    }
    if (isOpen(tok.kind)) { ++depth; }
    else if (isClose(tok.kind)) { --depth; }
    prev = tok.kind;
    get();
    ++stmt->tokenCount;
  }
  return stmt;
}

std::string Parser::parseDottedName() {
  const auto first = get();
  if (first.kind != TK::Ident) { failAt(first, "expected module name"); }
  std::string dotted = first.text;
  while (peek().kind == TK::Dot) {
    get();
    const auto nxt = get();
    if (nxt.kind != TK::Ident) { failAt(nxt, "expected name after '.'"); }
    dotted += ".";
    dotted += nxt.text;
  }
  return dotted;
}

ast::Alias Parser::parseAlias(bool dotted) {
  const lex::Token start = peek();
  ast::Alias alias;
  if (dotted) {
    alias.name = parseDottedName();
  } else {
    const auto nm = get();
    if (nm.kind != TK::Ident) { failAt(nm, "expected name to import"); }
    alias.name = nm.text;
  }
  alias.line = start.line;
  alias.col = start.col;
  if (match(TK::As)) {
    const auto asName = get();
    if (asName.kind != TK::Ident) { failAt(asName, "expected name after 'as'"); }
    alias.asname = asName.text;
  }
  return alias;
}

std::unique_ptr<ast::Stmt> Parser::parseImportStmt() {
  const lex::Token head = get();
  if (head.kind == TK::Import) {
    auto imp = stamp(std::make_unique<ast::Import>(), head);
    imp->names.push_back(parseAlias(/*dotted=*/true));
    while (match(TK::Comma)) { imp->names.push_back(parseAlias(/*dotted=*/true)); }
    return imp;
  }
  // from import
  auto imp = stamp(std::make_unique<ast::ImportFrom>(), head);
  // Support both repeated '.' tokens and a single Ellipsis token ('...')
  while (peek().kind == TK::Dot || peek().kind == TK::Ellipsis) {
    imp->level += peek().kind == TK::Dot ? 1 : 3;
    get();
  }
  if (peek().kind == TK::Ident) {
    imp->module = parseDottedName();
  } else if (imp->level == 0) {
    failAt(peek(), "expected module name");
  }
  expect(TK::Import);
  if (match(TK::Star)) {
    imp->star = true;
    return imp;
  }
  const bool paren = match(TK::LParen);
  imp->names.push_back(parseAlias(/*dotted=*/false));
  while (match(TK::Comma)) {
    if (paren && peek().kind == TK::RParen) { break; }
    imp->names.push_back(parseAlias(/*dotted=*/false));
  }
  if (paren) { expect(TK::RParen); }
  return imp;
}

std::unique_ptr<ast::Expr> Parser::parseExpressionText(const std::string& text, const std::string& name) {
  lex::Lexer lexer;
  lexer.pushString(text, name);
  Parser parser(lexer);
  return parser.parseExpression();
}

std::unique_ptr<ast::Expr> Parser::parseExpression() {
  initBuffer();
  (void)match(TK::Indent);
  if (peek().kind == TK::End || peek().kind == TK::Newline) { failAt(peek(), "expected expression"); }
  auto expr = parseExpr();
  while (peek().kind == TK::Newline || peek().kind == TK::Dedent) { get(); }
  if (peek().kind != TK::End) { failAt(peek(), "unexpected '" + peek().text + "'"); }
  return expr;
}

std::unique_ptr<ast::Expr> Parser::parseExpr() {
  const lex::Token start = peek();
  auto first = parseOperand();
  if (peek().kind != TK::Comma) { return first; }
  // Bare tuple: 1, 2
  auto tuple = stamp(std::make_unique<ast::TupleLiteral>(), start);
  tuple->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (peek().kind == TK::Newline || peek().kind == TK::End) { break; }
    tuple->elements.push_back(parseOperand());
  }
  return tuple;
}

std::unique_ptr<ast::Expr> Parser::parseOperand() {
  if (peek().kind == TK::Minus || peek().kind == TK::Plus) {
    const lex::Token opTok = get();
    auto operand = parseOperand();
    const auto op = opTok.kind == TK::Minus ? ast::Sign::Minus : ast::Sign::Plus;
    return stamp(std::make_unique<ast::Signed>(op, std::move(operand)), opTok);
  }
  return parsePostfix(parseAtom());
}

std::unique_ptr<ast::Expr> Parser::parsePostfix(std::unique_ptr<ast::Expr> base) {
  for (;;) {
    if (peek().kind == TK::Dot) {
      get();
      const auto nm = get();
      if (nm.kind != TK::Ident) { failAt(nm, "expected attribute name after '.'"); }
      base = stamp(std::make_unique<ast::Attribute>(std::move(base), nm.text), nm);
      continue;
    }
    if (peek().kind == TK::LParen) {
      const auto open = get();
      auto call = stamp(std::make_unique<ast::Call>(std::move(base)), open);
      parseArgList(*call);
      base = std::move(call);
      continue;
    }
    if (peek().kind == TK::LBracket) { failAt(peek(), "subscripts are not supported"); }
    return base;
  }
}

void Parser::parseArgList(ast::Call& call) {
  while (peek().kind != TK::RParen) {
    if (peek().kind == TK::Star || peek().kind == TK::StarStar) {
      failAt(peek(), "argument unpacking is not supported");
    }
    if (peek().kind == TK::Ident && peekNext().kind == TK::Equal) {
      const auto nm = get();
      get();
      call.keywords.push_back(ast::KeywordArg{nm.text, parseOperand()});
    } else {
      if (!call.keywords.empty()) { failAt(peek(), "positional argument follows keyword argument"); }
      call.args.push_back(parseOperand());
    }
    if (!match(TK::Comma)) { break; }
  }
  expect(TK::RParen);
}

std::unique_ptr<ast::Expr> Parser::parseAtom() {
  const auto& tok = peek();
  switch (tok.kind) {
    case TK::Int: return parseIntToken(get());
    case TK::Float: return parseFloatToken(get());
    case TK::Imag: failAt(tok, "complex literals are not supported");
    case TK::String:
    case TK::Bytes: return parseStringAtom();
    case TK::BoolLit: {
      const auto lit = get();
      return stamp(std::make_unique<ast::BoolLiteral>(lit.text == "True"), lit);
    }
    case TK::NoneLit: {
      const auto lit = get();
      return stamp(std::make_unique<ast::NoneLiteral>(), lit);
    }
    case TK::Ident: {
      const auto id = get();
      return stamp(std::make_unique<ast::Name>(id.text), id);
    }
    case TK::LParen: { const auto open = get(); return parseTupleOrParen(open); }
    case TK::LBracket: { const auto open = get(); return parseListLiteral(open); }
    case TK::LBrace: { const auto open = get(); return parseDictOrSetLiteral(open); }
    case TK::Ellipsis: failAt(tok, "Ellipsis is not supported");
    case TK::End: failAt(tok, "unexpected end of input");
    default: failAt(tok, "invalid syntax near '" + tok.text + "'");
  }
}

std::unique_ptr<ast::Expr> Parser::parseStringAtom() {
  const lex::Token first = peek();
  const bool isBytes = first.kind == TK::Bytes;
  std::string value;
  // Adjacent literals concatenate
  while (isStringKind(peek().kind)) {
    const auto tok = get();
    if ((tok.kind == TK::Bytes) != isBytes) { failAt(tok, "cannot mix bytes and nonbytes literals"); }
    value += decodeStringToken(tok);
  }
  if (isBytes) { return stamp(std::make_unique<ast::BytesLiteral>(std::move(value)), first); }
  return stamp(std::make_unique<ast::StringLiteral>(std::move(value)), first);
}

std::unique_ptr<ast::Expr> Parser::parseTupleOrParen(const lex::Token& openTok) {
  if (match(TK::RParen)) { return stamp(std::make_unique<ast::TupleLiteral>(), openTok); }
  auto first = parseOperand();
  if (match(TK::RParen)) { return first; }
  auto tuple = stamp(std::make_unique<ast::TupleLiteral>(), openTok);
  tuple->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (peek().kind == TK::RParen) { break; }
    tuple->elements.push_back(parseOperand());
  }
  expect(TK::RParen);
  return tuple;
}

std::unique_ptr<ast::Expr> Parser::parseListLiteral(const lex::Token& openTok) {
  auto list = stamp(std::make_unique<ast::ListLiteral>(), openTok);
  while (peek().kind != TK::RBracket) {
    list->elements.push_back(parseOperand());
    if (!match(TK::Comma)) { break; }
  }
  expect(TK::RBracket);
  return list;
}

std::unique_ptr<ast::Expr> Parser::parseDictOrSetLiteral(const lex::Token& openTok) {
  if (match(TK::RBrace)) { return stamp(std::make_unique<ast::DictLiteral>(), openTok); }
  auto firstKey = parseOperand();
  if (match(TK::Colon)) {
    auto dict = stamp(std::make_unique<ast::DictLiteral>(), openTok);
    auto firstValue = parseOperand();
    dict->items.emplace_back(std::move(firstKey), std::move(firstValue));
    while (match(TK::Comma)) {
      if (peek().kind == TK::RBrace) { break; }
      auto key = parseOperand();
      expect(TK::Colon);
      auto value = parseOperand();
      dict->items.emplace_back(std::move(key), std::move(value));
    }
    expect(TK::RBrace);
    return dict;
  }
  auto set = stamp(std::make_unique<ast::SetLiteral>(), openTok);
  set->elements.push_back(std::move(firstKey));
  while (match(TK::Comma)) {
    if (peek().kind == TK::RBrace) { break; }
    set->elements.push_back(parseOperand());
  }
  expect(TK::RBrace);
  return set;
}

std::unique_ptr<ast::Expr> Parser::parseIntToken(const lex::Token& tok) {
  std::string digits;
  std::string err;
  if (!parseIntText(tok.text, digits, err)) { failAt(tok, err); }
  return stamp(std::make_unique<ast::IntLiteral>(std::move(digits)), tok);
}

std::unique_ptr<ast::Expr> Parser::parseFloatToken(const lex::Token& tok) {
  std::string text;
  for (const char chr : tok.text) {
    if (chr != '_') { text.push_back(chr); }
  }
  errno = 0;
  char* end = nullptr;
  const double value = std::strtod(text.c_str(), &end);
  if (end == text.c_str() || *end != '\0') { failAt(tok, "invalid float literal"); }
  return stamp(std::make_unique<ast::FloatLiteral>(value), tok);
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
std::string Parser::decodeStringToken(const lex::Token& tok) {
  const std::string& text = tok.text;
  size_t idx = 0;
  bool raw = false;
  bool bytes = false;
  while (idx < text.size() && text[idx] != '\'' && text[idx] != '"') {
    const char prefix = static_cast<char>(std::tolower(static_cast<unsigned char>(text[idx])));
    if (prefix == 'r') { raw = true; }
    else if (prefix == 'b') { bytes = true; }
    else if (prefix == 'f') { failAt(tok, "f-strings are not supported in literals"); }
    ++idx;
  }
  if (idx >= text.size()) { failAt(tok, "malformed string literal"); }
  const char quote = text[idx];
  const size_t quoteLen = (text.size() >= idx + 6 && text[idx + 1] == quote && text[idx + 2] == quote) ? 3 : 1;
  if (text.size() < idx + 2 * quoteLen) { failAt(tok, "malformed string literal"); }
  const std::string body = text.substr(idx + quoteLen, text.size() - idx - 2 * quoteLen);
  if (raw) { return body; }

  std::string out;
  auto emit = [&](std::uint32_t codePoint) {
    if (bytes) {
      out.push_back(static_cast<char>(codePoint & 0xFFU));
    } else if (!support::AppendUtf8(out, codePoint)) {
      failAt(tok, "invalid code point in string literal");
    }
  };
  size_t pos = 0;
  auto readHex = [&](size_t width, const char* truncated) {
    std::uint32_t value = 0;
    for (size_t i = 0; i < width; ++i) {
      if (pos >= body.size() || std::isxdigit(static_cast<unsigned char>(body[pos])) == 0) { failAt(tok, truncated); }
      const auto chr = static_cast<unsigned char>(body[pos]);
      const std::uint32_t digit = std::isdigit(chr) != 0 ? static_cast<std::uint32_t>(chr - '0')
                                                         : static_cast<std::uint32_t>(std::tolower(chr) - 'a' + 10);
      value = (value << 4U) | digit;
      ++pos;
    }
    return value;
  };
  while (pos < body.size()) {
    const char chr = body[pos];
    if (chr != '\\') {
      if (bytes && static_cast<unsigned char>(chr) >= 0x80U) {
        failAt(tok, "bytes can only contain ASCII literal characters");
      }
      out.push_back(chr);
      ++pos;
      continue;
    }
    if (pos + 1 >= body.size()) {
      out.push_back(chr);
      ++pos;
      continue;
    }
    const char esc = body[pos + 1];
    pos += 2;
    switch (esc) {
      case '\n': break; // escaped newline joins lines
      case '\\': out.push_back('\\'); break;
      case '\'': out.push_back('\''); break;
      case '"': out.push_back('"'); break;
      case 'a': out.push_back('\a'); break;
      case 'b': out.push_back('\b'); break;
      case 'f': out.push_back('\f'); break;
      case 'n': out.push_back('\n'); break;
      case 'r': out.push_back('\r'); break;
      case 't': out.push_back('\t'); break;
      case 'v': out.push_back('\v'); break;
      case 'x': emit(readHex(2, "truncated \\xXX escape")); break;
      case 'u':
        if (bytes) { out.append("\\u"); break; }
        emit(readHex(4, "truncated \\uXXXX escape"));
        break;
      case 'U':
        if (bytes) { out.append("\\U"); break; }
        emit(readHex(8, "truncated \\UXXXXXXXX escape"));
        break;
      case 'N':
        if (bytes) { out.append("\\N"); break; }
        failAt(tok, "\\N{...} escapes are not supported");
      default:
        if (esc >= '0' && esc <= '7') {
          std::uint32_t value = static_cast<std::uint32_t>(esc - '0');
          for (int n = 1; n < 3 && pos < body.size() && body[pos] >= '0' && body[pos] <= '7'; ++n) {
            value = value * 8U + static_cast<std::uint32_t>(body[pos] - '0');
            ++pos;
          }
          emit(value);
          break;
        }
        // Unknown escapes keep the backslash
        out.push_back('\\');
        out.push_back(esc);
        break;
    }
  }
  return out;
}

} // namespace pyjudge::parse
