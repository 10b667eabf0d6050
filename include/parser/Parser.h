/***
 * Name: pyjudge::parse::Parser
 * Purpose: Build a structural AST of submitted Python source, and parse
 *   literal/call-chain expressions.
 * Inputs:
 *   - Token stream from Lexer
 * Outputs:
 *   - Module AST (statement shapes with fully parsed imports), or a single
 *     expression tree.
 * Theory of Operation:
 *   Recursive descent over the buffered token vector. Statements:
 *     module   := { stmt }
 *     stmt     := decorated | compound | simple_line
 *     compound := header ':' suite      (header ends at a depth-0 colon)
 *     suite    := NEWLINE INDENT { stmt } DEDENT | simple_line
 *     simple_line := simple { ';' simple } [';'] NEWLINE
 *   Only import statements are parsed in depth; other simple statements are
 *   kept opaque. Expressions cover what repr() produces for builtin values
 *   plus name/attribute/call chains:
 *     expr    := operand { ',' operand } [',']
 *     operand := ('-'|'+') operand | postfix
 *     postfix := atom { '.' IDENT | '(' args ')' }
 *   All failures throw exceptions::ParseError with file:line:col.
 */
#pragma once

#include "ast/Nodes.h"
#include "lexer/Lexer.h"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace pyjudge::parse {

class Parser {
 public:
  explicit Parser(lex::Lexer& lexer) : lexer_(lexer) {}

  std::unique_ptr<ast::Module> parseModule();

  // Whole input must be one expression (a trailing NEWLINE is allowed).
  std::unique_ptr<ast::Expr> parseExpression();

  // Convenience: lex + parse an expression from text.
  static std::unique_ptr<ast::Expr> parseExpressionText(const std::string& text,
                                                        const std::string& name);

  // Decode the text of a String/Bytes token (prefixes, quotes, escapes).
  static std::string decodeStringToken(const lex::Token& tok);

 private:
  lex::Lexer& lexer_;
  std::vector<lex::Token> tokens_{};
  size_t pos_{0};
  bool initialized_{false};

  void initBuffer();
  const lex::Token& peek() const;
  const lex::Token& peekNext() const;
  lex::Token get();
  bool match(lex::TokenKind tokenKind);
  // what defaults to to_string(tokenKind)
  void expect(lex::TokenKind tokenKind, const char* what = nullptr);
  [[noreturn]] static void failAt(const lex::Token& tok, const std::string& msg);

  // statements
  void parseStatementInto(std::vector<std::unique_ptr<ast::Stmt>>& out);
  void parseSuiteInto(std::vector<std::unique_ptr<ast::Stmt>>& out);
  void parseSimpleLineInto(std::vector<std::unique_ptr<ast::Stmt>>& out);
  std::unique_ptr<ast::Stmt> parseSimpleStatement();
  std::unique_ptr<ast::Stmt> parseImportStmt();
  std::unique_ptr<ast::Stmt> parseDecorated();
  std::unique_ptr<ast::Stmt> parseCompound(bool isAsync);
  void skipHeaderToColon(const lex::Token& start);
  bool isSoftKeywordHeader() const;
  std::string parseDottedName();
  ast::Alias parseAlias(bool dotted);

  // expressions
  std::unique_ptr<ast::Expr> parseExpr();
  std::unique_ptr<ast::Expr> parseOperand();
  std::unique_ptr<ast::Expr> parsePostfix(std::unique_ptr<ast::Expr> base);
  std::unique_ptr<ast::Expr> parseAtom();
  std::unique_ptr<ast::Expr> parseStringAtom();
  std::unique_ptr<ast::Expr> parseTupleOrParen(const lex::Token& openTok);
  std::unique_ptr<ast::Expr> parseListLiteral(const lex::Token& openTok);
  std::unique_ptr<ast::Expr> parseDictOrSetLiteral(const lex::Token& openTok);
  void parseArgList(ast::Call& call);
  static std::unique_ptr<ast::Expr> parseIntToken(const lex::Token& tok);
  static std::unique_ptr<ast::Expr> parseFloatToken(const lex::Token& tok);

  template <typename NodeT>
  static std::unique_ptr<NodeT> stamp(std::unique_ptr<NodeT> node, const lex::Token& tok) {
    node->file = tok.file;
    node->line = tok.line;
    node->col = tok.col;
    return node;
  }
};

} // namespace pyjudge::parse
