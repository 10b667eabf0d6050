/***
 * Name: pyjudge::ast::Node
 * Purpose: Common base of statement and expression nodes.
 * Theory of Operation:
 *   Nodes carry a kind tag and the source location of their first token.
 *   Consumers switch on kind and static_cast; statements additionally accept
 *   a VisitorBase for traversal by walkStatements.
 */
#pragma once

#include <string>

namespace pyjudge::ast {

enum class NodeKind {
  // statements
  Module,
  FunctionDef,
  ClassDef,
  CompoundStmt,
  SimpleStmt,
  Import,
  ImportFrom,
  // expressions
  Name,
  Attribute,
  Call,
  Signed,
  IntLiteral,
  FloatLiteral,
  StringLiteral,
  BytesLiteral,
  BoolLiteral,
  NoneLiteral,
  TupleLiteral,
  ListLiteral,
  SetLiteral,
  DictLiteral
};

// Name used in decode diagnostics, e.g. "malformed node or string: Call".
const char* to_string(NodeKind kind);

struct VisitorBase;

struct Node {
  NodeKind kind;
  int line{0};
  int col{0};
  std::string file{};

  explicit Node(const NodeKind k) : kind(k) {}
  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;
  virtual ~Node() = default;
};

struct Stmt : Node {
  using Node::Node;
  void accept(VisitorBase& visitor) const;
};

struct Expr : Node {
  using Node::Node;
};

} // namespace pyjudge::ast
