/***
 * Name: pyjudge::ast statements
 * Purpose: Statement shapes of a submission. Imports are parsed in full,
 *   definitions keep their name and body, everything else is opaque.
 */
#pragma once

#include "ast/Node.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pyjudge::ast {

using StmtList = std::vector<std::unique_ptr<Stmt>>;

struct Module final : Node {
  StmtList body;
  Module() : Node(NodeKind::Module) {}
};

struct FunctionDef final : Stmt {
  std::string name;
  StmtList body;
  bool isAsync{false};
  int decoratorCount{0};
  explicit FunctionDef(std::string n) : Stmt(NodeKind::FunctionDef), name(std::move(n)) {}
};

struct ClassDef final : Stmt {
  std::string name;
  StmtList body;
  int decoratorCount{0};
  explicit ClassDef(std::string n) : Stmt(NodeKind::ClassDef), name(std::move(n)) {}
};

// if/elif/else/while/for/try/except/finally/with/match/case. The header is
// skipped, the body is parsed.
struct CompoundStmt final : Stmt {
  std::string keyword;
  StmtList body;
  bool isAsync{false};
  explicit CompoundStmt(std::string kw) : Stmt(NodeKind::CompoundStmt), keyword(std::move(kw)) {}
};

// Assignment, expression statement, return, ...
struct SimpleStmt final : Stmt {
  std::string leading; // spelling of the first token
  int tokenCount{0};
  explicit SimpleStmt(std::string lead) : Stmt(NodeKind::SimpleStmt), leading(std::move(lead)) {}
};

// One `name [as asname]` clause of an import.
struct Alias {
  std::string name;   // dotted module path, or the imported member for ImportFrom
  std::string asname; // empty when absent
  int line{0};
  int col{0};
};

struct Import final : Stmt {
  std::vector<Alias> names;
  Import() : Stmt(NodeKind::Import) {}
};

struct ImportFrom final : Stmt {
  std::string module; // empty for `from . import x`
  int level{0};       // leading dots
  bool star{false};
  std::vector<Alias> names;
  ImportFrom() : Stmt(NodeKind::ImportFrom) {}
};

} // namespace pyjudge::ast
