/***
 * Name: pyjudge::ast::walkStatements
 * Purpose: Pre-order traversal of nested statement bodies.
 */
#include "ast/WalkStatements.h"

namespace pyjudge::ast {

namespace {
const StmtList* nestedBody(const Stmt& stmt) {
  switch (stmt.kind) {
    case NodeKind::FunctionDef: return &static_cast<const FunctionDef&>(stmt).body;
    case NodeKind::ClassDef: return &static_cast<const ClassDef&>(stmt).body;
    case NodeKind::CompoundStmt: return &static_cast<const CompoundStmt&>(stmt).body;
    default: return nullptr;
  }
}

void walkBody(const StmtList& body, VisitorBase& visitor) {
  for (const auto& stmt : body) {
    if (!stmt) { continue; }
    stmt->accept(visitor);
    if (const StmtList* inner = nestedBody(*stmt)) { walkBody(*inner, visitor); }
  }
}
} // namespace

void walkStatements(const Module& module, VisitorBase& visitor) { walkBody(module.body, visitor); }

} // namespace pyjudge::ast
