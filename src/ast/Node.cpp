/***
 * Name: pyjudge::ast::Stmt::accept, to_string(NodeKind)
 * Purpose: Statement dispatch and node kind names.
 */
#include "ast/Node.h"
#include "ast/Statements.h"
#include "ast/VisitorBase.h"

namespace pyjudge::ast {

void Stmt::accept(VisitorBase& visitor) const {
  switch (kind) {
    case NodeKind::FunctionDef: visitor.visit(static_cast<const FunctionDef&>(*this)); break;
    case NodeKind::ClassDef: visitor.visit(static_cast<const ClassDef&>(*this)); break;
    case NodeKind::CompoundStmt: visitor.visit(static_cast<const CompoundStmt&>(*this)); break;
    case NodeKind::SimpleStmt: visitor.visit(static_cast<const SimpleStmt&>(*this)); break;
    case NodeKind::Import: visitor.visit(static_cast<const Import&>(*this)); break;
    case NodeKind::ImportFrom: visitor.visit(static_cast<const ImportFrom&>(*this)); break;
    default: break;
  }
}

const char* to_string(const NodeKind kind) {
  switch (kind) {
    case NodeKind::Module: return "Module";
    case NodeKind::FunctionDef: return "FunctionDef";
    case NodeKind::ClassDef: return "ClassDef";
    case NodeKind::CompoundStmt: return "CompoundStmt";
    case NodeKind::SimpleStmt: return "SimpleStmt";
    case NodeKind::Import: return "Import";
    case NodeKind::ImportFrom: return "ImportFrom";
    case NodeKind::Name: return "Name";
    case NodeKind::Attribute: return "Attribute";
    case NodeKind::Call: return "Call";
    case NodeKind::Signed: return "UnaryOp";
    case NodeKind::IntLiteral:
    case NodeKind::FloatLiteral:
    case NodeKind::StringLiteral:
    case NodeKind::BytesLiteral:
    case NodeKind::BoolLiteral:
    case NodeKind::NoneLiteral: return "Constant";
    case NodeKind::TupleLiteral: return "Tuple";
    case NodeKind::ListLiteral: return "List";
    case NodeKind::SetLiteral: return "Set";
    case NodeKind::DictLiteral: return "Dict";
  }
  return "Node";
}

} // namespace pyjudge::ast
