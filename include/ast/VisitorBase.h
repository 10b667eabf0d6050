/***
 * Name: pyjudge::ast::VisitorBase
 * Purpose: Statement visitor; overloads default to no-ops so a visitor only
 *   spells out the statements it inspects.
 */
#pragma once

namespace pyjudge::ast {

struct FunctionDef;
struct ClassDef;
struct CompoundStmt;
struct SimpleStmt;
struct Import;
struct ImportFrom;

struct VisitorBase {
  virtual ~VisitorBase() = default;
  virtual void visit(const FunctionDef&) {}
  virtual void visit(const ClassDef&) {}
  virtual void visit(const CompoundStmt&) {}
  virtual void visit(const SimpleStmt&) {}
  virtual void visit(const Import&) {}
  virtual void visit(const ImportFrom&) {}
};

} // namespace pyjudge::ast
