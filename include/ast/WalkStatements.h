/***
 * Name: pyjudge::ast::walkStatements
 * Purpose: Visit every statement of a module in source order, descending into
 *   function, class and compound statement bodies.
 */
#pragma once

#include "ast/Statements.h"
#include "ast/VisitorBase.h"

namespace pyjudge::ast {

void walkStatements(const Module& module, VisitorBase& visitor);

} // namespace pyjudge::ast
