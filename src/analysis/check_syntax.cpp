/***
 * Name: pyjudge::analysis::CheckSyntax
 * Purpose: Validate that a submission parses; produce line diagnostics.
 */
#include "analysis/Analysis.h"

#include <string>
#include <utility>
#include <vector>

#include "lexer/Lexer.h"
#include "parser/Parser.h"
#include "pyjudge/exceptions/parse_error.h"

namespace pyjudge::analysis {

SyntaxReport CheckSyntax(const std::string& source, const std::string& name) {
  SyntaxReport report;
  try {
    lex::Lexer lexer;
    lexer.pushString(source, name);
    parse::Parser parser(lexer);
    (void)parser.parseModule();
  } catch (const exceptions::ParseError& ex) {
    report.ok = false;
    Diagnostic diag;
    diag.message = ex.detail();
    diag.file = name;
    diag.line = ex.line();
    diag.col = ex.col();
    report.diagnostics.push_back(std::move(diag));
  }
  return report;
}

std::vector<std::string> SyntaxReport::feedback() const {
  std::vector<std::string> out;
  out.reserve(diagnostics.size());
  for (const auto& diag : diagnostics) {
    out.push_back("Syntax Error on line " + std::to_string(diag.line) + ": " + diag.message);
  }
  return out;
}

} // namespace pyjudge::analysis
