/***
 * Name: pyjudge::screen::Screener (impl)
 * Purpose: Import deny-list walk and folded token scan.
 */
#include "screen/Screener.h"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ast/Nodes.h"
#include "ast/VisitorBase.h"
#include "ast/WalkStatements.h"
#include "lexer/Lexer.h"
#include "parser/Parser.h"
#include "pyjudge/exceptions/parse_error.h"

namespace pyjudge::screen {

namespace {
// Collects every module name an import statement references, in source order.
class ImportCollector : public ast::VisitorBase {
 public:
  void visit(const ast::Import& imp) override {
    for (const auto& alias : imp.names) { names_.push_back(alias.name); }
  }
  void visit(const ast::ImportFrom& imp) override {
    // Relative imports name the candidate's own package, never a stdlib module
    if (imp.level > 0 || imp.module.empty()) { return; }
    names_.push_back(imp.module);
    for (const auto& alias : imp.names) { names_.push_back(imp.module + "." + alias.name); }
  }
  const std::vector<std::string>& names() const { return names_; }

 private:
  std::vector<std::string> names_;
};

using TK = lex::TokenKind;

// Reads "a.b.c" starting at pos; pos ends on the first token after it.
std::string dottedName(const std::vector<lex::Token>& toks, size_t& pos) {
  std::string name;
  while (pos < toks.size() && toks[pos].kind == TK::Ident) {
    name += toks[pos++].text;
    if (pos + 1 >= toks.size() || toks[pos].kind != TK::Dot || toks[pos + 1].kind != TK::Ident) { break; }
    name += '.';
    ++pos;
  }
  return name;
}

// "name [as alias], ..." after an import keyword; prefix qualifies from-import members.
void importedNames(const std::vector<lex::Token>& toks, size_t pos, const std::string& prefix,
                   std::vector<std::string>& out) {
  if (pos < toks.size() && toks[pos].kind == TK::LParen) { ++pos; }
  while (pos < toks.size()) {
    const std::string name = dottedName(toks, pos);
    if (name.empty()) { return; }
    out.push_back(prefix + name);
    if (pos + 1 < toks.size() && toks[pos].kind == TK::As) { pos += 2; }
    if (pos >= toks.size() || toks[pos].kind != TK::Comma) { return; }
    ++pos;
  }
}

// Import statements read straight off the token stream, for source the
// structural parser rejects.
std::vector<std::string> importsFromTokens(const std::vector<lex::Token>& toks) {
  std::vector<std::string> names;
  for (size_t idx = 0; idx < toks.size(); ++idx) {
    if (toks[idx].kind == TK::Import) {
      importedNames(toks, idx + 1, "", names);
    } else if (toks[idx].kind == TK::From) {
      size_t pos = idx + 1;
      bool relative = false;
      while (pos < toks.size() && (toks[pos].kind == TK::Dot || toks[pos].kind == TK::Ellipsis)) {
        relative = true;
        ++pos;
      }
      const std::string module = dottedName(toks, pos);
      // "raise E from err" and "yield from xs" are not imports
      if (pos >= toks.size() || toks[pos].kind != TK::Import) { continue; }
      idx = pos; // the names after this import keyword belong to the from-import
      if (relative || module.empty()) { continue; }
      names.push_back(module);
      importedNames(toks, pos + 1, module + ".", names);
    }
  }
  return names;
}

// Every module name the source imports, in source order; nullopt when the
// source does not even lex.
std::optional<std::vector<std::string>> collectImports(const std::string& source) {
  try {
    lex::Lexer lexer;
    lexer.pushString(source, "<submission>");
    parse::Parser parser(lexer);
    const auto module = parser.parseModule();
    ImportCollector collector;
    ast::walkStatements(*module, collector);
    return collector.names();
  } catch (const exceptions::ParseError&) {
    // fall through to the token scan
  }
  try {
    lex::Lexer lexer;
    lexer.pushString(source, "<submission>");
    return importsFromTokens(lexer.tokens());
  } catch (const exceptions::ParseError&) {
    // Unlexable source is left to the syntax check
    return std::nullopt;
  }
}
} // namespace

Screener::Screener() : Screener(DenyList::defaults()) {}

Screener::Screener(DenyList denyList) : deny_(std::move(denyList)) {
  foldedTokens_.reserve(deny_.tokens.size());
  for (const auto& token : deny_.tokens) { foldedTokens_.push_back(CaseFold(token)); }
}

bool Screener::moduleMatches(const std::string& entry, const std::string& dotted) {
  if (entry.empty() || dotted.size() < entry.size()) { return false; }
  if (dotted.compare(0, entry.size(), entry) != 0) { return false; }
  return dotted.size() == entry.size() || dotted[entry.size()] == '.';
}

std::optional<std::string> Screener::firstDeniedImport(const std::string& source) const {
  const auto names = collectImports(source);
  if (!names) { return std::nullopt; }
  for (const auto& name : *names) {
    for (const auto& entry : deny_.modules) {
      if (moduleMatches(entry, name)) { return name; }
    }
  }
  return std::nullopt;
}

std::optional<std::string> Screener::firstDeniedToken(const std::string& source) const {
  const std::string folded = CaseFold(source);
  for (size_t i = 0; i < foldedTokens_.size(); ++i) {
    if (!foldedTokens_[i].empty() && folded.find(foldedTokens_[i]) != std::string::npos) {
      return deny_.tokens[i];
    }
  }
  return std::nullopt;
}

SafetyVerdict Screener::screen(const std::string& source) const {
  if (const auto name = firstDeniedImport(source)) {
    return SafetyVerdict::reject("import of '" + *name + "' is not allowed");
  }
  if (const auto token = firstDeniedToken(source)) {
    return SafetyVerdict::reject("use of '" + *token + "' is not allowed");
  }
  return SafetyVerdict::allow();
}

} // namespace pyjudge::screen
