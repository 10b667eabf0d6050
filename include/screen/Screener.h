/***
 * Name: pyjudge::screen::Screener
 * Purpose: Static pre-screen of submitted source before anything executes.
 * Inputs:
 *   - source: candidate Python source text
 * Outputs:
 *   - SafetyVerdict (allowed, or rejected with a human-readable reason)
 * Theory of Operation:
 *   1) Parse with the shared front end and walk every import statement at
 *      any nesting depth, in source order; the first module matching the
 *      deny-list produces "import of '<name>' is not allowed". Source the
 *      statement parser rejects is scanned token by token for import
 *      statements instead; source that does not lex skips this check
 *      (downstream syntax diagnostics report it).
 *   2) Case-fold the raw text (ICU full case folding) and scan for each
 *      deny-listed token; a hit produces "use of '<token>' is not allowed".
 *   The import reason wins when both checks fire. Pure; no side effects.
 */
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "screen/DenyList.h"
#include "screen/SafetyVerdict.h"

namespace pyjudge::screen {

class Screener {
 public:
  Screener();
  explicit Screener(DenyList denyList);

  SafetyVerdict screen(const std::string& source) const;

  std::optional<std::string> firstDeniedImport(const std::string& source) const;
  std::optional<std::string> firstDeniedToken(const std::string& source) const;

  // True when entry equals dotted or is one of its dotted prefixes.
  static bool moduleMatches(const std::string& entry, const std::string& dotted);

  const DenyList& denyList() const { return deny_; }

 private:
  DenyList deny_;
  std::vector<std::string> foldedTokens_; // deny_.tokens, case-folded once
};

/*** CaseFold: Unicode full case folding of UTF-8 text (ICU); invalid bytes become U+FFFD. */
std::string CaseFold(const std::string& text);

} // namespace pyjudge::screen
