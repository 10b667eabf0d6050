/***
 * Name: pyjudge::driver::ShowChallenge
 * Purpose: Print one challenge for a learner.
 * Theory of Operation: Sections with no catalog content are left out; the
 *   template is printed verbatim so it can be copied into a solution file.
 */
#include "driver/app.h"

#include <ostream>

namespace pyjudge::driver {

auto ShowChallenge(std::ostream& out, const challenge::Challenge& ch) -> void {
  out << ch.id << ": " << ch.title << '\n';
  out << "Difficulty: " << ch.difficulty;
  if (!ch.module.empty()) { out << "  Module: " << ch.module; }
  if (!ch.topic.empty()) { out << "  Concept: " << ch.topic; }
  out << "  Tests: " << ch.testCases.size() << '\n';
  if (!ch.description.empty()) { out << '\n' << ch.description << '\n'; }
  if (!ch.templateSource.empty()) {
    out << "\nTemplate:\n" << ch.templateSource;
    if (ch.templateSource.back() != '\n') { out << '\n'; }
  }
  if (!ch.hints.empty()) {
    out << "\nHints:\n";
    for (const auto& hint : ch.hints) { out << "  - " << hint << '\n'; }
  }
}

}  // namespace pyjudge::driver
