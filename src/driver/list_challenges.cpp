/***
 * Name: pyjudge::driver::ListChallenges
 * Purpose: Print the catalog one challenge per line.
 */
#include "driver/app.h"

#include <ostream>

namespace pyjudge::driver {

auto ListChallenges(std::ostream& out, const challenge::Catalog& catalog) -> void {
  for (const auto& ch : catalog.challenges()) {
    out << ch.id << "  [" << ch.difficulty << "] " << ch.title;
    if (!ch.module.empty() || !ch.topic.empty()) { out << " (" << ch.module << "/" << ch.topic << ")"; }
    out << "  " << ch.testCases.size() << (ch.testCases.size() == 1 ? " test" : " tests") << '\n';
  }
}

}  // namespace pyjudge::driver
