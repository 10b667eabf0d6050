/***
 * Name: pyjudge::driver::ColorEnabled
 * Purpose: Resolve --color against the terminal and the environment.
 * Theory of Operation: auto means a TTY on stderr, or PYJUDGE_COLOR set to
 *   1/true/yes (any case). A non-empty NO_COLOR turns auto off either way.
 */
#include "driver/app.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

#include <unistd.h>

namespace pyjudge::driver {

namespace {
bool envNonEmpty(const char* name) {
  const char* value = std::getenv(name);
  return value != nullptr && *value != '\0';
}

bool envTruthy(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr) { return false; }
  std::string word(value);
  std::transform(word.begin(), word.end(), word.begin(),
                 [](unsigned char chr) { return static_cast<char>(std::tolower(chr)); });
  return word == "1" || word == "true" || word == "yes";
}
} // namespace

auto ColorEnabled(const cli::Options& opts) -> bool {
  switch (opts.color) {
    case cli::ColorMode::Always: return true;
    case cli::ColorMode::Never: return false;
    case cli::ColorMode::Auto: break;
  }
  if (envNonEmpty("NO_COLOR")) { return false; }
  constexpr int kStderrFd = 2;
  return isatty(kStderrFd) != 0 || envTruthy("PYJUDGE_COLOR");
}

}  // namespace pyjudge::driver
