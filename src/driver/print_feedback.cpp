/***
 * Name: pyjudge::driver::PrintFeedback
 * Purpose: Render report lines for a terminal.
 * Theory of Operation: "Test i: Passed" green, other "Test i:" lines red,
 *   the "All N ... passed!" summary bold green; everything else plain.
 */
#include "driver/app.h"

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace pyjudge::driver {

namespace {
constexpr std::string_view kGreen = "\033[32m";
constexpr std::string_view kRed = "\033[31m";
constexpr std::string_view kBoldGreen = "\033[1;32m";
constexpr std::string_view kReset = "\033[0m";

std::string_view colorFor(std::string_view line) {
  if (line.rfind("Test ", 0) == 0) {
    const auto colon = line.find(": ");
    if (colon != std::string_view::npos && line.substr(colon + 2) == "Passed") { return kGreen; }
    return kRed;
  }
  if (line.rfind("All ", 0) == 0) { return kBoldGreen; }
  return {};
}
}  // namespace

auto PrintFeedback(std::ostream& out, const std::vector<std::string>& lines, bool color) -> void {
  for (const auto& line : lines) {
    const std::string_view tint = color ? colorFor(line) : std::string_view{};
    if (tint.empty()) {
      out << line << '\n';
    } else {
      out << tint << line << kReset << '\n';
    }
  }
}

}  // namespace pyjudge::driver
